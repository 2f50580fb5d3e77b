#pragma once
#include <stdexcept>
#include <string>

/*
  Error taxonomy shared by the scheduler, the session engine and the stores.

  InvalidState     - transition from the wrong mode, or a stale/duplicate card
                     id or submission token. Callers normally ignore it.
  NotFound         - unknown owner or card.
  StoreUnavailable - persistence failed; the whole operation may be retried.
  InvalidArgument  - malformed input that should have been rejected upstream.
*/

class InvalidState : public std::runtime_error {
public:
    explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {}
};

class NotFound : public std::runtime_error {
public:
    explicit NotFound(const std::string& msg) : std::runtime_error(msg) {}
};

class StoreUnavailable : public std::runtime_error {
public:
    explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {}
};

class InvalidArgument : public std::runtime_error {
public:
    explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {}
};
