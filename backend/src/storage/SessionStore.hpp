#pragma once
#include <optional>
#include <string>
#include <vector>
#include <ctime>
#include "../core/Flashcard.hpp"
#include "../session/Session.hpp"

/*
  Persistence seam for the session engine.

  The store exclusively owns Session and Flashcard documents; the engine
  only ever holds copies for the duration of one call. Every operation may
  throw StoreUnavailable. Lookups report a missing document as nullopt.

  Implementations must serialise their own access; the engine relies on the
  caller to serialise calls for a single owner only.
*/
class SessionStore {
public:
    virtual ~SessionStore() = default;

    virtual std::optional<Session> loadSession(const std::string& owner) = 0;
    // Full overwrite, last writer wins.
    virtual void saveSession(const Session& session) = 0;
    virtual void deleteSession(const std::string& owner) = 0;

    virtual std::optional<Flashcard> loadCard(const std::string& id) = 0;
    virtual void saveCard(const Flashcard& card) = 0;
    // Returns false when no card has that id. Sessions naming the card are
    // left alone; the engine skips or reports cards that no longer load.
    virtual bool deleteCard(const std::string& id) = 0;

    // May return a superset of the due cards; the scheduler filters precisely.
    virtual std::vector<Flashcard> queryDue(const std::string& owner, std::time_t now) = 0;
    virtual std::vector<Flashcard> listCards(const std::string& owner) = 0;

    // Persist a reviewed card and the advanced session as one unit: both
    // writes happen or neither does. A session whose mode is IDLE is
    // deleted instead of saved.
    virtual void commitReview(const Flashcard& card, const Session& session) = 0;
};
