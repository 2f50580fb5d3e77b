#pragma once
#include <string>
#include <ctime>
#include "Session.hpp"
#include "../core/Scheduler.hpp"
#include "../config/Config.hpp"
#include "../storage/SessionStore.hpp"

/*
  Per-owner learning session state machine.

    Idle --startReview--> Reviewing --reportOutcome (queue empty)--> Idle
    Idle | Reviewing --startEdit--> Editing --finishEdit--> prior mode
    any --cancel--> Idle

  The engine keeps nothing between calls: each operation loads the session
  from the store, transitions it, and writes it back. It is not internally
  synchronised; the caller must serialise operations for one owner.
  Operations for different owners are independent.

  Errors: InvalidState, NotFound, InvalidArgument and StoreUnavailable (see
  Errors.hpp). A failed operation leaves the stored state untouched.
*/
class SessionEngine {
public:
    SessionEngine(SessionStore& store, const Scheduler& scheduler,
                  const SessionConfig& cfg = SessionConfig());

    // Snapshots the owner's due cards into a queue and presents the first.
    // Calling it again while Reviewing returns the same active card.
    ReviewStep startReview(const std::string& owner, std::time_t now);

    // Grades the active card and advances. `token` identifies the client
    // submission; a token seen recently in this session is rejected.
    ReviewStep reportOutcome(const std::string& owner, const std::string& cardId,
                             Grade grade, std::time_t now,
                             const std::string& token = "");

    void startEdit(const std::string& owner, const std::string& cardId);
    void finishEdit(const std::string& owner);
    // Stores the edited card and finishes the edit. The edit is finished
    // even when the card write fails, so the owner is never left Editing;
    // the write error is rethrown.
    void saveEdit(const std::string& owner, const Flashcard& edited);
    void cancel(const std::string& owner);

    // Read-only; an owner without a stored session is reported Idle.
    Session getSessionState(const std::string& owner);

private:
    SessionStore& store;
    const Scheduler& scheduler;
    SessionConfig cfg;

    Flashcard loadOwnedCard(const std::string& owner, const std::string& cardId);
    static void requireId(const std::string& value, const char* what);
};
