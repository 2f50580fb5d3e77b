#pragma once
#include <string>
#include <vector>
#include <deque>
#include <ctime>
#include <optional>
#include "../core/Grade.hpp"
#include "../core/Flashcard.hpp"

enum class SessionMode {
    IDLE = 0,
    REVIEWING = 1,
    EDITING = 2
};

const char* sessionModeName(SessionMode mode);
SessionMode sessionModeFromName(const std::string& name);

struct SessionStats {
    int again = 0;
    int hard = 0;
    int good = 0;
    int easy = 0;

    void record(Grade grade);
    int total() const { return again + hard + good + easy; }
};

// One live interaction per owner. Persisted by the store, keyed by owner_id.
struct Session {
    std::string owner_id;
    SessionMode mode = SessionMode::IDLE;
    SessionMode prior_mode = SessionMode::IDLE;   // restored by finishEdit
    std::optional<std::string> active_card_id;    // card being reviewed
    std::optional<std::string> editing_card_id;   // card under edit
    std::deque<std::string> queue;                // remaining snapshot, front is next
    std::time_t started_at = 0;
    SessionStats stats;
    std::deque<std::string> recent_submissions;   // newest at the back

    bool hasSubmission(const std::string& token) const;
    void rememberSubmission(const std::string& token, size_t limit);
};

struct SessionSummary {
    std::string owner_id;
    std::time_t started_at = 0;
    std::time_t finished_at = 0;
    SessionStats stats;
    int reviewed = 0;
};

// Result of startReview / reportOutcome. At most one of the two is set:
// a card to present next, or the summary of a finished session. Both empty
// means nothing was due.
struct ReviewStep {
    std::optional<Flashcard> card;
    std::optional<SessionSummary> summary;
};
