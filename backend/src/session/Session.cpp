#include "Session.hpp"
#include "../core/Errors.hpp"
#include <algorithm>

const char* sessionModeName(SessionMode mode) {
    switch (mode) {
    case SessionMode::IDLE: return "idle";
    case SessionMode::REVIEWING: return "reviewing";
    case SessionMode::EDITING: return "editing";
    }
    return "unknown";
}

SessionMode sessionModeFromName(const std::string& name) {
    if (name == "idle") return SessionMode::IDLE;
    if (name == "reviewing") return SessionMode::REVIEWING;
    if (name == "editing") return SessionMode::EDITING;
    throw InvalidArgument("unknown session mode '" + name + "'");
}

void SessionStats::record(Grade grade) {
    switch (grade) {
    case Grade::AGAIN: again++; break;
    case Grade::HARD: hard++; break;
    case Grade::GOOD: good++; break;
    case Grade::EASY: easy++; break;
    }
}

bool Session::hasSubmission(const std::string& token) const {
    return std::find(recent_submissions.begin(), recent_submissions.end(), token)
        != recent_submissions.end();
}

void Session::rememberSubmission(const std::string& token, size_t limit) {
    if (limit == 0) return;
    recent_submissions.push_back(token);
    while (recent_submissions.size() > limit) {
        recent_submissions.pop_front();
    }
}
