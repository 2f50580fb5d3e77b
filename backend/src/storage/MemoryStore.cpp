#include "MemoryStore.hpp"
#include "../core/Errors.hpp"
#include <spdlog/spdlog.h>

template <typename Fn>
void MemoryStore::mutate(Fn&& fn) {
    std::lock_guard<std::mutex> lock(mtx);
    State before = state;
    fn(state);
    try {
        persist(state);
    }
    catch (const StoreUnavailable&) {
        state = std::move(before);
        throw;
    }
}

void MemoryStore::persist(const State&) {}

std::optional<Session> MemoryStore::loadSession(const std::string& owner) {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = state.sessions.find(owner);
    if (it == state.sessions.end()) return std::nullopt;
    return it->second;
}

void MemoryStore::saveSession(const Session& session) {
    mutate([&](State& s) { s.sessions[session.owner_id] = session; });
    spdlog::debug("Saved session owner={} mode={}", session.owner_id, sessionModeName(session.mode));
}

void MemoryStore::deleteSession(const std::string& owner) {
    mutate([&](State& s) { s.sessions.erase(owner); });
    spdlog::debug("Deleted session owner={}", owner);
}

std::optional<Flashcard> MemoryStore::loadCard(const std::string& id) {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = state.cards.find(id);
    if (it == state.cards.end()) return std::nullopt;
    return it->second;
}

void MemoryStore::saveCard(const Flashcard& card) {
    if (card.id.empty()) {
        throw InvalidArgument("cannot save a flashcard without an id");
    }
    mutate([&](State& s) { s.cards[card.id] = card; });
    spdlog::debug("Saved card id={} owner={}", card.id, card.owner_id);
}

bool MemoryStore::deleteCard(const std::string& id) {
    if (id.empty()) {
        throw InvalidArgument("card id must not be empty");
    }
    bool removed = false;
    mutate([&](State& s) { removed = s.cards.erase(id) > 0; });
    if (removed) spdlog::debug("Deleted card id={}", id);
    else spdlog::warn("deleteCard: no card with id={}", id);
    return removed;
}

std::vector<Flashcard> MemoryStore::queryDue(const std::string& owner, std::time_t now) {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<Flashcard> due;
    for (const auto& p : state.cards) {
        if (p.second.owner_id == owner && p.second.isDue(now)) {
            due.push_back(p.second);
        }
    }
    return due;
}

std::vector<Flashcard> MemoryStore::listCards(const std::string& owner) {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<Flashcard> out;
    for (const auto& p : state.cards) {
        if (p.second.owner_id == owner) out.push_back(p.second);
    }
    return out;
}

void MemoryStore::commitReview(const Flashcard& card, const Session& session) {
    if (card.id.empty()) {
        throw InvalidArgument("cannot commit a flashcard without an id");
    }
    mutate([&](State& s) {
        s.cards[card.id] = card;
        if (session.mode == SessionMode::IDLE) {
            s.sessions.erase(session.owner_id);
        }
        else {
            s.sessions[session.owner_id] = session;
        }
    });
    spdlog::debug("Committed review card={} owner={} mode={}",
        card.id, session.owner_id, sessionModeName(session.mode));
}

size_t MemoryStore::cardCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return state.cards.size();
}

size_t MemoryStore::sessionCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return state.sessions.size();
}
