#include "SessionEngine.hpp"
#include "../core/Errors.hpp"
#include <unordered_map>
#include <spdlog/spdlog.h>

SessionEngine::SessionEngine(SessionStore& st, const Scheduler& sch, const SessionConfig& c)
    : store(st), scheduler(sch), cfg(c)
{
    spdlog::info("SessionEngine initialized: max_cards={} submission_history={}",
        cfg.max_cards, cfg.submission_history);
}

void SessionEngine::requireId(const std::string& value, const char* what) {
    if (value.empty()) {
        throw InvalidArgument(std::string(what) + " must not be empty");
    }
}

Flashcard SessionEngine::loadOwnedCard(const std::string& owner, const std::string& cardId) {
    auto card = store.loadCard(cardId);
    if (!card || card->owner_id != owner) {
        throw NotFound("card '" + cardId + "' not found for owner '" + owner + "'");
    }
    return *card;
}

ReviewStep SessionEngine::startReview(const std::string& owner, std::time_t now) {
    requireId(owner, "owner");

    auto existing = store.loadSession(owner);
    if (existing && existing->mode == SessionMode::REVIEWING && existing->active_card_id) {
        spdlog::info("startReview owner={}: session already running, active card {}",
            owner, *existing->active_card_id);
        ReviewStep step;
        step.card = loadOwnedCard(owner, *existing->active_card_id);
        return step;
    }
    if (existing && existing->mode == SessionMode::EDITING) {
        spdlog::warn("startReview owner={} rejected: session is editing", owner);
        throw InvalidState("cannot start a review while editing");
    }

    std::vector<Flashcard> candidates;
    for (auto& card : store.queryDue(owner, now)) {
        if (card.owner_id == owner) candidates.push_back(std::move(card));
    }

    std::vector<std::string> ids = scheduler.nextDue(candidates, now);
    if (cfg.max_cards > 0 && ids.size() > static_cast<size_t>(cfg.max_cards)) {
        ids.resize(static_cast<size_t>(cfg.max_cards));
    }

    if (ids.empty()) {
        spdlog::info("startReview owner={}: nothing due", owner);
        return ReviewStep{};
    }

    std::unordered_map<std::string, const Flashcard*> byId;
    for (const auto& card : candidates) byId[card.id] = &card;

    Session session;
    session.owner_id = owner;
    session.mode = SessionMode::REVIEWING;
    session.started_at = now;
    session.queue.assign(ids.begin() + 1, ids.end());
    session.active_card_id = ids.front();

    store.saveSession(session);

    spdlog::info("Started review for owner {} with {} cards, first={}", owner, ids.size(), ids.front());

    ReviewStep step;
    step.card = *byId.at(ids.front());
    return step;
}

ReviewStep SessionEngine::reportOutcome(const std::string& owner, const std::string& cardId,
                                        Grade grade, std::time_t now, const std::string& token) {
    requireId(owner, "owner");
    requireId(cardId, "card id");

    auto loaded = store.loadSession(owner);
    if (!loaded || loaded->mode != SessionMode::REVIEWING) {
        spdlog::warn("reportOutcome owner={} card={} rejected: no review in progress", owner, cardId);
        throw InvalidState("no review in progress for owner '" + owner + "'");
    }
    if (!loaded->active_card_id || *loaded->active_card_id != cardId) {
        spdlog::warn("reportOutcome owner={} card={} rejected: active card is {}",
            owner, cardId, loaded->active_card_id.value_or("<none>"));
        throw InvalidState("card '" + cardId + "' is not the active card");
    }
    if (!token.empty() && loaded->hasSubmission(token)) {
        spdlog::warn("reportOutcome owner={} card={} rejected: duplicate submission {}", owner, cardId, token);
        throw InvalidState("duplicate submission '" + token + "'");
    }

    Flashcard card = loadOwnedCard(owner, cardId);
    Flashcard updated = scheduler.applyOutcome(card, grade, now);

    Session session = *loaded;
    session.stats.record(grade);
    if (!token.empty()) {
        session.rememberSubmission(token, static_cast<size_t>(cfg.submission_history));
    }
    session.active_card_id.reset();

    ReviewStep step;

    // Cards deleted since the snapshot was taken are skipped.
    while (!session.queue.empty() && !step.card) {
        std::string nextId = session.queue.front();
        session.queue.pop_front();

        auto next = store.loadCard(nextId);
        if (!next || next->owner_id != owner) {
            spdlog::warn("Skipping queued card {} for owner {}: no longer in store", nextId, owner);
            continue;
        }
        session.active_card_id = nextId;
        step.card = *next;
    }

    if (!step.card) {
        session.mode = SessionMode::IDLE;

        SessionSummary summary;
        summary.owner_id = owner;
        summary.started_at = session.started_at;
        summary.finished_at = now;
        summary.stats = session.stats;
        summary.reviewed = session.stats.total();
        step.summary = summary;
    }

    store.commitReview(updated, session);

    if (step.summary) {
        spdlog::info("Review finished for owner {}: reviewed={} again={} hard={} good={} easy={}",
            owner, step.summary->reviewed, session.stats.again, session.stats.hard,
            session.stats.good, session.stats.easy);
    }
    else {
        spdlog::info("Owner {} graded {} as {}; next card {} ({} left)",
            owner, cardId, gradeName(grade), step.card->id, session.queue.size());
    }
    return step;
}

void SessionEngine::startEdit(const std::string& owner, const std::string& cardId) {
    requireId(owner, "owner");
    requireId(cardId, "card id");

    Session session = store.loadSession(owner).value_or(Session{});
    session.owner_id = owner;

    if (session.mode == SessionMode::EDITING) {
        spdlog::warn("startEdit owner={} card={} rejected: already editing {}",
            owner, cardId, session.editing_card_id.value_or("<none>"));
        throw InvalidState("already editing a card");
    }

    loadOwnedCard(owner, cardId);

    session.prior_mode = session.mode;
    session.mode = SessionMode::EDITING;
    session.editing_card_id = cardId;

    store.saveSession(session);
    spdlog::info("Owner {} editing card {} (will return to {})",
        owner, cardId, sessionModeName(session.prior_mode));
}

void SessionEngine::finishEdit(const std::string& owner) {
    requireId(owner, "owner");

    auto loaded = store.loadSession(owner);
    if (!loaded || loaded->mode != SessionMode::EDITING) {
        spdlog::warn("finishEdit owner={} rejected: not editing", owner);
        throw InvalidState("no edit in progress for owner '" + owner + "'");
    }

    Session session = *loaded;
    session.mode = session.prior_mode;
    session.prior_mode = SessionMode::IDLE;
    session.editing_card_id.reset();

    if (session.mode == SessionMode::IDLE) {
        store.deleteSession(owner);
    }
    else {
        store.saveSession(session);
    }
    spdlog::info("Owner {} finished editing, back to {}", owner, sessionModeName(session.mode));
}

void SessionEngine::saveEdit(const std::string& owner, const Flashcard& edited) {
    requireId(owner, "owner");
    requireId(edited.id, "card id");

    auto loaded = store.loadSession(owner);
    if (!loaded || loaded->mode != SessionMode::EDITING || loaded->editing_card_id != edited.id) {
        spdlog::warn("saveEdit owner={} card={} rejected: card is not being edited", owner, edited.id);
        throw InvalidState("card '" + edited.id + "' is not being edited");
    }
    if (edited.owner_id != owner) {
        throw InvalidArgument("edited card must keep its owner");
    }

    try {
        store.saveCard(edited);
    }
    catch (const StoreUnavailable& e) {
        spdlog::error("saveEdit owner={} card={}: {}; leaving edit", owner, edited.id, e.what());
        finishEdit(owner);
        throw;
    }
    finishEdit(owner);
}

void SessionEngine::cancel(const std::string& owner) {
    requireId(owner, "owner");

    auto loaded = store.loadSession(owner);
    if (!loaded) {
        spdlog::debug("cancel owner={}: no live session", owner);
        return;
    }

    store.deleteSession(owner);
    spdlog::info("Cancelled {} session for owner {} ({} graded, {} left in queue)",
        sessionModeName(loaded->mode), owner, loaded->stats.total(), loaded->queue.size());
}

Session SessionEngine::getSessionState(const std::string& owner) {
    requireId(owner, "owner");

    auto loaded = store.loadSession(owner);
    if (loaded) return *loaded;

    Session idle;
    idle.owner_id = owner;
    return idle;
}
