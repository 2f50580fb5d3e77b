#include "Scheduler.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

static constexpr std::time_t SECONDS_PER_DAY = 24 * 60 * 60;

Scheduler::Scheduler(const SchedulerConfig& c)
    : cfg(c)
{
    spdlog::info("Scheduler (SM-2) initialized: default_ease={:.2f} min_ease={:.2f} relearn={}s",
        cfg.default_ease, cfg.min_ease, cfg.relearn_interval_seconds);
}

/*
  Due selection:
    keep cards whose due_at <= now, then sort by
      1. earliest due_at (most overdue first),
      2. ascending id, so equal timestamps come out in a stable order.
*/
std::vector<std::string> Scheduler::nextDue(const std::vector<Flashcard>& cards, std::time_t now) const {
    std::vector<const Flashcard*> due;
    due.reserve(cards.size());

    for (const auto& card : cards) {
        if (card.isDue(now)) {
            due.push_back(&card);
        }
    }

    std::sort(due.begin(), due.end(),
        [](const Flashcard* a, const Flashcard* b) {
            if (a->due_at != b->due_at) return a->due_at < b->due_at;
            return a->id < b->id;
        });

    std::vector<std::string> ids;
    ids.reserve(due.size());
    for (const auto* card : due) {
        ids.push_back(card->id);
    }

    spdlog::debug("nextDue: {} of {} cards due at {}", ids.size(), cards.size(), now);
    return ids;
}

Flashcard Scheduler::applyOutcome(const Flashcard& card, Grade grade, std::time_t now) const {
    Flashcard next = card;

    switch (grade) {
    case Grade::AGAIN:
        handleLapse(next, now);
        break;

    case Grade::HARD:
        next.repetitions += 1;
        next.ease_factor = std::max(cfg.min_ease, card.ease_factor - cfg.hard_ease_penalty);
        next.interval_days = clampInterval(card.interval_days * cfg.hard_interval_multiplier);
        next.due_at = now + static_cast<std::time_t>(next.interval_days) * SECONDS_PER_DAY;
        break;

    case Grade::GOOD:
        next.repetitions += 1;
        if (next.repetitions == 1) {
            next.interval_days = 1;
        }
        else {
            next.interval_days = clampInterval(card.interval_days * card.ease_factor);
        }
        next.due_at = now + static_cast<std::time_t>(next.interval_days) * SECONDS_PER_DAY;
        break;

    case Grade::EASY:
        next.repetitions += 1;
        next.ease_factor = card.ease_factor + cfg.easy_ease_bonus;
        next.interval_days = clampInterval(
            std::max(1, card.interval_days) * next.ease_factor * cfg.easy_interval_multiplier);
        next.due_at = now + static_cast<std::time_t>(next.interval_days) * SECONDS_PER_DAY;
        break;
    }

    // Stored cards from an older configuration may sit below the current floor.
    next.ease_factor = std::max(cfg.min_ease, next.ease_factor);
    next.last_reviewed_at = now;

    spdlog::debug("applyOutcome: card={} grade={} reps={} ease={:.2f} interval={}d due_at={}",
        next.id, gradeName(grade), next.repetitions, next.ease_factor, next.interval_days, next.due_at);
    return next;
}

/*
  Successful reviews always move the card at least one day out and never
  beyond max_interval_days. Rounding is half away from zero, so 6 * 2.5
  gives 15 and 1 * 2.5 gives 3.
*/
int Scheduler::clampInterval(double days) const {
    double capped = std::min(days, static_cast<double>(cfg.max_interval_days));
    long rounded = std::lround(capped);
    return static_cast<int>(std::max(1L, rounded));
}

/*
  A lapse resets the success streak and the interval but keeps the card's
  history: lapses only ever grows and ease drops by a fixed penalty down to
  the floor. The card comes back after the relearn interval (same session
  time by default).
*/
void Scheduler::handleLapse(Flashcard& card, std::time_t now) const {
    card.repetitions = 0;
    card.lapses += 1;
    card.ease_factor = std::max(cfg.min_ease, card.ease_factor - cfg.again_ease_penalty);
    card.interval_days = 0;
    card.due_at = now + static_cast<std::time_t>(cfg.relearn_interval_seconds);

    if (card.lapses >= cfg.leech_threshold) {
        card.is_leech = true;
    }

    spdlog::warn("Flashcard '{}' lapsed. lapses={}, is_leech={}", card.id, card.lapses, card.is_leech);
}

CollectionStats Scheduler::collectionStats(const std::vector<Flashcard>& cards, std::time_t now) const {
    CollectionStats stats;
    stats.total = static_cast<int>(cards.size());
    if (cards.empty()) return stats;

    double easeSum = 0.0;
    for (const auto& card : cards) {
        if (card.isDue(now)) {
            stats.due_now++;
            if (now - card.due_at >= SECONDS_PER_DAY) stats.overdue++;
        }
        if (card.isNew()) stats.fresh++;
        if (card.ease_factor < 2.0 || card.lapses > card.repetitions) stats.difficult++;
        if (card.is_leech) stats.leeches++;
        easeSum += card.ease_factor;
    }
    stats.average_ease = easeSum / static_cast<double>(cards.size());
    return stats;
}
