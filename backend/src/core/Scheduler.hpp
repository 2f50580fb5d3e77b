#pragma once
#include <vector>
#include <string>
#include <ctime>
#include "Flashcard.hpp"
#include "Grade.hpp"
#include "../config/Config.hpp"

struct CollectionStats {
    int total = 0;
    int due_now = 0;
    int overdue = 0;       // due for at least one whole day
    int fresh = 0;         // never reviewed
    int difficult = 0;
    int leeches = 0;
    double average_ease = 0.0;
};

/*
  SM-2 family scheduler.

  Every member function is a pure function of its arguments and the
  configuration captured at construction: no I/O, no clock reads, no
  per-card memory between calls. Calling applyOutcome twice with the same
  card, grade and time yields identical cards, which is what makes a
  retried review safe.
*/
class Scheduler {
public:
    explicit Scheduler(const SchedulerConfig& cfg = SchedulerConfig());

    // Ids of cards with due_at <= now, oldest due first, ties by ascending id.
    std::vector<std::string> nextDue(const std::vector<Flashcard>& cards, std::time_t now) const;

    Flashcard applyOutcome(const Flashcard& card, Grade grade, std::time_t now) const;

    CollectionStats collectionStats(const std::vector<Flashcard>& cards, std::time_t now) const;

    const SchedulerConfig& config() const { return cfg; }

private:
    SchedulerConfig cfg;

    int clampInterval(double days) const;
    void handleLapse(Flashcard& card, std::time_t now) const;
};
