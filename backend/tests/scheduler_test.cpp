#include "core/Scheduler.hpp"

#include <cassert>
#include <cmath>
#include <ctime>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace {

constexpr std::time_t kDay = 24 * 60 * 60;
constexpr std::time_t kT0 = 1700000000;

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

Flashcard MakeCard(const std::string& id, int repetitions, int interval, double ease, std::time_t due_at = kT0) {
  Flashcard card;
  card.id            = id;
  card.owner_id      = "owner-1";
  card.content       = TwoSidedContent{"front " + id, "back " + id};
  card.repetitions   = repetitions;
  card.interval_days = interval;
  card.ease_factor   = ease;
  card.due_at        = due_at;
  return card;
}

bool SameSchedule(const Flashcard& a, const Flashcard& b) {
  return a.id == b.id && a.ease_factor == b.ease_factor && a.interval_days == b.interval_days &&
         a.repetitions == b.repetitions && a.due_at == b.due_at && a.last_reviewed_at == b.last_reviewed_at &&
         a.lapses == b.lapses && a.is_leech == b.is_leech;
}

void TestGoodOnNewCardSchedulesTomorrow() {
  Scheduler scheduler;
  const auto card = MakeCard("new", 0, 0, 2.5);

  const auto next = scheduler.applyOutcome(card, Grade::GOOD, kT0);

  assert(next.repetitions == 1);
  assert(next.interval_days == 1);
  assert(next.due_at == kT0 + kDay);
  assert(Near(next.ease_factor, 2.5));
  assert(next.last_reviewed_at == kT0);
  assert(next.lapses == 0);
}

void TestGoodMultipliesIntervalByEase() {
  Scheduler scheduler;
  const auto card = MakeCard("mature", 3, 6, 2.5);

  const auto next = scheduler.applyOutcome(card, Grade::GOOD, kT0);

  assert(next.interval_days == 15);
  assert(next.due_at == kT0 + 15 * kDay);
  assert(next.repetitions == 4);
  assert(Near(next.ease_factor, 2.5));
}

void TestGoodRoundsHalfAwayFromZero() {
  Scheduler scheduler;
  const auto next = scheduler.applyOutcome(MakeCard("second", 1, 1, 2.5), Grade::GOOD, kT0);

  assert(next.repetitions == 2);
  assert(next.interval_days == 3);
}

void TestAgainResetsStreakAndRelearnsImmediately() {
  Scheduler scheduler;
  const auto card = MakeCard("mature", 3, 6, 2.5);

  const auto next = scheduler.applyOutcome(card, Grade::AGAIN, kT0);

  assert(next.repetitions == 0);
  assert(next.lapses == 1);
  assert(Near(next.ease_factor, 2.3));
  assert(next.interval_days == 0);
  assert(next.due_at == kT0);
  assert(next.last_reviewed_at == kT0);
  assert(!next.is_leech);
}

void TestHardShrinksEaseAndGrowsIntervalSlowly() {
  Scheduler scheduler;

  const auto mature = scheduler.applyOutcome(MakeCard("mature", 3, 6, 2.5), Grade::HARD, kT0);
  assert(mature.repetitions == 4);
  assert(Near(mature.ease_factor, 2.35));
  assert(mature.interval_days == 7);
  assert(mature.due_at == kT0 + 7 * kDay);

  const auto fresh = scheduler.applyOutcome(MakeCard("new", 0, 0, 2.5), Grade::HARD, kT0);
  assert(fresh.repetitions == 1);
  assert(fresh.interval_days == 1);
}

void TestEasyRaisesEaseAndUsesItForTheInterval() {
  Scheduler scheduler;

  const auto mature = scheduler.applyOutcome(MakeCard("mature", 3, 6, 2.5), Grade::EASY, kT0);
  assert(Near(mature.ease_factor, 2.65));
  assert(mature.interval_days == 21); // round(6 * 2.65 * 1.3) = round(20.67)
  assert(mature.repetitions == 4);

  const auto fresh = scheduler.applyOutcome(MakeCard("new", 0, 0, 2.5), Grade::EASY, kT0);
  assert(fresh.interval_days == 3); // round(1 * 2.65 * 1.3) = round(3.445)
  assert(fresh.due_at == kT0 + 3 * kDay);
}

void TestApplyOutcomeIsReferentiallyTransparent() {
  Scheduler scheduler;
  const auto card = MakeCard("same", 2, 3, 2.1);

  for (Grade g : {Grade::AGAIN, Grade::HARD, Grade::GOOD, Grade::EASY}) {
    const auto first  = scheduler.applyOutcome(card, g, kT0);
    const auto second = scheduler.applyOutcome(card, g, kT0);
    assert(SameSchedule(first, second));
  }

  // the input card is left alone
  assert(card.repetitions == 2);
  assert(card.interval_days == 3);
}

void TestEaseNeverDropsBelowFloor() {
  Scheduler scheduler;
  std::mt19937 rng(42);
  std::uniform_int_distribution<int> pick(1, 4);

  for (int run = 0; run < 50; ++run) {
    auto card = MakeCard("walk", 0, 0, 2.5);
    std::time_t now = kT0;
    for (int step = 0; step < 200; ++step) {
      card = scheduler.applyOutcome(card, gradeFromInt(pick(rng)), now);
      assert(card.ease_factor >= scheduler.config().min_ease);
      assert(card.interval_days >= 0);
      assert(card.interval_days <= scheduler.config().max_interval_days);
      now = card.due_at;
    }
  }

  auto card = MakeCard("lapsing", 0, 0, 1.35);
  for (int i = 0; i < 10; ++i) {
    card = scheduler.applyOutcome(card, Grade::AGAIN, kT0);
    assert(card.ease_factor >= 1.3);
  }
  assert(Near(card.ease_factor, 1.3));
}

void TestConfiguredRelearnIntervalAndPenalties() {
  SchedulerConfig cfg;
  cfg.relearn_interval_seconds = 600;
  cfg.again_ease_penalty       = 0.3;
  Scheduler scheduler(cfg);

  const auto next = scheduler.applyOutcome(MakeCard("tuned", 3, 6, 2.5), Grade::AGAIN, kT0);
  assert(next.due_at == kT0 + 600);
  assert(Near(next.ease_factor, 2.2));
}

void TestIntervalIsCapped() {
  SchedulerConfig cfg;
  cfg.max_interval_days = 30;
  Scheduler scheduler(cfg);

  const auto next = scheduler.applyOutcome(MakeCard("old", 10, 25, 2.5), Grade::GOOD, kT0);
  assert(next.interval_days == 30);
  assert(next.due_at == kT0 + 30 * kDay);
}

void TestLeechFlaggedAtThreshold() {
  SchedulerConfig cfg;
  cfg.leech_threshold = 3;
  Scheduler scheduler(cfg);

  auto card = MakeCard("leech", 0, 0, 2.5);
  card = scheduler.applyOutcome(card, Grade::AGAIN, kT0);
  card = scheduler.applyOutcome(card, Grade::AGAIN, kT0);
  assert(!card.is_leech);
  card = scheduler.applyOutcome(card, Grade::AGAIN, kT0);
  assert(card.is_leech);
  assert(card.lapses == 3);

  card = scheduler.applyOutcome(card, Grade::GOOD, kT0);
  assert(card.is_leech);
}

void TestNextDueFiltersAndOrders() {
  Scheduler scheduler;
  std::vector<Flashcard> cards = {
      MakeCard("c", 1, 1, 2.5, kT0 - 10),
      MakeCard("future", 1, 1, 2.5, kT0 + 1),
      MakeCard("b", 1, 1, 2.5, kT0 - 100),
      MakeCard("a", 1, 1, 2.5, kT0 - 10),
      MakeCard("exact", 1, 1, 2.5, kT0),
  };

  const auto due = scheduler.nextDue(cards, kT0);

  const std::vector<std::string> expected = {"b", "a", "c", "exact"};
  assert(due == expected);

  // stable across calls and independent of input order
  std::vector<Flashcard> reversed(cards.rbegin(), cards.rend());
  assert(scheduler.nextDue(reversed, kT0) == expected);
}

void TestNextDueEmpty() {
  Scheduler scheduler;
  assert(scheduler.nextDue({}, kT0).empty());
  assert(scheduler.nextDue({MakeCard("later", 0, 0, 2.5, kT0 + kDay)}, kT0).empty());
}

void TestCollectionStats() {
  Scheduler scheduler;

  auto fresh = MakeCard("fresh", 0, 0, 2.5, kT0);
  auto overdue = MakeCard("overdue", 2, 3, 1.9, kT0 - 2 * kDay);
  overdue.last_reviewed_at = kT0 - 5 * kDay;
  auto later = MakeCard("later", 4, 10, 2.7, kT0 + kDay);
  later.last_reviewed_at = kT0 - kDay;
  later.is_leech = true;

  const auto stats = scheduler.collectionStats({fresh, overdue, later}, kT0);
  assert(stats.total == 3);
  assert(stats.due_now == 2);
  assert(stats.overdue == 1);
  assert(stats.fresh == 1);
  assert(stats.difficult == 1);
  assert(stats.leeches == 1);
  assert(Near(stats.average_ease, (2.5 + 1.9 + 2.7) / 3.0));

  const auto empty = scheduler.collectionStats({}, kT0);
  assert(empty.total == 0);
  assert(Near(empty.average_ease, 0.0));
}

} // namespace

int main() {
  TestGoodOnNewCardSchedulesTomorrow();
  TestGoodMultipliesIntervalByEase();
  TestGoodRoundsHalfAwayFromZero();
  TestAgainResetsStreakAndRelearnsImmediately();
  TestHardShrinksEaseAndGrowsIntervalSlowly();
  TestEasyRaisesEaseAndUsesItForTheInterval();
  TestApplyOutcomeIsReferentiallyTransparent();
  TestEaseNeverDropsBelowFloor();
  TestConfiguredRelearnIntervalAndPenalties();
  TestIntervalIsCapped();
  TestLeechFlaggedAtThreshold();
  TestNextDueFiltersAndOrders();
  TestNextDueEmpty();
  TestCollectionStats();

  std::cout << "flashgram_scheduler: pass\n";
  return 0;
}
