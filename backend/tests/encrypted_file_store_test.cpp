#include "core/Errors.hpp"
#include "session/SessionEngine.hpp"
#include "storage/EncryptedFileStore.hpp"

#include <cassert>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

constexpr std::time_t kT0 = 1700000000;

std::filesystem::path TestDir(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "flashgram_file_store_tests" / test_name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

std::vector<Flashcard> SampleCards() {
  Flashcard two("alice", TwoSidedContent{"line one\nline two", "back\\slash"}, kT0);
  two.title         = "multi-line";
  two.ease_factor   = 2.3000000000000003;
  two.interval_days = 15;
  two.repetitions   = 4;
  two.lapses        = 2;
  two.due_at        = kT0 + 15 * 86400;
  two.last_reviewed_at = kT0;
  two.setTags({"nouns", "case"});

  Flashcard blank("alice", FillInBlankContent{"Я {blank} книгу {blank}", {"читаю", "сейчас"}, true}, kT0);
  blank.is_leech = true;

  Flashcard choice("bob", MultipleChoiceContent{"Which?", {"one", "two", "three"}, {0, 2}, true}, kT0);

  return {two, blank, choice};
}

void AssertSameCard(const Flashcard& a, const Flashcard& b) {
  assert(a.id == b.id);
  assert(a.owner_id == b.owner_id);
  assert(a.title == b.title);
  assert(a.type() == b.type());
  assert(a.ease_factor == b.ease_factor);
  assert(a.interval_days == b.interval_days);
  assert(a.repetitions == b.repetitions);
  assert(a.due_at == b.due_at);
  assert(a.last_reviewed_at == b.last_reviewed_at);
  assert(a.lapses == b.lapses);
  assert(a.is_leech == b.is_leech);
  assert(a.created_at == b.created_at);
  assert(a.tags == b.tags);

  switch (a.type()) {
    case CardType::TWO_SIDED: {
      const auto& x = std::get<TwoSidedContent>(a.content);
      const auto& y = std::get<TwoSidedContent>(b.content);
      assert(x.front == y.front && x.back == y.back);
      break;
    }
    case CardType::FILL_IN_BLANK: {
      const auto& x = std::get<FillInBlankContent>(a.content);
      const auto& y = std::get<FillInBlankContent>(b.content);
      assert(x.text_with_blanks == y.text_with_blanks && x.answers == y.answers);
      assert(x.case_sensitive == y.case_sensitive);
      break;
    }
    case CardType::MULTIPLE_CHOICE: {
      const auto& x = std::get<MultipleChoiceContent>(a.content);
      const auto& y = std::get<MultipleChoiceContent>(b.content);
      assert(x.question == y.question && x.options == y.options);
      assert(x.correct_indices == y.correct_indices && x.allow_multiple == y.allow_multiple);
      break;
    }
  }
}

void TestKeyIsGeneratedOnceAndReused() {
  const auto dir      = TestDir("key");
  const auto key_file = (dir / "store.key").string();

  const auto first  = EncryptedFileStore::loadOrCreateKey(key_file);
  const auto second = EncryptedFileStore::loadOrCreateKey(key_file);
  assert(first.size() == 32);
  assert(first == second);

  using std::filesystem::perms;
  const auto mode = std::filesystem::status(key_file).permissions();
  assert((mode & (perms::group_all | perms::others_all)) == perms::none);
  assert((mode & perms::owner_read) != perms::none);

  std::ofstream(dir / "bad.key") << "zz-not-hex\n";
  assert(Throws<InvalidArgument>([&] { EncryptedFileStore::loadOrCreateKey((dir / "bad.key").string()); }));
}

void TestDataSurvivesReopen() {
  const auto dir  = TestDir("reopen");
  const auto path = (dir / "cards.dat").string();
  const auto key  = EncryptedFileStore::loadOrCreateKey((dir / "store.key").string());
  const auto cards = SampleCards();

  Session session;
  session.owner_id        = "alice";
  session.mode            = SessionMode::EDITING;
  session.prior_mode      = SessionMode::REVIEWING;
  session.active_card_id  = cards[0].id;
  session.editing_card_id = cards[1].id;
  session.queue           = {"x", "y"};
  session.started_at      = kT0;
  session.stats.again     = 1;
  session.stats.good      = 3;
  session.recent_submissions = {"tok-1", "tok-2"};

  {
    EncryptedFileStore store(path, key);
    for (const auto& c : cards) store.saveCard(c);
    store.saveSession(session);
  }

  EncryptedFileStore reopened(path, key);
  assert(reopened.cardCount() == 3);
  for (const auto& c : cards) {
    const auto loaded = reopened.loadCard(c.id);
    assert(loaded);
    AssertSameCard(c, *loaded);
  }

  const auto s = reopened.loadSession("alice");
  assert(s);
  assert(s->mode == SessionMode::EDITING);
  assert(s->prior_mode == SessionMode::REVIEWING);
  assert(s->active_card_id == session.active_card_id);
  assert(s->editing_card_id == session.editing_card_id);
  assert(s->queue == session.queue);
  assert(s->started_at == kT0);
  assert(s->stats.again == 1 && s->stats.good == 3);
  assert(s->recent_submissions == session.recent_submissions);
  assert(!reopened.loadSession("bob"));
}

void TestReviewCommitIsPersisted() {
  const auto dir  = TestDir("commit");
  const auto path = (dir / "cards.dat").string();
  const auto key  = EncryptedFileStore::loadOrCreateKey((dir / "store.key").string());

  std::string card_id;
  {
    EncryptedFileStore store(path, key);
    Flashcard card("alice", TwoSidedContent{"q", "a"}, kT0);
    card_id = card.id;
    store.saveCard(card);

    Scheduler     scheduler;
    SessionEngine engine(store, scheduler);
    engine.startReview("alice", kT0);
    const auto step = engine.reportOutcome("alice", card_id, Grade::GOOD, kT0);
    assert(step.summary);
  }

  EncryptedFileStore reopened(path, key);
  assert(reopened.loadCard(card_id)->repetitions == 1);
  assert(!reopened.loadSession("alice"));
  assert(!std::filesystem::exists(path + ".tmp"));
}

void TestDeleteIsPersisted() {
  const auto dir   = TestDir("delete");
  const auto path  = (dir / "cards.dat").string();
  const auto key   = EncryptedFileStore::loadOrCreateKey((dir / "store.key").string());
  const auto cards = SampleCards();

  {
    EncryptedFileStore store(path, key);
    for (const auto& c : cards) store.saveCard(c);
    assert(store.deleteCard(cards[1].id));
  }

  EncryptedFileStore reopened(path, key);
  assert(reopened.cardCount() == 2);
  assert(!reopened.loadCard(cards[1].id));
  assert(reopened.loadCard(cards[0].id));
}

void TestWrongKeyIsRejected() {
  const auto dir  = TestDir("wrong_key");
  const auto path = (dir / "cards.dat").string();
  const auto key  = EncryptedFileStore::loadOrCreateKey((dir / "a.key").string());
  const auto other = EncryptedFileStore::loadOrCreateKey((dir / "b.key").string());

  {
    EncryptedFileStore store(path, key);
    store.saveCard(SampleCards()[0]);
  }

  assert(Throws<StoreUnavailable>([&] { EncryptedFileStore store(path, other); }));
  assert(Throws<InvalidArgument>([&] { EncryptedFileStore store(path, std::vector<unsigned char>(5)); }));
}

void TestCorruptHeaderIsRejected() {
  const auto dir  = TestDir("corrupt");
  const auto path = (dir / "cards.dat").string();
  const auto key  = EncryptedFileStore::loadOrCreateKey((dir / "store.key").string());

  std::ofstream(path, std::ios::binary) << "NOTDATA!garbage";
  assert(Throws<StoreUnavailable>([&] { EncryptedFileStore store(path, key); }));
}

void TestUnwritableLocationRollsBack() {
  const auto dir  = TestDir("unwritable");
  const auto path = (dir / "missing" / "cards.dat").string();
  const auto key  = EncryptedFileStore::loadOrCreateKey((dir / "store.key").string());

  EncryptedFileStore store(path, key);
  assert(store.cardCount() == 0);

  const auto card = SampleCards()[0];
  assert(Throws<StoreUnavailable>([&] { store.saveCard(card); }));
  assert(store.cardCount() == 0);
  assert(!store.loadCard(card.id));
}

} // namespace

int main() {
  TestKeyIsGeneratedOnceAndReused();
  TestDataSurvivesReopen();
  TestReviewCommitIsPersisted();
  TestDeleteIsPersisted();
  TestWrongKeyIsRejected();
  TestCorruptHeaderIsRejected();
  TestUnwritableLocationRollsBack();

  std::cout << "flashgram_encrypted_file_store: pass\n";
  return 0;
}
