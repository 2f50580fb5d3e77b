#include <iostream>
#include <vector>
#include <string>
#include <ctime>
#include <cstdlib>
#include <cctype>
#include <memory>
#include <limits>
#include <sstream>

#include "../utils/logging.hpp"
#include "../config/Config.hpp"
#include "../core/AnswerCheck.hpp"
#include "../core/Errors.hpp"
#include "../core/Scheduler.hpp"
#include "../session/SessionEngine.hpp"
#include "../storage/EncryptedFileStore.hpp"

static std::vector<std::string> splitList(const std::string& line, char sep = ',') {
    std::vector<std::string> out;
    std::istringstream iss(line);
    std::string t;
    while (std::getline(iss, t, sep)) {
        while (!t.empty() && std::isspace((unsigned char)t.front())) t.erase(t.begin());
        while (!t.empty() && std::isspace((unsigned char)t.back())) t.pop_back();
        if (!t.empty()) out.push_back(t);
    }
    return out;
}

static std::string prompt(const std::string& label) {
    std::cout << label;
    std::string line;
    std::getline(std::cin, line);
    return line;
}

static int askNumber(const std::string& label, int lo, int hi) {
    while (std::cin) {
        std::cout << label;
        int v;
        if (std::cin >> v && v >= lo && v <= hi) {
            std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
            return v;
        }
        if (std::cin.eof()) break;
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        std::cout << "Invalid input.\n";
    }
    return lo;
}

static std::string formatTime(std::time_t t) {
    if (t == 0) return "never";
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", std::localtime(&t));
    return buf;
}

static void showQuestion(const Flashcard& card) {
    std::cout << "\n--- " << (card.title.empty() ? cardTypeName(card.type()) : card.title) << " ---\n";
    switch (card.type()) {
    case CardType::TWO_SIDED:
        std::cout << std::get<TwoSidedContent>(card.content).front << "\n";
        break;
    case CardType::FILL_IN_BLANK: {
        std::string text = std::get<FillInBlankContent>(card.content).text_with_blanks;
        const std::string marker = "{blank}";
        for (auto pos = text.find(marker); pos != std::string::npos; pos = text.find(marker, pos)) {
            text.replace(pos, marker.size(), "_____");
        }
        std::cout << text << "\n";
        break;
    }
    case CardType::MULTIPLE_CHOICE: {
        const auto& body = std::get<MultipleChoiceContent>(card.content);
        std::cout << body.question << "\n";
        for (size_t i = 0; i < body.options.size(); ++i) {
            std::cout << "  " << static_cast<char>('A' + i) << ". " << body.options[i] << "\n";
        }
        break;
    }
    }
}

static void showAnswer(const Flashcard& card) {
    std::cout << "Answer: ";
    switch (card.type()) {
    case CardType::TWO_SIDED:
        std::cout << std::get<TwoSidedContent>(card.content).back;
        break;
    case CardType::FILL_IN_BLANK: {
        const auto& answers = std::get<FillInBlankContent>(card.content).answers;
        for (size_t i = 0; i < answers.size(); ++i) std::cout << (i ? ", " : "") << answers[i];
        break;
    }
    case CardType::MULTIPLE_CHOICE: {
        const auto& idx = std::get<MultipleChoiceContent>(card.content).correct_indices;
        for (size_t i = 0; i < idx.size(); ++i) std::cout << (i ? ", " : "") << static_cast<char>('A' + idx[i]);
        break;
    }
    }
    std::cout << "\n";
}

static void listCards(const std::vector<Flashcard>& cards) {
    std::cout << "\n===== ALL CARDS =====\n";
    if (cards.empty()) {
        std::cout << "No cards stored.\n";
        return;
    }

    for (size_t i = 0; i < cards.size(); i++) {
        const Flashcard& c = cards[i];
        std::cout << i + 1 << ". [" << cardTypeName(c.type()) << "] "
            << (c.title.empty() ? c.id : c.title) << "\n";
        std::cout << "   Tags: " << (c.tags.empty() ? "(none)" : c.tagsAsLine()) << "\n";
        std::cout << "   Interval: " << c.interval_days << " days, Ease: " << c.ease_factor
            << ", Reps: " << c.repetitions << ", Lapses: " << c.lapses
            << (c.is_leech ? " (leech)" : "") << "\n";
        std::cout << "   Due: " << formatTime(c.due_at)
            << ", Last review: " << formatTime(c.last_reviewed_at) << "\n";
    }
}

static Flashcard newCardFromInput(const std::string& owner, const SchedulerConfig& cfg) {
    int type = askNumber("Card type: 1 = two-sided, 2 = fill in the blank, 3 = multiple choice\n> ", 1, 3);

    CardContent body;
    if (type == 1) {
        TwoSidedContent c;
        c.front = prompt("Front: ");
        c.back = prompt("Back: ");
        body = c;
    }
    else if (type == 2) {
        FillInBlankContent c;
        c.text_with_blanks = prompt("Text (mark gaps with {blank}): ");
        c.answers = splitList(prompt("Answers (comma-separated, in order): "));
        body = c;
    }
    else {
        MultipleChoiceContent c;
        c.question = prompt("Question: ");
        c.options = splitList(prompt("Options (comma-separated): "));
        for (const auto& letter : splitList(prompt("Correct letters (comma-separated): "))) {
            int idx = std::toupper((unsigned char)letter[0]) - 'A';
            if (idx >= 0 && idx < static_cast<int>(c.options.size())) c.correct_indices.push_back(idx);
        }
        c.allow_multiple = c.correct_indices.size() > 1;
        body = c;
    }

    Flashcard card(owner, body, std::time(nullptr), cfg.default_ease);
    card.title = prompt("Title (optional): ");
    card.setTags(splitList(prompt("Tags (comma-separated): ")));
    return card;
}

static void printSummary(const SessionSummary& s) {
    std::cout << "\nSession complete: " << s.reviewed << " reviewed ("
        << s.stats.again << " again, " << s.stats.hard << " hard, "
        << s.stats.good << " good, " << s.stats.easy << " easy)\n";
}

static void runReview(SessionEngine& engine, const std::string& owner) {
    ReviewStep step = engine.startReview(owner, std::time(nullptr));
    if (!step.card) {
        std::cout << "No cards due.\n";
        return;
    }

    while (step.card) {
        const Flashcard card = *step.card;
        showQuestion(card);
        std::string given = prompt(card.type() == CardType::MULTIPLE_CHOICE
            ? "Your answer (letters, empty to reveal): "
            : "Your answer (empty to reveal): ");
        if (!given.empty()) {
            bool correct = checkAnswer(card, given);
            std::cout << (correct ? "Correct!" : "Incorrect.")
                << " Suggested grade: " << gradeName(correct ? Grade::GOOD : Grade::AGAIN) << "\n";
        }
        showAnswer(card);

        int q = askNumber("\n 1 = AGAIN, 2 = HARD, 3 = GOOD, 4 = EASY, 0 = pause\n> ", 0, 4);
        if (q == 0) {
            std::cout << "Paused. Choose Review again to continue.\n";
            return;
        }

        step = engine.reportOutcome(owner, card.id, gradeFromInt(q), std::time(nullptr),
            Flashcard::generateId());
    }

    if (step.summary) printSummary(*step.summary);
}

static void runEdit(SessionEngine& engine, SessionStore& store, const std::string& owner) {
    auto cards = store.listCards(owner);
    listCards(cards);
    if (cards.empty()) return;

    int sel = askNumber("Choose card number: ", 1, static_cast<int>(cards.size()));
    Flashcard card = cards[sel - 1];

    engine.startEdit(owner, card.id);

    std::string title = prompt("New title (empty keeps current): ");
    if (!title.empty()) card.title = title;

    if (card.type() == CardType::TWO_SIDED) {
        auto& body = std::get<TwoSidedContent>(card.content);
        std::string front = prompt("New front (empty keeps current): ");
        std::string back = prompt("New back (empty keeps current): ");
        if (!front.empty()) body.front = front;
        if (!back.empty()) body.back = back;
    }

    std::string tags = prompt("New tags (empty keeps current): ");
    if (!tags.empty()) card.setTags(splitList(tags));

    engine.saveEdit(owner, card);
    std::cout << "Card updated.\n";
}

static void runDelete(SessionEngine& engine, SessionStore& store, const std::string& owner) {
    auto cards = store.listCards(owner);
    listCards(cards);
    if (cards.empty()) return;

    int sel = askNumber("Choose card number to delete: ", 1, static_cast<int>(cards.size()));
    const Flashcard& card = cards[sel - 1];

    Session session = engine.getSessionState(owner);
    if (session.active_card_id == card.id || session.editing_card_id == card.id) {
        std::cout << "That card is in use by the current session. Cancel the session first.\n";
        return;
    }

    std::string confirm = prompt("Delete '" + (card.title.empty() ? card.id : card.title) + "'? (y/N): ");
    if (confirm != "y" && confirm != "Y") return;

    if (store.deleteCard(card.id)) std::cout << "Card deleted.\n";
    else std::cout << "Card was already gone.\n";
}

static void showStats(SessionEngine& engine, SessionStore& store, const Scheduler& scheduler,
                      const std::string& owner) {
    CollectionStats st = scheduler.collectionStats(store.listCards(owner), std::time(nullptr));
    Session session = engine.getSessionState(owner);

    std::cout << "\n===== STATISTICS =====\n"
        << "Total: " << st.total << "\n"
        << "Due now: " << st.due_now << " (overdue: " << st.overdue << ")\n"
        << "New: " << st.fresh << "\n"
        << "Difficult: " << st.difficult << "\n"
        << "Leeches: " << st.leeches << "\n"
        << "Average ease: " << st.average_ease << "\n"
        << "Session: " << sessionModeName(session.mode);
    if (session.mode != SessionMode::IDLE) {
        std::cout << ", " << session.stats.total() << " graded, " << session.queue.size() << " queued";
    }
    std::cout << "\n";
}

int main(int argc, char** argv) {
    std::string configPath;
    std::string owner;
    if (const char* user = std::getenv("USER")) owner = user;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) configPath = argv[++i];
        else if (arg == "--owner" && i + 1 < argc) owner = argv[++i];
        else {
            std::cerr << "usage: flashgram [--config FILE] [--owner NAME]\n";
            return 2;
        }
    }
    if (owner.empty()) owner = "default";

    Config cfg;
    try {
        if (!configPath.empty()) cfg = Config::loadFromFile(configPath);
        Log::init(cfg.log);
    }
    catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    std::unique_ptr<EncryptedFileStore> store;
    try {
        store = std::make_unique<EncryptedFileStore>(cfg.store.file,
            EncryptedFileStore::loadOrCreateKey(cfg.store.key_file));
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to open store: {}", e.what());
        std::cerr << "Failed to open store: " << e.what() << "\n";
        return 1;
    }

    Scheduler scheduler(cfg.scheduler);
    SessionEngine engine(*store, scheduler, cfg.session);

    // MAIN LOOP
    while (std::cin) {
        std::cout << "\n===== MAIN MENU =====\n"
            "Owner: " << owner << "\n"
            "1. Add Card\n"
            "2. Review Due Cards\n"
            "3. Edit Card\n"
            "4. Cancel Session\n"
            "5. List All Cards\n"
            "6. Statistics\n"
            "7. Delete Card\n"
            "8. Exit\n> ";

        int choice;
        if (!(std::cin >> choice)) {
            if (std::cin.eof()) break;
            std::cin.clear(); std::string dummy; std::getline(std::cin, dummy);
            continue;
        }
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');

        try {
            if (choice == 1) {
                store->saveCard(newCardFromInput(owner, cfg.scheduler));
                std::cout << "Card added.\n";
            }
            else if (choice == 2) {
                runReview(engine, owner);
            }
            else if (choice == 3) {
                runEdit(engine, *store, owner);
            }
            else if (choice == 4) {
                engine.cancel(owner);
                std::cout << "Session cancelled.\n";
            }
            else if (choice == 5) {
                listCards(store->listCards(owner));
            }
            else if (choice == 6) {
                showStats(engine, *store, scheduler, owner);
            }
            else if (choice == 7) {
                runDelete(engine, *store, owner);
            }
            else if (choice == 8) {
                std::cout << "Goodbye!\n";
                break;
            }
            else {
                std::cout << "Invalid.\n";
            }
        }
        catch (const InvalidState& e) {
            std::cout << "Not now: " << e.what() << "\n";
        }
        catch (const NotFound& e) {
            std::cout << "Not found: " << e.what() << "\n";
        }
        catch (const InvalidArgument& e) {
            std::cout << "Invalid input: " << e.what() << "\n";
        }
        catch (const StoreUnavailable& e) {
            std::cout << "Storage error, nothing was saved: " << e.what() << "\n";
        }
    }

    return 0;
}
