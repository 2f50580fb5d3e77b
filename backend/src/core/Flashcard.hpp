#pragma once
#include <string>
#include <ctime>
#include <variant>
#include <vector>

enum class CardType {
    TWO_SIDED = 0,
    FILL_IN_BLANK = 1,
    MULTIPLE_CHOICE = 2
};

struct TwoSidedContent {
    std::string front;
    std::string back;
};

// text_with_blanks marks each gap with "{blank}"
struct FillInBlankContent {
    std::string text_with_blanks;
    std::vector<std::string> answers;
    bool case_sensitive = false;
};

struct MultipleChoiceContent {
    std::string question;
    std::vector<std::string> options;
    std::vector<int> correct_indices;  // 0-based into options
    bool allow_multiple = false;
};

// Alternative order must match CardType.
using CardContent = std::variant<TwoSidedContent, FillInBlankContent, MultipleChoiceContent>;

class Flashcard {
public:
    Flashcard() = default;
    Flashcard(const std::string& owner, CardContent body, std::time_t now,
              double initialEase = 2.5);

    // Identity
    std::string id;          // Auto-generated
    std::string owner_id;
    std::string title;
    CardContent content;

    // Scheduler state
    double ease_factor = 2.5;
    int interval_days = 0;           // 0 = never successfully reviewed
    int repetitions = 0;             // Consecutive successes since last lapse
    std::time_t due_at = 0;
    std::time_t last_reviewed_at = 0; // 0 = never reviewed
    int lapses = 0;
    bool is_leech = false;

    std::time_t created_at = 0;
    std::vector<std::string> tags;

    CardType type() const;
    bool isDue(std::time_t now) const { return due_at <= now; }
    bool isNew() const { return last_reviewed_at == 0; }

    // Tag helpers
    void addTag(const std::string& tag);
    bool removeTag(const std::string& tag); // returns true if removed
    bool hasTag(const std::string& tag) const;
    void setTags(const std::vector<std::string>& newTags);
    std::string tagsAsLine() const; // CSV single line for storage

    // Utility
    static std::string generateId();
};

const char* cardTypeName(CardType type);
CardType cardTypeFromName(const std::string& name);
