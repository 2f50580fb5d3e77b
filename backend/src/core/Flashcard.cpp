#include "Flashcard.hpp"
#include "Errors.hpp"
#include <chrono>
#include <random>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

static std::string trimmed(const std::string& s) {
    std::string t = s;
    while (!t.empty() && std::isspace((unsigned char)t.front())) t.erase(t.begin());
    while (!t.empty() && std::isspace((unsigned char)t.back())) t.pop_back();
    return t;
}

Flashcard::Flashcard(const std::string& owner, CardContent body, std::time_t now,
                     double initialEase)
    : owner_id(owner), content(std::move(body)), ease_factor(initialEase)
{
    id = generateId();
    created_at = now;
    due_at = now; // new cards are immediately due
    spdlog::info("Created Flashcard: ID={}, owner={}, type={}", id, owner_id, cardTypeName(type()));
}

CardType Flashcard::type() const {
    return static_cast<CardType>(content.index());
}

void Flashcard::addTag(const std::string& tag) {
    std::string t = trimmed(tag);
    if (t.empty()) return;

    if (!hasTag(t)) {
        tags.push_back(t);
        spdlog::debug("Flashcard ID={} addTag '{}'", id, t);
    }
}

bool Flashcard::removeTag(const std::string& tag) {
    auto it = std::find(tags.begin(), tags.end(), tag);
    if (it != tags.end()) {
        tags.erase(it);
        spdlog::debug("Flashcard ID={} removeTag '{}'", id, tag);
        return true;
    }
    return false;
}

bool Flashcard::hasTag(const std::string& tag) const {
    return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

void Flashcard::setTags(const std::vector<std::string>& newTags) {
    tags.clear();
    for (const auto& t : newTags) {
        addTag(t);
    }
    spdlog::debug("Flashcard ID={} setTags count={}", id, tags.size());
}

std::string Flashcard::tagsAsLine() const {
    std::ostringstream oss;
    for (size_t i = 0; i < tags.size(); ++i) {
        if (i) oss << ",";
        oss << tags[i];
    }
    return oss.str();
}

// Timestamp + random bits
std::string Flashcard::generateId() {
    using namespace std::chrono;

    auto now = system_clock::now();
    auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count();

    std::random_device rd;
    std::mt19937_64 eng(rd());
    std::uniform_int_distribution<uint64_t> dist;

    uint64_t randPart = dist(eng);

    std::stringstream ss;
    ss << std::hex << millis << "-" << std::setw(16) << std::setfill('0') << randPart;
    return ss.str();
}

const char* cardTypeName(CardType type) {
    switch (type) {
    case CardType::TWO_SIDED: return "two_sided";
    case CardType::FILL_IN_BLANK: return "fill_in_blank";
    case CardType::MULTIPLE_CHOICE: return "multiple_choice";
    }
    return "unknown";
}

CardType cardTypeFromName(const std::string& name) {
    if (name == "two_sided") return CardType::TWO_SIDED;
    if (name == "fill_in_blank") return CardType::FILL_IN_BLANK;
    if (name == "multiple_choice") return CardType::MULTIPLE_CHOICE;
    throw InvalidArgument("unknown card type '" + name + "'");
}
