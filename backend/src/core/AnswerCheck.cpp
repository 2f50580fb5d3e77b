#include "AnswerCheck.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <spdlog/spdlog.h>

static std::string trim(const std::string& s) {
    std::string t = s;
    while (!t.empty() && std::isspace((unsigned char)t.front())) t.erase(t.begin());
    while (!t.empty() && std::isspace((unsigned char)t.back())) t.pop_back();
    return t;
}

static std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower((unsigned char)c));
    return s;
}

std::vector<std::string> parseBlankAnswers(const std::string& input, size_t expected) {
    std::vector<std::string> out;

    // separators in priority order; the first one present is used
    char sep = 0;
    for (char c : {',', ';', '|', '\n'}) {
        if (input.find(c) != std::string::npos) {
            sep = c;
            break;
        }
    }

    if (sep == 0) {
        out.push_back(trim(input));
    }
    else {
        std::istringstream iss(input);
        std::string part;
        while (std::getline(iss, part, sep)) out.push_back(trim(part));
        if (!input.empty() && input.back() == sep) out.push_back("");
    }

    out.resize(expected);
    return out;
}

std::vector<int> parseChoiceAnswer(const std::string& input, size_t optionCount) {
    std::vector<int> picked;
    auto take = [&](int idx) {
        if (idx >= 0 && static_cast<size_t>(idx) < optionCount &&
            std::find(picked.begin(), picked.end(), idx) == picked.end()) {
            picked.push_back(idx);
        }
    };

    for (char c : input) {
        if (std::isalpha((unsigned char)c)) take(std::toupper((unsigned char)c) - 'A');
    }
    if (picked.empty()) {
        for (char c : input) {
            if (std::isdigit((unsigned char)c)) take(c - '1');
        }
    }

    std::sort(picked.begin(), picked.end());
    return picked;
}

namespace {

struct AnswerChecker {
    const std::string& input;

    bool operator()(const TwoSidedContent& body) const {
        return lower(trim(input)) == lower(trim(body.back));
    }

    bool operator()(const FillInBlankContent& body) const {
        if (body.answers.empty()) return false;
        auto given = parseBlankAnswers(input, body.answers.size());

        for (size_t i = 0; i < given.size(); ++i) {
            std::string want = trim(body.answers[i]);
            std::string got = trim(given[i]);
            if (!body.case_sensitive) {
                want = lower(want);
                got = lower(got);
            }
            if (got != want) return false;
        }
        return true;
    }

    bool operator()(const MultipleChoiceContent& body) const {
        auto picked = parseChoiceAnswer(input, body.options.size());
        std::vector<int> correct = body.correct_indices;
        std::sort(correct.begin(), correct.end());
        return picked == correct;
    }
};

} // namespace

bool checkAnswer(const Flashcard& card, const std::string& input) {
    bool ok = std::visit(AnswerChecker{input}, card.content);
    spdlog::debug("Answer check card={} type={} correct={}", card.id, cardTypeName(card.type()), ok);
    return ok;
}
