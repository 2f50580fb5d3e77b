#include "Grade.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cctype>

Grade gradeFromInt(int value) {
    switch (value) {
    case 1: return Grade::AGAIN;
    case 2: return Grade::HARD;
    case 3: return Grade::GOOD;
    case 4: return Grade::EASY;
    default:
        throw InvalidArgument("grade out of range: " + std::to_string(value));
    }
}

Grade gradeFromName(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (n == "again") return Grade::AGAIN;
    if (n == "hard") return Grade::HARD;
    if (n == "good") return Grade::GOOD;
    if (n == "easy") return Grade::EASY;
    throw InvalidArgument("unknown grade '" + name + "'");
}

const char* gradeName(Grade grade) {
    switch (grade) {
    case Grade::AGAIN: return "again";
    case Grade::HARD: return "hard";
    case Grade::GOOD: return "good";
    case Grade::EASY: return "easy";
    }
    return "unknown";
}
