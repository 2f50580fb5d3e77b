#pragma once
#include <string>

enum class Grade {
    AGAIN = 1,
    HARD = 2,
    GOOD = 3,
    EASY = 4
};

// Transport-level conversions. Both throw InvalidArgument on anything
// outside the four grades.
Grade gradeFromInt(int value);
Grade gradeFromName(const std::string& name);

const char* gradeName(Grade grade);
