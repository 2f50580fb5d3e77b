#pragma once
#include <string>
#include <vector>
#include "Flashcard.hpp"

// Typed-answer checking for each card type.
//   two-sided:       trimmed, case-insensitive match against the back
//   fill in blank:   one answer per entry of answers, split on the first of
//                    ',', ';', '|', newline (in that order) that appears;
//                    honours case_sensitive
//   multiple choice: letters (A, B, ...) or, failing that, 1-based digits;
//                    correct when the chosen set equals correct_indices
// Case folding is ASCII only.
bool checkAnswer(const Flashcard& card, const std::string& input);

std::vector<std::string> parseBlankAnswers(const std::string& input, size_t expected);
std::vector<int> parseChoiceAnswer(const std::string& input, size_t optionCount);
