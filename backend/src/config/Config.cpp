#include "Config.hpp"
#include "../core/Errors.hpp"
#include <fstream>
#include <sstream>
#include <cctype>
#include <limits>
#include <spdlog/spdlog.h>

static std::string trim(const std::string& s) {
    std::string t = s;
    while (!t.empty() && std::isspace((unsigned char)t.front())) t.erase(t.begin());
    while (!t.empty() && std::isspace((unsigned char)t.back())) t.pop_back();
    return t;
}

// '#' opens a comment at line start or after whitespace; elsewhere it is data.
static size_t commentStart(const std::string& line) {
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '#' && (i == 0 || std::isspace((unsigned char)line[i - 1]))) return i;
    }
    return line.size();
}

static double toDouble(const std::string& key, const std::string& value) {
    try {
        size_t used = 0;
        double d = std::stod(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return d;
    }
    catch (const std::exception&) {
        throw InvalidArgument("config key '" + key + "' expects a number, got '" + value + "'");
    }
}

static long toLong(const std::string& key, const std::string& value) {
    try {
        size_t used = 0;
        long l = std::stol(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return l;
    }
    catch (const std::exception&) {
        throw InvalidArgument("config key '" + key + "' expects an integer, got '" + value + "'");
    }
}

static int toInt(const std::string& key, const std::string& value) {
    long l = toLong(key, value);
    if (l < std::numeric_limits<int>::min() || l > std::numeric_limits<int>::max()) {
        throw InvalidArgument("config key '" + key + "' out of range: " + value);
    }
    return static_cast<int>(l);
}

Config Config::loadFromFile(const std::string& path) {
    spdlog::info("Loading config from '{}'", path);
    std::ifstream in(path);
    if (!in) {
        throw NotFound("config file '" + path + "' not found");
    }

    std::ostringstream oss;
    oss << in.rdbuf();

    Config cfg;
    cfg.apply(oss.str());
    cfg.validate();
    return cfg;
}

void Config::apply(const std::string& text) {
    std::istringstream iss(text);
    std::string line;
    int lineNo = 0;

    while (std::getline(iss, line)) {
        ++lineNo;
        line.erase(commentStart(line));
        line = trim(line);
        if (line.empty()) continue;

        auto pos = line.find('=');
        if (pos == std::string::npos) {
            throw InvalidArgument("config line " + std::to_string(lineNo) + ": expected key = value");
        }

        std::string key = trim(line.substr(0, pos));
        std::string value = trim(line.substr(pos + 1));
        if (key.empty()) {
            throw InvalidArgument("config line " + std::to_string(lineNo) + ": empty key");
        }
        set(key, value);
    }
}

void Config::set(const std::string& key, const std::string& value) {
    if (key == "scheduler.default_ease") scheduler.default_ease = toDouble(key, value);
    else if (key == "scheduler.min_ease") scheduler.min_ease = toDouble(key, value);
    else if (key == "scheduler.again_ease_penalty") scheduler.again_ease_penalty = toDouble(key, value);
    else if (key == "scheduler.hard_ease_penalty") scheduler.hard_ease_penalty = toDouble(key, value);
    else if (key == "scheduler.easy_ease_bonus") scheduler.easy_ease_bonus = toDouble(key, value);
    else if (key == "scheduler.hard_interval_multiplier") scheduler.hard_interval_multiplier = toDouble(key, value);
    else if (key == "scheduler.easy_interval_multiplier") scheduler.easy_interval_multiplier = toDouble(key, value);
    else if (key == "scheduler.relearn_interval_seconds") scheduler.relearn_interval_seconds = toLong(key, value);
    else if (key == "scheduler.max_interval_days") scheduler.max_interval_days = toInt(key, value);
    else if (key == "scheduler.leech_threshold") scheduler.leech_threshold = toInt(key, value);
    else if (key == "session.max_cards") session.max_cards = toInt(key, value);
    else if (key == "session.submission_history") session.submission_history = toInt(key, value);
    else if (key == "log.file") log.file = value;
    else if (key == "log.level") log.level = value;
    else if (key == "store.file") store.file = value;
    else if (key == "store.key_file") store.key_file = value;
    else {
        spdlog::warn("Ignoring unknown config key '{}'", key);
        return;
    }
    spdlog::debug("config {} = {}", key, value);
}

void Config::validate() const {
    const auto& s = scheduler;
    if (!(s.min_ease > 0.0)) {
        throw InvalidArgument("scheduler.min_ease must be positive");
    }
    if (s.default_ease < s.min_ease) {
        throw InvalidArgument("scheduler.default_ease must not be below scheduler.min_ease");
    }
    if (s.again_ease_penalty < 0.0 || s.hard_ease_penalty < 0.0 || s.easy_ease_bonus < 0.0) {
        throw InvalidArgument("ease adjustments must be non-negative");
    }
    if (s.hard_interval_multiplier < 1.0 || s.easy_interval_multiplier < 1.0) {
        throw InvalidArgument("interval multipliers must be at least 1.0");
    }
    if (s.relearn_interval_seconds < 0) {
        throw InvalidArgument("scheduler.relearn_interval_seconds must be non-negative");
    }
    if (s.max_interval_days < 1) {
        throw InvalidArgument("scheduler.max_interval_days must be at least 1");
    }
    if (s.leech_threshold < 1) {
        throw InvalidArgument("scheduler.leech_threshold must be at least 1");
    }
    if (session.max_cards < 0) {
        throw InvalidArgument("session.max_cards must be non-negative");
    }
    if (session.submission_history < 0) {
        throw InvalidArgument("session.submission_history must be non-negative");
    }
    if (store.file.empty() || store.key_file.empty()) {
        throw InvalidArgument("store.file and store.key_file must be set");
    }
}
