#pragma once
#include <string>

// Tuning for Scheduler. Defaults give classic SM-2 family behaviour.
struct SchedulerConfig {
    double default_ease = 2.5;
    double min_ease = 1.3;
    double again_ease_penalty = 0.20;
    double hard_ease_penalty = 0.15;
    double easy_ease_bonus = 0.15;
    double hard_interval_multiplier = 1.2;
    double easy_interval_multiplier = 1.3;
    long relearn_interval_seconds = 0; // due again this long after a lapse
    int max_interval_days = 36500;
    int leech_threshold = 8;
};

struct SessionConfig {
    int max_cards = 20;              // queue snapshot cap, 0 = unlimited
    int submission_history = 32;     // remembered submission tokens per session
};

struct LogConfig {
    std::string file = "flashgram.log";
    std::string level = "debug";
};

struct StoreConfig {
    std::string file = "flashgram.dat";
    std::string key_file = "flashgram.key";
};

class Config {
public:
    SchedulerConfig scheduler;
    SessionConfig session;
    LogConfig log;
    StoreConfig store;

    // Reads "key = value" lines. Missing file throws NotFound, bad values
    // throw InvalidArgument. The result is validated before returning.
    static Config loadFromFile(const std::string& path);

    // Same format as loadFromFile, applied on top of the current values.
    void apply(const std::string& text);

    void validate() const;

private:
    void set(const std::string& key, const std::string& value);
};
