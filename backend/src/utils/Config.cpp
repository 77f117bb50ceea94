#include "Config.hpp"
#include <fstream>
#include <sstream>
#include <memory>
#include <set>
#include <spdlog/spdlog.h>

bool Config::parseJson(const std::string& text, Json::Value& out, std::string* errors) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    std::string err;
    bool ok = reader->parse(text.data(), text.data() + text.size(), &out, &err);
    if (!ok && errors) *errors = err;
    return ok;
}

std::string Config::writeJson(const Json::Value& value, bool pretty) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = pretty ? "  " : "";
    return Json::writeString(builder, value);
}

bool Config::readFile(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    std::ostringstream oss;
    oss << in.rdbuf();
    out = oss.str();
    return true;
}

/* -------------------------
   Scheduler config
   ------------------------- */

static bool readInt(const Json::Value& root, const char* key, int& out, int minValue, std::string& problem) {
    if (!root.isMember(key)) return true;
    const Json::Value& v = root[key];
    if (!v.isInt() || v.asInt() < minValue) {
        problem = std::string(key) + " must be an integer >= " + std::to_string(minValue);
        return false;
    }
    out = v.asInt();
    return true;
}

static bool readDouble(const Json::Value& root, const char* key, double& out, double minValue, double maxValue, std::string& problem) {
    if (!root.isMember(key)) return true;
    const Json::Value& v = root[key];
    if (!v.isNumeric() || v.asDouble() < minValue || v.asDouble() > maxValue) {
        problem = std::string(key) + " must be a number within [" +
            std::to_string(minValue) + ", " + std::to_string(maxValue) + "]";
        return false;
    }
    out = v.asDouble();
    return true;
}

static bool readSteps(const Json::Value& root, const char* key, std::vector<int>& out, std::string& problem) {
    if (!root.isMember(key)) return true;
    const Json::Value& v = root[key];
    if (!v.isArray()) {
        problem = std::string(key) + " must be an array of minutes";
        return false;
    }
    std::vector<int> steps;
    for (const auto& s : v) {
        if (!s.isInt() || s.asInt() < 1) {
            problem = std::string(key) + " entries must be positive integers";
            return false;
        }
        steps.push_back(s.asInt());
    }
    out = steps;
    return true;
}

bool Config::applySchedulerJson(const Json::Value& root, SchedulerConfig& cfg) {
    if (!root.isObject()) {
        spdlog::error("Scheduler config must be a JSON object");
        return false;
    }

    static const std::set<std::string> known = {
        "learning_steps", "relearning_steps", "graduating_interval", "easy_interval",
        "starting_ease", "minimum_ease", "ease_again_delta", "ease_hard_delta", "ease_easy_delta",
        "hard_multiplier", "easy_bonus", "interval_modifier", "lapse_multiplier",
        "minimum_lapse_interval", "maximum_interval", "fuzz_fraction", "fuzz_min_interval",
        "leech_threshold", "leech_repeat", "rollover_hour", "bury_siblings"
    };
    for (const auto& name : root.getMemberNames()) {
        if (!known.count(name)) spdlog::warn("Unknown scheduler config key '{}' ignored", name);
    }

    SchedulerConfig next = cfg;
    std::string problem;
    bool ok =
        readSteps(root, "learning_steps", next.learning_steps, problem) &&
        readSteps(root, "relearning_steps", next.relearning_steps, problem) &&
        readInt(root, "graduating_interval", next.graduating_interval, 1, problem) &&
        readInt(root, "easy_interval", next.easy_interval, 1, problem) &&
        readInt(root, "starting_ease", next.starting_ease, 1, problem) &&
        readInt(root, "minimum_ease", next.minimum_ease, 1, problem) &&
        readInt(root, "ease_again_delta", next.ease_again_delta, -100000, problem) &&
        readInt(root, "ease_hard_delta", next.ease_hard_delta, -100000, problem) &&
        readInt(root, "ease_easy_delta", next.ease_easy_delta, -100000, problem) &&
        readDouble(root, "hard_multiplier", next.hard_multiplier, 0.1, 10.0, problem) &&
        readDouble(root, "easy_bonus", next.easy_bonus, 0.1, 10.0, problem) &&
        readDouble(root, "interval_modifier", next.interval_modifier, 0.1, 10.0, problem) &&
        readDouble(root, "lapse_multiplier", next.lapse_multiplier, 0.0, 1.0, problem) &&
        readInt(root, "minimum_lapse_interval", next.minimum_lapse_interval, 1, problem) &&
        readInt(root, "maximum_interval", next.maximum_interval, 1, problem) &&
        readDouble(root, "fuzz_fraction", next.fuzz_fraction, 0.0, 0.5, problem) &&
        readInt(root, "fuzz_min_interval", next.fuzz_min_interval, 1, problem) &&
        readInt(root, "leech_threshold", next.leech_threshold, 1, problem) &&
        readInt(root, "leech_repeat", next.leech_repeat, 1, problem) &&
        readInt(root, "rollover_hour", next.rollover_hour, 0, problem);

    if (ok && root.isMember("bury_siblings")) {
        if (root["bury_siblings"].isBool()) {
            next.bury_siblings = root["bury_siblings"].asBool();
        }
        else {
            problem = "bury_siblings must be a boolean";
            ok = false;
        }
    }
    if (ok && next.rollover_hour > 23) {
        problem = "rollover_hour must be within 0..23";
        ok = false;
    }
    if (ok && (next.ease_again_delta > 0 || next.ease_hard_delta > 0)) {
        problem = "ease_again_delta and ease_hard_delta must not raise the ease";
        ok = false;
    }
    if (ok && next.lapse_multiplier >= 1.0) {
        problem = "lapse_multiplier must be below 1.0";
        ok = false;
    }
    if (ok && next.starting_ease < next.minimum_ease) {
        problem = "starting_ease must not be below minimum_ease";
        ok = false;
    }

    if (!ok) {
        spdlog::error("Invalid scheduler config: {}; keeping previous values", problem);
        return false;
    }

    cfg = next;
    return true;
}

bool Config::loadSchedulerConfig(const std::string& path, SchedulerConfig& cfg) {
    std::string text;
    if (!readFile(path, text)) {
        spdlog::warn("Scheduler config '{}' not found; using defaults", path);
        return false;
    }

    Json::Value root;
    std::string errors;
    if (!parseJson(text, root, &errors)) {
        spdlog::error("Failed to parse scheduler config '{}': {}", path, errors);
        return false;
    }

    if (!applySchedulerJson(root, cfg)) return false;
    spdlog::info("Loaded scheduler config from '{}'", path);
    return true;
}

bool Config::saveSchedulerConfig(const std::string& path, const SchedulerConfig& cfg) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        spdlog::error("Failed to open '{}' for writing scheduler config", path);
        return false;
    }
    out << writeJson(toJson(cfg), true) << "\n";
    return true;
}

Json::Value Config::toJson(const SchedulerConfig& cfg) {
    Json::Value root(Json::objectValue);

    Json::Value learning(Json::arrayValue);
    for (int s : cfg.learning_steps) learning.append(s);
    root["learning_steps"] = learning;

    Json::Value relearning(Json::arrayValue);
    for (int s : cfg.relearning_steps) relearning.append(s);
    root["relearning_steps"] = relearning;

    root["graduating_interval"] = cfg.graduating_interval;
    root["easy_interval"] = cfg.easy_interval;
    root["starting_ease"] = cfg.starting_ease;
    root["minimum_ease"] = cfg.minimum_ease;
    root["ease_again_delta"] = cfg.ease_again_delta;
    root["ease_hard_delta"] = cfg.ease_hard_delta;
    root["ease_easy_delta"] = cfg.ease_easy_delta;
    root["hard_multiplier"] = cfg.hard_multiplier;
    root["easy_bonus"] = cfg.easy_bonus;
    root["interval_modifier"] = cfg.interval_modifier;
    root["lapse_multiplier"] = cfg.lapse_multiplier;
    root["minimum_lapse_interval"] = cfg.minimum_lapse_interval;
    root["maximum_interval"] = cfg.maximum_interval;
    root["fuzz_fraction"] = cfg.fuzz_fraction;
    root["fuzz_min_interval"] = cfg.fuzz_min_interval;
    root["leech_threshold"] = cfg.leech_threshold;
    root["leech_repeat"] = cfg.leech_repeat;
    root["rollover_hour"] = cfg.rollover_hour;
    root["bury_siblings"] = cfg.bury_siblings;
    return root;
}
