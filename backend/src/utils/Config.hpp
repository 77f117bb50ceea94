#pragma once
#include <string>
#include <json/json.h>
#include "../core/SchedulerConfig.hpp"

namespace Config
{
    // JSON text helpers shared by the config loader, the importer and storage.
    bool parseJson(const std::string& text, Json::Value& out, std::string* errors = nullptr);
    std::string writeJson(const Json::Value& value, bool pretty = false);
    bool readFile(const std::string& path, std::string& out);

    // Overrides any subset of `cfg`. On a type or range error nothing is
    // applied and false is returned. Unknown keys are only warned about.
    bool applySchedulerJson(const Json::Value& root, SchedulerConfig& cfg);

    // Missing file -> defaults kept, returns false.
    bool loadSchedulerConfig(const std::string& path, SchedulerConfig& cfg);
    bool saveSchedulerConfig(const std::string& path, const SchedulerConfig& cfg);

    Json::Value toJson(const SchedulerConfig& cfg);
}
