#include "TestSuite.hpp"
#include "../src/utils/Config.hpp"

#include <fstream>

namespace {

Json::Value parse(const std::string& text) {
    Json::Value root;
    Config::parseJson(text, root);
    return root;
}

void test_partial_override(TestSuite& suite) {
    SchedulerConfig cfg;
    bool ok = Config::applySchedulerJson(
        parse(R"({"learning_steps": [5, 30, 1440], "easy_bonus": 1.5, "bury_siblings": false})"), cfg);
    suite.require(ok, "valid override accepted");
    suite.require(cfg.learning_steps == std::vector<int>({ 5, 30, 1440 }), "steps replaced");
    suite.require(cfg.easy_bonus == 1.5 && !cfg.bury_siblings, "scalars replaced");
    suite.require(cfg.graduating_interval == 1 && cfg.starting_ease == 2500, "untouched keys keep defaults");

    suite.require(Config::applySchedulerJson(parse(R"({"some_future_key": 3})"), cfg), "unknown key only warned");
    suite.require(Config::applySchedulerJson(parse("{}"), cfg), "empty object is fine");
    suite.require(Config::applySchedulerJson(parse(R"({"ease_hard_delta": 0, "lapse_multiplier": 0.9})"), cfg),
        "flat hard and mild lapse accepted");
}

void test_rejections(TestSuite& suite) {
    SchedulerConfig cfg;

    // the valid ease change must not leak through the bad steps value
    suite.require(!Config::applySchedulerJson(parse(R"({"starting_ease": 3000, "learning_steps": [1, "x"]})"), cfg),
        "non-integer step rejected");
    suite.require(cfg.starting_ease == 2500 && cfg.learning_steps == std::vector<int>({ 1, 10 }),
        "nothing applied on error");

    suite.require(!Config::applySchedulerJson(parse(R"({"rollover_hour": 24})"), cfg), "rollover hour bounded");
    suite.require(!Config::applySchedulerJson(parse(R"({"starting_ease": 1200})"), cfg), "starting below minimum");
    suite.require(!Config::applySchedulerJson(parse(R"({"graduating_interval": "1"})"), cfg), "string for integer");
    suite.require(!Config::applySchedulerJson(parse(R"({"fuzz_fraction": 0.9})"), cfg), "fuzz out of range");
    suite.require(!Config::applySchedulerJson(parse(R"({"bury_siblings": 1})"), cfg), "boolean required");
    suite.require(!Config::applySchedulerJson(parse("[1, 2]"), cfg), "object required");
    suite.require(!Config::applySchedulerJson(parse(R"({"ease_again_delta": 50})"), cfg), "again cannot raise ease");
    suite.require(!Config::applySchedulerJson(parse(R"({"ease_hard_delta": 1})"), cfg), "hard cannot raise ease");
    suite.require(!Config::applySchedulerJson(parse(R"({"lapse_multiplier": 1.0})"), cfg), "lapse must shrink the interval");
    suite.require(cfg.ease_again_delta == -200 && cfg.lapse_multiplier == 0.5, "bounded values untouched");
    suite.require(cfg.rollover_hour == 4 && cfg.bury_siblings, "defaults survive every rejection");
}

void test_files(TestSuite& suite) {
    TempDir dir("config");

    SchedulerConfig cfg;
    suite.require(!Config::loadSchedulerConfig(dir.file("missing.json"), cfg), "missing file reported");
    suite.require(cfg.maximum_interval == 36500, "defaults kept");

    SchedulerConfig custom;
    custom.relearning_steps = { 5, 20 };
    custom.hard_multiplier = 1.1;
    custom.rollover_hour = 2;
    suite.require(Config::saveSchedulerConfig(dir.file("sched.json"), custom), "saved");

    SchedulerConfig loaded;
    suite.require(Config::loadSchedulerConfig(dir.file("sched.json"), loaded), "loaded back");
    suite.require(loaded.relearning_steps == custom.relearning_steps, "steps survive");
    suite.require(loaded.hard_multiplier == 1.1 && loaded.rollover_hour == 2, "values survive");

    {
        std::ofstream broken(dir.file("broken.json"));
        broken << "{ \"easy_interval\": ";
    }
    SchedulerConfig untouched;
    suite.require(!Config::loadSchedulerConfig(dir.file("broken.json"), untouched), "bad JSON reported");
    suite.require(untouched.easy_interval == 4, "bad JSON changes nothing");
}

}  // namespace

int main() {
    Log::initConsole();
    TestSuite suite;

    test_partial_override(suite);
    test_rejections(suite);
    test_files(suite);

    return suite.finish("Config");
}
