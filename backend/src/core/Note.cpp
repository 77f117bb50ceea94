#include "Note.hpp"
#include "Errors.hpp"
#include "../utils/Text.hpp"
#include <chrono>
#include <random>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

std::vector<std::string> Note::fieldValues() const {
    return Text::split(fields, FIELD_SEPARATOR);
}

std::string Note::fieldValue(std::size_t index) const {
    auto values = fieldValues();
    if (index >= values.size()) return {};
    return values[index];
}

int Note::fieldCount() const {
    return static_cast<int>(std::count(fields.begin(), fields.end(), FIELD_SEPARATOR)) + 1;
}

void Note::setFieldValues(const std::vector<std::string>& values) {
    fields = packFields(values);
}

std::string Note::packFields(const std::vector<std::string>& values) {
    for (const auto& v : values) {
        if (v.find(FIELD_SEPARATOR) != std::string::npos)
            throw IntegrityError("Field value contains the reserved field separator");
    }
    return Text::join(values, std::string(1, FIELD_SEPARATOR));
}

void Note::addTag(const std::string& tag) {
    std::string t = Text::trim(tag);
    if (t.empty()) return;
    // tags are single words
    if (std::any_of(t.begin(), t.end(), [](unsigned char c) { return std::isspace(c); })) {
        spdlog::warn("Note ID={} addTag rejected '{}' (contains whitespace)", id, t);
        return;
    }

    if (!hasTag(t)) {
        tags.push_back(t);
        spdlog::debug("Note ID={} addTag '{}'", id, t);
    }
}

bool Note::removeTag(const std::string& tag) {
    std::string wanted = Text::toLower(tag);
    auto it = std::find_if(tags.begin(), tags.end(),
        [&](const std::string& t) { return Text::toLower(t) == wanted; });
    if (it != tags.end()) {
        tags.erase(it);
        spdlog::debug("Note ID={} removeTag '{}'", id, tag);
        return true;
    }
    return false;
}

bool Note::hasTag(const std::string& tag) const {
    std::string wanted = Text::toLower(tag);
    return std::any_of(tags.begin(), tags.end(),
        [&](const std::string& t) { return Text::toLower(t) == wanted; });
}

void Note::setTags(const std::vector<std::string>& newTags) {
    tags.clear();
    for (const auto& t : newTags) {
        for (const auto& word : Text::splitWhitespace(t))
            addTag(word);
    }
    spdlog::debug("Note ID={} setTags count={}", id, tags.size());
}

std::string Note::tagsAsLine() const {
    if (tags.empty()) return " ";
    return " " + Text::join(tags, " ") + " ";
}

std::vector<std::string> Note::parseTags(const std::string& line) {
    std::vector<std::string> out;
    for (const auto& word : Text::splitWhitespace(line)) {
        std::string lowered = Text::toLower(word);
        bool seen = std::any_of(out.begin(), out.end(),
            [&](const std::string& t) { return Text::toLower(t) == lowered; });
        if (!seen) out.push_back(word);
    }
    return out;
}

// Simple unique ID generator (timestamp + random bits)
std::string Note::generateGuid() {
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
