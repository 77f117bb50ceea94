#pragma once
#include <string>
#include <vector>
#include <ctime>
#include "Schema.hpp"

class Note {
public:
    Note() = default;

    EntityId id = NO_ID;
    EntityId model_id = NO_ID;
    std::string guid;
    std::string fields;                 // values joined by FIELD_SEPARATOR
    std::vector<std::string> tags;
    std::time_t modified = 0;
    bool deleted = false;

    std::vector<std::string> fieldValues() const;
    std::string fieldValue(std::size_t index) const;
    int fieldCount() const;

    // Throws IntegrityError when a value contains FIELD_SEPARATOR.
    void setFieldValues(const std::vector<std::string>& values);
    static std::string packFields(const std::vector<std::string>& values);

    // Tag helpers; membership is case-insensitive
    void addTag(const std::string& tag);
    bool removeTag(const std::string& tag); // returns true if removed
    bool hasTag(const std::string& tag) const;
    void setTags(const std::vector<std::string>& newTags);
    std::string tagsAsLine() const;     // " tag1 tag2 " as stored in packages
    static std::vector<std::string> parseTags(const std::string& line);

    // Utility
    static std::string generateGuid();
};
