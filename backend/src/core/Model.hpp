#pragma once
#include <string>
#include <vector>
#include <ctime>
#include "Schema.hpp"

struct CardTemplate {
    std::string name;
    int ord = 0;
    std::string question_format;
    std::string answer_format;
};

// A note type: field names plus card templates.
class Model {
public:
    Model() = default;
    Model(const std::string& name, ModelKind kind,
        const std::vector<std::string>& fieldNames,
        const std::vector<CardTemplate>& cardTemplates);

    EntityId id = NO_ID;
    std::string name;
    ModelKind kind = ModelKind::Standard;
    std::vector<std::string> fields;
    std::vector<CardTemplate> templates;
    int sort_field = 0;
    std::string css;
    std::time_t modified = 0;

    bool isCloze() const { return kind == ModelKind::Cloze; }
    int fieldCount() const { return static_cast<int>(fields.size()); }

    // -1 when no field has that name
    int fieldIndex(const std::string& fieldName) const;

    // Field holding the cloze text: the one named by {{cloze:Name}} in the
    // first template, or the first field.
    int clozeFieldIndex() const;

    // Stock note types used by the CLI and the tests
    static Model basic(const std::string& name = "Basic");
    static Model basicAndReversed(const std::string& name = "Basic (and reversed card)");
    static Model cloze(const std::string& name = "Cloze");
};
