#include "Model.hpp"

Model::Model(const std::string& n, ModelKind k,
    const std::vector<std::string>& fieldNames,
    const std::vector<CardTemplate>& cardTemplates)
    : name(n), kind(k), fields(fieldNames), templates(cardTemplates)
{
    for (std::size_t i = 0; i < templates.size(); ++i)
        templates[i].ord = static_cast<int>(i);
}

int Model::fieldIndex(const std::string& fieldName) const {
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (fields[i] == fieldName) return static_cast<int>(i);
    }
    return -1;
}

int Model::clozeFieldIndex() const {
    if (templates.empty()) return 0;

    static const std::string marker = "{{cloze:";
    const std::string& qfmt = templates.front().question_format;
    auto pos = qfmt.find(marker);
    if (pos == std::string::npos) return 0;

    auto start = pos + marker.size();
    auto end = qfmt.find("}}", start);
    if (end == std::string::npos) return 0;

    int idx = fieldIndex(qfmt.substr(start, end - start));
    return idx < 0 ? 0 : idx;
}

Model Model::basic(const std::string& name) {
    return Model(name, ModelKind::Standard, { "Front", "Back" },
        { { "Card 1", 0, "{{Front}}", "{{FrontSide}}<hr id=answer>{{Back}}" } });
}

Model Model::basicAndReversed(const std::string& name) {
    return Model(name, ModelKind::Standard, { "Front", "Back" },
        { { "Card 1", 0, "{{Front}}", "{{FrontSide}}<hr id=answer>{{Back}}" },
          { "Card 2", 1, "{{Back}}", "{{FrontSide}}<hr id=answer>{{Front}}" } });
}

Model Model::cloze(const std::string& name) {
    return Model(name, ModelKind::Cloze, { "Text", "Back Extra" },
        { { "Cloze", 0, "{{cloze:Text}}", "{{cloze:Text}}<br>{{Back Extra}}" } });
}
