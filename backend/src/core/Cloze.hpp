#pragma once
#include <string>
#include <vector>
#include <cstddef>

/*
  Cloze deletions: {{cN::content}} or {{cN::content::hint}}, N >= 1.
  Content may carry arbitrary markup, including <img> tags and nested
  cloze markers. Everything here is a pure function of the input text.
*/

struct ClozeMarker {
    int index = 0;              // N, 0 when the number is missing
    std::size_t begin = 0;      // offset of "{{c"
    std::size_t end = 0;        // one past the closing "}}"
    std::size_t body_begin = 0; // first byte after "::"
    std::size_t body_end = 0;   // offset of the closing "}}"
    std::string content;
    std::string hint;
    bool has_hint = false;
};

struct ClozeIssue {
    enum class Kind {
        NumberingGap,
        EmptyContent,
        Malformed
    };

    Kind kind;
    int index = 0;
    std::string message;
};

struct ClozePreview {
    int index = 0;
    std::string text;
};

struct TextSelection {
    std::size_t start = 0;
    std::size_t end = 0;
};

struct ClozeInsertion {
    std::string text;
    TextSelection selection;
};

class ClozeEngine {
public:
    static constexpr const char* MASK = "[...]";
    static constexpr const char* PLACEHOLDER = "text";

    // Every well-formed marker, outer markers before the ones nested inside them.
    static std::vector<ClozeMarker> markers(const std::string& text);

    // Distinct indices, ascending.
    static std::vector<int> listIndices(const std::string& text);
    static int count(const std::string& text);
    static int nextIndex(const std::string& text);

    // Remaps indices to 1..K in order of first appearance. Text whose indices
    // are already exactly 1..K is returned unchanged.
    static std::string renumber(const std::string& text);

    // One preview per distinct index: that index masked, the others shown.
    static std::vector<ClozePreview> extractPreviews(const std::string& text);

    // Reports gaps, empty bodies and broken markers. Never rejects the text.
    static std::vector<ClozeIssue> validate(const std::string& text);

    // Wraps the selection in a marker (explicitIndex <= 0 means nextIndex()).
    // An empty selection gets PLACEHOLDER as the body, selected on return.
    static ClozeInsertion insertAt(const std::string& text, TextSelection selection, int explicitIndex = 0);

    // Renders the card side for `index`: that index masked (hint shown when
    // present), all other markers replaced by their content. Markup is kept.
    static std::string renderQuestion(const std::string& text, int index);
    static std::string renderAnswer(const std::string& text, int index);
};
