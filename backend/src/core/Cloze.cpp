#include "Cloze.hpp"
#include "../utils/Text.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <map>
#include <spdlog/spdlog.h>

static const char OPEN_MARK[] = "{{c";
static const std::size_t OPEN_LEN = 3;
static const std::size_t MAX_INDEX_DIGITS = 6;

enum class RenderMode {
    Question,
    Answer,
    Preview
};

// Finds the "}}" that closes a body starting at `from`, skipping nested {{...}} pairs.
static std::size_t findClose(const std::string& text, std::size_t from) {
    int depth = 0;
    std::size_t j = from;
    while (j + 1 < text.size()) {
        if (text[j] == '{' && text[j + 1] == '{') {
            ++depth;
            j += 2;
        }
        else if (text[j] == '}' && text[j + 1] == '}') {
            if (depth == 0) return j;
            --depth;
            j += 2;
        }
        else {
            ++j;
        }
    }
    return std::string::npos;
}

// First "::" of `body` that is not inside a nested {{...}}.
static std::size_t findHintSeparator(const std::string& body) {
    int depth = 0;
    std::size_t j = 0;
    while (j + 1 < body.size()) {
        if (body[j] == '{' && body[j + 1] == '{') { ++depth; j += 2; continue; }
        if (body[j] == '}' && body[j + 1] == '}') { if (depth > 0) --depth; j += 2; continue; }
        if (depth == 0 && body[j] == ':' && body[j + 1] == ':') return j;
        ++j;
    }
    return std::string::npos;
}

// Parses the marker whose "{{c" sits at `pos`. On failure `problem` says why.
static bool parseMarkerAt(const std::string& text, std::size_t pos, ClozeMarker& out, std::string& problem) {
    std::size_t i = pos + OPEN_LEN;
    const std::size_t digitsBegin = i;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) ++i;

    if (i == digitsBegin) {
        problem = "missing cloze number";
        return false;
    }
    if (i - digitsBegin > MAX_INDEX_DIGITS) {
        problem = "cloze number too large";
        return false;
    }
    if (text.compare(i, 2, "::") != 0) {
        problem = "expected '::' after cloze number";
        return false;
    }

    int index = std::stoi(text.substr(digitsBegin, i - digitsBegin));
    if (index < 1) {
        problem = "cloze number must be at least 1";
        return false;
    }

    std::size_t bodyBegin = i + 2;
    std::size_t close = findClose(text, bodyBegin);
    if (close == std::string::npos) {
        problem = "unterminated cloze";
        return false;
    }

    out.index = index;
    out.begin = pos;
    out.end = close + 2;
    out.body_begin = bodyBegin;
    out.body_end = close;

    std::string body = text.substr(bodyBegin, close - bodyBegin);
    std::size_t sep = findHintSeparator(body);
    if (sep == std::string::npos) {
        out.content = body;
        out.hint.clear();
        out.has_hint = false;
    }
    else {
        out.content = body.substr(0, sep);
        out.hint = body.substr(sep + 2);
        out.has_hint = true;
    }
    return true;
}

static std::string render(const std::string& text, int target, RenderMode mode) {
    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;

    while (pos < text.size()) {
        std::size_t found = text.find(OPEN_MARK, pos);
        if (found == std::string::npos) break;

        ClozeMarker m;
        std::string problem;
        if (!parseMarkerAt(text, found, m, problem)) {
            out.append(text, pos, found + OPEN_LEN - pos);
            pos = found + OPEN_LEN;
            continue;
        }

        out.append(text, pos, found - pos);
        if (m.index == target) {
            if (mode == RenderMode::Answer)
                out += render(m.content, target, mode);
            else if (mode == RenderMode::Question && m.has_hint && !m.hint.empty())
                out += "[" + m.hint + "]";
            else
                out += ClozeEngine::MASK;
        }
        else {
            out += render(m.content, target, mode);
        }
        pos = m.end;
    }

    if (pos < text.size()) out.append(text, pos, std::string::npos);
    return out;
}

std::vector<ClozeMarker> ClozeEngine::markers(const std::string& text) {
    std::vector<ClozeMarker> out;
    std::size_t pos = 0;
    while ((pos = text.find(OPEN_MARK, pos)) != std::string::npos) {
        ClozeMarker m;
        std::string problem;
        if (parseMarkerAt(text, pos, m, problem)) {
            out.push_back(m);
            // keep scanning inside the body so nested markers are seen too
            pos = m.body_begin;
        }
        else {
            pos += OPEN_LEN;
        }
    }
    return out;
}

std::vector<int> ClozeEngine::listIndices(const std::string& text) {
    std::set<int> unique;
    for (const auto& m : markers(text)) unique.insert(m.index);
    return std::vector<int>(unique.begin(), unique.end());
}

int ClozeEngine::count(const std::string& text) {
    return static_cast<int>(listIndices(text).size());
}

int ClozeEngine::nextIndex(const std::string& text) {
    auto indices = listIndices(text);
    if (indices.empty()) return 1;
    return indices.back() + 1;
}

std::string ClozeEngine::renumber(const std::string& text) {
    auto all = markers(text);
    if (all.empty()) return text;

    // first-appearance order
    std::map<int, int> mapping;
    int next = 1;
    for (const auto& m : all) {
        if (mapping.emplace(m.index, next).second) ++next;
    }

    bool gapFree = true;
    int expected = 1;
    for (const auto& entry : mapping) {
        if (entry.first != expected++) { gapFree = false; break; }
    }
    if (gapFree) return text;

    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    for (const auto& m : all) {
        std::size_t digitsBegin = m.begin + OPEN_LEN;
        std::size_t digitsEnd = m.body_begin - 2;
        out.append(text, pos, digitsBegin - pos);
        out += std::to_string(mapping[m.index]);
        pos = digitsEnd;
    }
    out.append(text, pos, std::string::npos);

    spdlog::debug("Renumbered {} cloze index(es)", mapping.size());
    return out;
}

std::vector<ClozePreview> ClozeEngine::extractPreviews(const std::string& text) {
    std::vector<ClozePreview> previews;
    for (int index : listIndices(text)) {
        ClozePreview p;
        p.index = index;
        p.text = Text::plainText(render(text, index, RenderMode::Preview));
        previews.push_back(p);
    }
    return previews;
}

std::vector<ClozeIssue> ClozeEngine::validate(const std::string& text) {
    std::vector<ClozeIssue> issues;
    std::set<int> present;

    std::size_t pos = 0;
    while ((pos = text.find(OPEN_MARK, pos)) != std::string::npos) {
        ClozeMarker m;
        std::string problem;
        if (!parseMarkerAt(text, pos, m, problem)) {
            issues.push_back({ ClozeIssue::Kind::Malformed, 0,
                "Malformed cloze at offset " + std::to_string(pos) + ": " + problem });
            pos += OPEN_LEN;
            continue;
        }

        present.insert(m.index);
        if (Text::trim(m.content).empty()) {
            issues.push_back({ ClozeIssue::Kind::EmptyContent, m.index,
                "Empty cloze deletion c" + std::to_string(m.index) });
        }
        pos = m.body_begin;
    }

    if (!present.empty()) {
        for (int n = 1; n < *present.rbegin(); ++n) {
            if (!present.count(n)) {
                issues.push_back({ ClozeIssue::Kind::NumberingGap, n,
                    "Gap in cloze numbering: c" + std::to_string(n) + " is missing" });
            }
        }
    }

    return issues;
}

ClozeInsertion ClozeEngine::insertAt(const std::string& text, TextSelection selection, int explicitIndex) {
    std::size_t start = std::min(selection.start, text.size());
    std::size_t end = std::min(selection.end, text.size());
    if (start > end) std::swap(start, end);

    int index = explicitIndex > 0 ? explicitIndex : nextIndex(text);
    std::string selected = text.substr(start, end - start);
    std::string body = selected.empty() ? std::string(PLACEHOLDER) : selected;
    std::string head = std::string(OPEN_MARK) + std::to_string(index) + "::";

    ClozeInsertion result;
    result.text = text.substr(0, start) + head + body + "}}" + text.substr(end);
    result.selection.start = start + head.size();
    result.selection.end = result.selection.start + body.size();
    return result;
}

std::string ClozeEngine::renderQuestion(const std::string& text, int index) {
    return render(text, index, RenderMode::Question);
}

std::string ClozeEngine::renderAnswer(const std::string& text, int index) {
    return render(text, index, RenderMode::Answer);
}
