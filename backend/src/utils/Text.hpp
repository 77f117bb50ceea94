#pragma once
#include <string>
#include <vector>

// Small string helpers shared by the cloze previews, the search index and
// the importer. All of them treat text as UTF-8 bytes and only fold ASCII.
namespace Text
{
    // Removes <...> tags. Each tag becomes a single space when tagsToSpace is set.
    std::string stripTags(const std::string& html, bool tagsToSpace = false);

    // Decodes &nbsp; &lt; &gt; &amp; (and &quot;), leaves anything else alone.
    std::string decodeEntities(const std::string& text);

    // Runs of whitespace become one space; leading/trailing whitespace dropped.
    std::string collapseWhitespace(const std::string& text);

    std::string toLower(std::string text);
    std::string trim(const std::string& text);

    // Markup -> readable single-line text (tags, entities, whitespace).
    std::string plainText(const std::string& html);

    std::vector<std::string> splitWhitespace(const std::string& text);
    std::vector<std::string> split(const std::string& text, char separator);
    std::string join(const std::vector<std::string>& parts, const std::string& separator);

    bool startsWith(const std::string& text, const std::string& prefix);

    // Replaces every occurrence of `from` with `to`, returns the count replaced.
    std::size_t replaceAll(std::string& text, const std::string& from, const std::string& to);
}
