#include "Text.hpp"
#include <cctype>
#include <sstream>

namespace Text
{
    std::string stripTags(const std::string& html, bool tagsToSpace) {
        std::string out;
        out.reserve(html.size());
        bool inTag = false;
        for (char c : html) {
            if (inTag) {
                if (c == '>') {
                    inTag = false;
                    if (tagsToSpace) out.push_back(' ');
                }
                continue;
            }
            if (c == '<') {
                inTag = true;
                continue;
            }
            out.push_back(c);
        }
        // An unterminated '<' is not a tag; put the tail back.
        if (inTag) {
            auto pos = html.rfind('<');
            out += html.substr(pos);
        }
        return out;
    }

    std::string decodeEntities(const std::string& text) {
        static const struct { const char* entity; const char* value; } table[] = {
            { "&nbsp;", " " },
            { "&lt;", "<" },
            { "&gt;", ">" },
            { "&quot;", "\"" },
            { "&amp;", "&" },
        };

        std::string out;
        out.reserve(text.size());
        for (std::size_t i = 0; i < text.size();) {
            bool matched = false;
            if (text[i] == '&') {
                for (const auto& e : table) {
                    std::size_t len = std::char_traits<char>::length(e.entity);
                    if (text.compare(i, len, e.entity) == 0) {
                        out += e.value;
                        i += len;
                        matched = true;
                        break;
                    }
                }
            }
            if (!matched) out.push_back(text[i++]);
        }
        return out;
    }

    std::string collapseWhitespace(const std::string& text) {
        std::string out;
        out.reserve(text.size());
        bool pendingSpace = false;
        for (char c : text) {
            if (std::isspace(static_cast<unsigned char>(c))) {
                pendingSpace = !out.empty();
                continue;
            }
            if (pendingSpace) {
                out.push_back(' ');
                pendingSpace = false;
            }
            out.push_back(c);
        }
        return out;
    }

    std::string toLower(std::string text) {
        for (auto& c : text)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return text;
    }

    std::string trim(const std::string& text) {
        std::string t = text;
        while (!t.empty() && std::isspace((unsigned char)t.front())) t.erase(t.begin());
        while (!t.empty() && std::isspace((unsigned char)t.back())) t.pop_back();
        return t;
    }

    std::string plainText(const std::string& html) {
        return collapseWhitespace(decodeEntities(stripTags(html, true)));
    }

    std::vector<std::string> splitWhitespace(const std::string& text) {
        std::vector<std::string> out;
        std::istringstream iss(text);
        std::string word;
        while (iss >> word) out.push_back(word);
        return out;
    }

    std::vector<std::string> split(const std::string& text, char separator) {
        std::vector<std::string> out;
        std::size_t start = 0;
        while (true) {
            auto pos = text.find(separator, start);
            if (pos == std::string::npos) {
                out.push_back(text.substr(start));
                break;
            }
            out.push_back(text.substr(start, pos - start));
            start = pos + 1;
        }
        return out;
    }

    std::string join(const std::vector<std::string>& parts, const std::string& separator) {
        std::string out;
        for (std::size_t i = 0; i < parts.size(); ++i) {
            if (i) out += separator;
            out += parts[i];
        }
        return out;
    }

    bool startsWith(const std::string& text, const std::string& prefix) {
        return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
    }

    std::size_t replaceAll(std::string& text, const std::string& from, const std::string& to) {
        if (from.empty()) return 0;
        std::size_t count = 0;
        std::size_t pos = 0;
        while ((pos = text.find(from, pos)) != std::string::npos) {
            text.replace(pos, from.size(), to);
            pos += to.size();
            ++count;
        }
        return count;
    }
}
