#include "Deck.hpp"
#include "../utils/Text.hpp"

Deck::Deck(EntityId deckId, const std::string& deckName)
    : id(deckId), name(deckName)
{
}

bool Deck::isSelfOrDescendantOf(const std::string& ancestor) const {
    return DeckPath::isSelfOrDescendant(name, ancestor);
}

namespace DeckPath
{
    static const std::string SEP = DECK_SEPARATOR;

    std::vector<std::string> components(const std::string& name) {
        std::vector<std::string> out;
        std::size_t start = 0;
        while (true) {
            auto pos = name.find(SEP, start);
            if (pos == std::string::npos) {
                out.push_back(name.substr(start));
                break;
            }
            out.push_back(name.substr(start, pos - start));
            start = pos + SEP.size();
        }
        return out;
    }

    std::string normalize(const std::string& name) {
        auto parts = components(name);
        for (auto& p : parts) {
            p = Text::trim(p);
            if (p.empty()) return {};
        }
        return Text::join(parts, SEP);
    }

    bool isValid(const std::string& name) {
        return !name.empty() && normalize(name) == name;
    }

    std::string parent(const std::string& name) {
        auto pos = name.rfind(SEP);
        if (pos == std::string::npos) return {};
        return name.substr(0, pos);
    }

    std::string leaf(const std::string& name) {
        auto pos = name.rfind(SEP);
        if (pos == std::string::npos) return name;
        return name.substr(pos + SEP.size());
    }

    int depth(const std::string& name) {
        return static_cast<int>(components(name).size());
    }

    bool isDescendant(const std::string& name, const std::string& ancestor) {
        return !ancestor.empty() && Text::startsWith(name, ancestor + SEP);
    }

    bool isSelfOrDescendant(const std::string& name, const std::string& ancestor) {
        return name == ancestor || isDescendant(name, ancestor);
    }

    std::string reparent(const std::string& name, const std::string& oldPrefix, const std::string& newPrefix) {
        if (name == oldPrefix) return newPrefix;
        if (isDescendant(name, oldPrefix)) return newPrefix + name.substr(oldPrefix.size());
        return name;
    }
}
