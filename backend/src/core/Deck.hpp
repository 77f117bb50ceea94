#pragma once
#include <string>
#include <vector>
#include <ctime>
#include "Schema.hpp"

struct DeckLimits {
    int new_per_day = 20;
    int reviews_per_day = 200;
};

// Hierarchy is never stored: "A::B" is a child of "A" because of its name.
class Deck {
public:
    Deck() = default;
    Deck(EntityId deckId, const std::string& deckName);

    EntityId id = NO_ID;
    std::string name;
    std::string description;
    DeckLimits limits;
    bool collapsed = false;
    bool browser_collapsed = false;
    bool is_filtered = false;
    std::time_t modified = 0;

    bool isSelfOrDescendantOf(const std::string& ancestor) const;
};

namespace DeckPath
{
    std::vector<std::string> components(const std::string& name);

    // Trims every level; "" when a level ends up empty.
    std::string normalize(const std::string& name);
    bool isValid(const std::string& name);

    std::string parent(const std::string& name);  // "" for a top-level deck
    std::string leaf(const std::string& name);
    int depth(const std::string& name);

    bool isDescendant(const std::string& name, const std::string& ancestor);
    bool isSelfOrDescendant(const std::string& name, const std::string& ancestor);

    // "Old::X" -> "New::X" when name sits under oldPrefix, otherwise unchanged
    std::string reparent(const std::string& name, const std::string& oldPrefix, const std::string& newPrefix);
}
