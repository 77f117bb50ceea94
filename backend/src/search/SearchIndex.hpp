#pragma once
#include <map>
#include <set>
#include <string>
#include <vector>
#include "../core/EntityStore.hpp"

struct SearchFilter {
    EntityId deck_id = NO_ID;           // NO_ID -> any deck; descendants included
    std::string tag;                    // "" -> any tag; exact membership
    std::size_t limit = 100;
};

struct SearchStats {
    std::size_t notes = 0;
    std::size_t tokens = 0;
};

/*
  Token index over note fields and tags.

  Scoring per (query token, note token) pair: exact 10, prefix 5,
  substring 2. Each tag containing the query token adds 15.
  The index is a snapshot; call indexAll() or the per-note calls after
  editing the store.
*/
class SearchIndex {
public:
    static constexpr int EXACT_SCORE = 10;
    static constexpr int PREFIX_SCORE = 5;
    static constexpr int SUBSTRING_SCORE = 2;
    static constexpr int TAG_SCORE = 15;

    explicit SearchIndex(const EntityStore& store);

    void indexAll();
    void indexNote(EntityId noteId);
    void updateNote(EntityId noteId) { indexNote(noteId); }
    void removeNote(EntityId noteId);

    // Note ids, best first. An empty query matches nothing.
    std::vector<EntityId> search(const std::string& query, const SearchFilter& filter = SearchFilter()) const;

    // Plain text of the note, cut at maxLength bytes with "..." appended.
    std::string getPreview(EntityId noteId, std::size_t maxLength = 100) const;

    SearchStats stats() const;
    bool contains(EntityId noteId) const { return entries.count(noteId) > 0; }

    // Lowercased word tokens of two or more bytes; non-ASCII bytes count as letters.
    static std::vector<std::string> tokenize(const std::string& text);
    static std::string normalize(const std::string& html);

private:
    struct IndexedNote {
        std::set<EntityId> deck_ids;    // home decks of the note's cards
        std::vector<std::string> tokens;
        std::vector<std::string> tags;  // lowercased for scoring
        std::vector<std::string> raw_tags;
        std::string raw_text;
    };

    const EntityStore& store;
    std::map<EntityId, IndexedNote> entries;
};
