#include "SearchIndex.hpp"
#include "../utils/Text.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

static bool isWordByte(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
        c == '_' || c >= 0x80;
}

SearchIndex::SearchIndex(const EntityStore& entityStore)
    : store(entityStore)
{
}

std::string SearchIndex::normalize(const std::string& html) {
    std::string text = Text::stripTags(html, true);
    text = Text::decodeEntities(text);
    std::replace(text.begin(), text.end(), FIELD_SEPARATOR, ' ');
    return Text::collapseWhitespace(text);
}

std::vector<std::string> SearchIndex::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : text) {
        if (isWordByte(static_cast<unsigned char>(c))) {
            current.push_back(c);
            continue;
        }
        if (current.size() > 1) tokens.push_back(Text::toLower(current));
        current.clear();
    }
    if (current.size() > 1) tokens.push_back(Text::toLower(current));
    return tokens;
}

void SearchIndex::indexAll() {
    entries.clear();
    for (const Note* note : store.notes()) indexNote(note->id);

    SearchStats s = stats();
    spdlog::info("[SearchIndex] Indexed {} notes ({} tokens)", s.notes, s.tokens);
}

void SearchIndex::indexNote(EntityId noteId) {
    const Note* note = store.getNote(noteId);
    if (!note || note->deleted) {
        entries.erase(noteId);
        return;
    }

    IndexedNote entry;
    for (const Card* card : store.cardsOfNote(noteId)) {
        entry.deck_ids.insert(card->isRelocated() ? card->original_deck : card->deck_id);
        entry.deck_ids.insert(card->deck_id);
    }
    entry.raw_text = normalize(note->fields);
    entry.tokens = tokenize(entry.raw_text);
    entry.raw_tags = note->tags;
    for (const auto& tag : note->tags) entry.tags.push_back(Text::toLower(tag));

    entries[noteId] = std::move(entry);
}

void SearchIndex::removeNote(EntityId noteId) {
    entries.erase(noteId);
}

std::vector<EntityId> SearchIndex::search(const std::string& query, const SearchFilter& filter) const {
    std::vector<EntityId> out;
    const auto queryTokens = tokenize(normalize(query));
    if (queryTokens.empty() || filter.limit == 0) return out;

    std::set<EntityId> deckScope;
    if (filter.deck_id != NO_ID) {
        auto ids = store.deckAndDescendants(filter.deck_id);
        deckScope.insert(ids.begin(), ids.end());
        deckScope.insert(filter.deck_id);
    }

    std::vector<std::pair<EntityId, int>> scored;
    for (const auto& e : entries) {
        const IndexedNote& indexed = e.second;

        if (!deckScope.empty()) {
            bool inScope = std::any_of(indexed.deck_ids.begin(), indexed.deck_ids.end(),
                [&deckScope](EntityId id) { return deckScope.count(id) > 0; });
            if (!inScope) continue;
        }
        if (!filter.tag.empty() &&
            std::find(indexed.raw_tags.begin(), indexed.raw_tags.end(), filter.tag) == indexed.raw_tags.end())
            continue;

        int score = 0;
        for (const auto& q : queryTokens) {
            for (const auto& token : indexed.tokens) {
                if (token == q) score += EXACT_SCORE;
                else if (Text::startsWith(token, q)) score += PREFIX_SCORE;
                else if (token.find(q) != std::string::npos) score += SUBSTRING_SCORE;
            }
            for (const auto& tag : indexed.tags) {
                if (tag.find(q) != std::string::npos) score += TAG_SCORE;
            }
        }
        if (score > 0) scored.emplace_back(e.first, score);
    }

    std::stable_sort(scored.begin(), scored.end(),
        [](const std::pair<EntityId, int>& a, const std::pair<EntityId, int>& b) { return a.second > b.second; });

    if (scored.size() > filter.limit) scored.resize(filter.limit);
    out.reserve(scored.size());
    for (const auto& s : scored) out.push_back(s.first);

    spdlog::debug("[SearchIndex] '{}' -> {} result(s)", query, out.size());
    return out;
}

std::string SearchIndex::getPreview(EntityId noteId, std::size_t maxLength) const {
    auto it = entries.find(noteId);
    if (it == entries.end()) return "";

    const std::string& text = it->second.raw_text;
    if (text.size() <= maxLength) return text;

    // don't cut a UTF-8 sequence in half
    std::size_t cut = maxLength;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
    return text.substr(0, cut) + "...";
}

SearchStats SearchIndex::stats() const {
    SearchStats s;
    s.notes = entries.size();
    for (const auto& e : entries) s.tokens += e.second.tokens.size();
    return s;
}
