#pragma once
#include <map>
#include <vector>
#include <string>
#include <ctime>
#include <utility>
#include "Schema.hpp"
#include "Model.hpp"
#include "Note.hpp"
#include "Card.hpp"
#include "Deck.hpp"

/*
  In-memory tables for models, decks, notes, cards and the review log.

  Invariants kept by every public mutator:
   - a note references an existing model and carries exactly its field count
   - a card references an existing note and deck
   - at most one card per (note id, template ordinal)
   - cloze notes own one live card per distinct cloze index
   - ids only grow: allocateId() is above every id ever stored

  The store is a value type. Callers needing all-or-nothing updates (the
  importer) mutate a copy and swap it in.
*/

struct CollectionInfo {
    std::time_t created_at = 0;         // origin of Review day counters
    int rollover_hour = 4;              // study day starts at this UTC hour
    std::int64_t next_position = 1;     // due value of the next New card
};

enum class DeleteMode {
    Soft,
    Hard
};

// What a field edit did to the note's cards.
struct NoteEdit {
    std::vector<EntityId> added;        // newly generated cards
    std::vector<EntityId> orphaned;     // soft-deleted, history kept
    std::vector<EntityId> restored;     // soft-deleted cards brought back
};

class EntityStore {
public:
    EntityStore();
    explicit EntityStore(std::time_t createdAt, int rolloverHour = 4);

    // Collection
    const CollectionInfo& info() const { return collection; }
    void setRolloverHour(int hour);
    int today(std::time_t now) const;
    std::time_t dayStart(int dayCounter) const;
    EntityId allocateId();
    std::int64_t takeNextPosition();

    // Models
    EntityId addModel(Model model);
    const Model* getModel(EntityId id) const;
    std::vector<const Model*> models() const;
    const Model* findModelByName(const std::string& name) const;
    void addField(EntityId modelId, const std::string& fieldName);
    void addTemplate(EntityId modelId, CardTemplate tmpl);

    // Decks
    EntityId addDeck(const std::string& name, DeckLimits limits = DeckLimits());
    EntityId addFilteredDeck(const std::string& name);
    EntityId insertDeck(Deck deck);
    const Deck* getDeck(EntityId id) const;
    const Deck* findDeckByName(const std::string& name) const;
    std::vector<const Deck*> decks() const;
    std::vector<EntityId> deckAndDescendants(EntityId deckId) const;
    void renameDeck(EntityId deckId, const std::string& newName);
    void setDeckLimits(EntityId deckId, DeckLimits limits);
    void setDeckCollapsed(EntityId deckId, bool collapsed);
    bool removeDeck(EntityId deckId);

    // Notes
    EntityId addNote(EntityId modelId, EntityId deckId,
        const std::vector<std::string>& fieldValues,
        const std::vector<std::string>& tags = {},
        std::time_t now = 0);
    const Note* getNote(EntityId id) const;
    std::vector<const Note*> notes(bool includeDeleted = false) const;
    NoteEdit updateNoteFields(EntityId noteId, const std::vector<std::string>& fieldValues, std::time_t now = 0);
    void setNoteTags(EntityId noteId, const std::vector<std::string>& tags);
    void deleteNote(EntityId noteId, DeleteMode mode = DeleteMode::Soft);
    void restoreNote(EntityId noteId);

    // Cards
    const Card* getCard(EntityId id) const;
    const Card* findCard(EntityId noteId, int ord) const;
    std::vector<const Card*> cards(bool includeDeleted = false) const;
    std::vector<const Card*> cardsOfNote(EntityId noteId, bool includeDeleted = false) const;
    std::vector<const Card*> cardsInDeckTree(EntityId deckId) const;

    // Swaps in a full card row; identity (note, ordinal) cannot change.
    void replaceCard(const Card& card);

    // Review log
    void appendReview(const ReviewLogEntry& entry);
    const std::vector<ReviewLogEntry>& reviewLog() const { return review_log; }

    // Raw inserts for already-remapped rows (importer, persistence).
    // Same referential checks as the high-level calls.
    void insertModel(const Model& model);
    void insertNote(const Note& note);
    void insertCard(const Card& card);
    void restoreCollectionInfo(const CollectionInfo& info);

    std::size_t modelCount() const { return model_table.size(); }
    std::size_t deckCount() const { return deck_table.size(); }
    std::size_t noteCount() const { return note_table.size(); }
    std::size_t cardCount() const { return card_table.size(); }

private:
    CollectionInfo collection;
    EntityId last_id = NO_ID;

    std::map<EntityId, Model> model_table;
    std::map<EntityId, Deck> deck_table;
    std::map<EntityId, Note> note_table;
    std::map<EntityId, Card> card_table;
    std::map<std::pair<EntityId, int>, EntityId> card_by_ordinal;
    std::vector<ReviewLogEntry> review_log;

    void trackId(EntityId id);
    Model& modelRef(EntityId id);
    Deck& deckRef(EntityId id);
    Note& noteRef(EntityId id);
    void checkFields(const Model& model, const std::vector<std::string>& values) const;
    std::vector<int> ordinalsFor(const Model& model, const Note& note) const;
    EntityId createCard(const Note& note, EntityId deckId, int ord, std::time_t now);
    EntityId defaultDeckFor(EntityId noteId) const;
};
