#include "EntityStore.hpp"
#include "Cloze.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <limits>
#include <set>
#include <spdlog/spdlog.h>

static constexpr std::int64_t SECONDS_PER_DAY = 24 * 60 * 60;

// Day number of a timestamp once the rollover hour is taken into account.
static std::int64_t dayNumber(std::time_t ts, int rolloverHour) {
    std::int64_t shifted = static_cast<std::int64_t>(ts) - rolloverHour * 3600;
    if (shifted >= 0) return shifted / SECONDS_PER_DAY;
    return -((-shifted + SECONDS_PER_DAY - 1) / SECONDS_PER_DAY);
}

static std::time_t resolveNow(std::time_t now) {
    return now != 0 ? now : std::time(nullptr);
}

EntityStore::EntityStore()
    : EntityStore(std::time(nullptr))
{
}

EntityStore::EntityStore(std::time_t createdAt, int rolloverHour) {
    collection.created_at = createdAt;
    collection.rollover_hour = rolloverHour;
    collection.next_position = 1;
    spdlog::debug("EntityStore created: crt={} rollover={}", createdAt, rolloverHour);
}

/* -------------------------
   Collection
   ------------------------- */

void EntityStore::setRolloverHour(int hour) {
    if (hour < 0 || hour > 23)
        throw IntegrityError("Rollover hour must be within 0..23");
    collection.rollover_hour = hour;
}

int EntityStore::today(std::time_t now) const {
    return static_cast<int>(dayNumber(now, collection.rollover_hour) -
        dayNumber(collection.created_at, collection.rollover_hour));
}

std::time_t EntityStore::dayStart(int dayCounter) const {
    std::int64_t origin = dayNumber(collection.created_at, collection.rollover_hour);
    return static_cast<std::time_t>((origin + dayCounter) * SECONDS_PER_DAY +
        collection.rollover_hour * 3600);
}

EntityId EntityStore::allocateId() {
    // package ids are epoch millis; start from the collection's creation time
    EntityId floor = static_cast<EntityId>(collection.created_at) * 1000;
    last_id = std::max(last_id + 1, floor);
    return last_id;
}

std::int64_t EntityStore::takeNextPosition() {
    return collection.next_position++;
}

void EntityStore::trackId(EntityId id) {
    last_id = std::max(last_id, id);
}

void EntityStore::restoreCollectionInfo(const CollectionInfo& info) {
    collection = info;
}

/* -------------------------
   Lookups
   ------------------------- */

Model& EntityStore::modelRef(EntityId id) {
    auto it = model_table.find(id);
    if (it == model_table.end())
        throw IntegrityError("Model " + std::to_string(id) + " not found");
    return it->second;
}

Deck& EntityStore::deckRef(EntityId id) {
    auto it = deck_table.find(id);
    if (it == deck_table.end())
        throw IntegrityError("Deck " + std::to_string(id) + " not found");
    return it->second;
}

Note& EntityStore::noteRef(EntityId id) {
    auto it = note_table.find(id);
    if (it == note_table.end())
        throw IntegrityError("Note " + std::to_string(id) + " not found");
    return it->second;
}

const Model* EntityStore::getModel(EntityId id) const {
    auto it = model_table.find(id);
    return it == model_table.end() ? nullptr : &it->second;
}

const Deck* EntityStore::getDeck(EntityId id) const {
    auto it = deck_table.find(id);
    return it == deck_table.end() ? nullptr : &it->second;
}

const Note* EntityStore::getNote(EntityId id) const {
    auto it = note_table.find(id);
    return it == note_table.end() ? nullptr : &it->second;
}

const Card* EntityStore::getCard(EntityId id) const {
    auto it = card_table.find(id);
    return it == card_table.end() ? nullptr : &it->second;
}

const Card* EntityStore::findCard(EntityId noteId, int ord) const {
    auto it = card_by_ordinal.find({ noteId, ord });
    return it == card_by_ordinal.end() ? nullptr : getCard(it->second);
}

std::vector<const Model*> EntityStore::models() const {
    std::vector<const Model*> out;
    for (const auto& m : model_table) out.push_back(&m.second);
    return out;
}

const Model* EntityStore::findModelByName(const std::string& name) const {
    for (const auto& m : model_table) {
        if (m.second.name == name) return &m.second;
    }
    return nullptr;
}

std::vector<const Deck*> EntityStore::decks() const {
    std::vector<const Deck*> out;
    for (const auto& d : deck_table) out.push_back(&d.second);
    return out;
}

const Deck* EntityStore::findDeckByName(const std::string& name) const {
    for (const auto& d : deck_table) {
        if (d.second.name == name) return &d.second;
    }
    return nullptr;
}

std::vector<const Note*> EntityStore::notes(bool includeDeleted) const {
    std::vector<const Note*> out;
    for (const auto& n : note_table) {
        if (includeDeleted || !n.second.deleted) out.push_back(&n.second);
    }
    return out;
}

std::vector<const Card*> EntityStore::cards(bool includeDeleted) const {
    std::vector<const Card*> out;
    for (const auto& c : card_table) {
        if (includeDeleted || !c.second.deleted) out.push_back(&c.second);
    }
    return out;
}

std::vector<const Card*> EntityStore::cardsOfNote(EntityId noteId, bool includeDeleted) const {
    std::vector<const Card*> out;
    for (auto it = card_by_ordinal.lower_bound({ noteId, std::numeric_limits<int>::min() });
        it != card_by_ordinal.end() && it->first.first == noteId; ++it) {
        const Card* c = getCard(it->second);
        if (c && (includeDeleted || !c->deleted)) out.push_back(c);
    }
    return out;
}

std::vector<const Card*> EntityStore::cardsInDeckTree(EntityId deckId) const {
    auto ids = deckAndDescendants(deckId);
    std::set<EntityId> scope(ids.begin(), ids.end());

    std::vector<const Card*> out;
    for (const auto& c : card_table) {
        if (!c.second.deleted && scope.count(c.second.deck_id)) out.push_back(&c.second);
    }
    return out;
}

/* -------------------------
   Models
   ------------------------- */

EntityId EntityStore::addModel(Model model) {
    if (model.name.empty())
        throw IntegrityError("Model name required");
    if (model.fields.empty())
        throw IntegrityError("Model '" + model.name + "' needs at least one field");
    if (model.templates.empty())
        throw IntegrityError("Model '" + model.name + "' needs at least one template");

    std::set<std::string> seen;
    for (const auto& f : model.fields) {
        if (f.empty() || !seen.insert(f).second)
            throw IntegrityError("Model '" + model.name + "' has an empty or duplicate field name");
    }
    if (model.sort_field < 0 || model.sort_field >= model.fieldCount())
        model.sort_field = 0;

    for (std::size_t i = 0; i < model.templates.size(); ++i)
        model.templates[i].ord = static_cast<int>(i);

    if (model.id == NO_ID) {
        model.id = allocateId();
    }
    else {
        if (model_table.count(model.id))
            throw IntegrityError("Model id " + std::to_string(model.id) + " already in use");
        trackId(model.id);
    }

    EntityId id = model.id;
    spdlog::info("Added model '{}' id={} kind={} fields={} templates={}",
        model.name, id, static_cast<int>(model.kind), model.fields.size(), model.templates.size());
    model_table.emplace(id, std::move(model));
    return id;
}

void EntityStore::insertModel(const Model& model) {
    if (model.id == NO_ID)
        throw IntegrityError("insertModel requires an id");
    addModel(model);
}

void EntityStore::addField(EntityId modelId, const std::string& fieldName) {
    Model& model = modelRef(modelId);
    if (fieldName.empty() || model.fieldIndex(fieldName) >= 0)
        throw IntegrityError("Field name '" + fieldName + "' is empty or already used");

    model.fields.push_back(fieldName);

    // existing notes get an empty value so their field count keeps matching
    int touched = 0;
    for (auto& n : note_table) {
        if (n.second.model_id == modelId) {
            n.second.fields.push_back(FIELD_SEPARATOR);
            ++touched;
        }
    }
    spdlog::info("Model id={} gained field '{}' ({} notes extended)", modelId, fieldName, touched);
}

void EntityStore::addTemplate(EntityId modelId, CardTemplate tmpl) {
    Model& model = modelRef(modelId);
    if (model.isCloze())
        throw IntegrityError("Cloze models have a single template");

    tmpl.ord = static_cast<int>(model.templates.size());
    model.templates.push_back(tmpl);

    std::time_t now = std::time(nullptr);
    int created = 0;
    for (const auto& n : note_table) {
        if (n.second.model_id != modelId || n.second.deleted) continue;
        createCard(n.second, defaultDeckFor(n.first), tmpl.ord, now);
        ++created;
    }
    spdlog::info("Model id={} gained template '{}' ({} cards generated)", modelId, tmpl.name, created);
}

std::vector<int> EntityStore::ordinalsFor(const Model& model, const Note& note) const {
    std::vector<int> ords;
    if (model.isCloze()) {
        for (int index : ClozeEngine::listIndices(note.fieldValue(model.clozeFieldIndex())))
            ords.push_back(index - 1);
    }
    else {
        for (const auto& t : model.templates) ords.push_back(t.ord);
    }
    return ords;
}

void EntityStore::checkFields(const Model& model, const std::vector<std::string>& values) const {
    if (static_cast<int>(values.size()) != model.fieldCount()) {
        throw IntegrityError("Expected " + std::to_string(model.fieldCount()) +
            " fields, got " + std::to_string(values.size()));
    }
    for (const auto& v : values) {
        if (v.find(FIELD_SEPARATOR) != std::string::npos)
            throw IntegrityError("Field value contains the reserved field separator");
    }
}

/* -------------------------
   Decks
   ------------------------- */

EntityId EntityStore::addDeck(const std::string& name, DeckLimits limits) {
    Deck deck(NO_ID, name);
    deck.limits = limits;
    deck.modified = std::time(nullptr);
    return insertDeck(deck);
}

EntityId EntityStore::addFilteredDeck(const std::string& name) {
    Deck deck(NO_ID, name);
    deck.is_filtered = true;
    deck.modified = std::time(nullptr);
    return insertDeck(deck);
}

EntityId EntityStore::insertDeck(Deck deck) {
    std::string normalized = DeckPath::normalize(deck.name);
    if (normalized.empty())
        throw IntegrityError("Invalid deck name '" + deck.name + "'");
    if (findDeckByName(normalized))
        throw IntegrityError("Deck '" + normalized + "' already exists");
    deck.name = normalized;

    if (deck.id == NO_ID) {
        deck.id = allocateId();
    }
    else {
        if (deck_table.count(deck.id))
            throw IntegrityError("Deck id " + std::to_string(deck.id) + " already in use");
        trackId(deck.id);
    }

    EntityId id = deck.id;
    spdlog::info("Added deck '{}' id={}{}", deck.name, id, deck.is_filtered ? " (filtered)" : "");
    deck_table.emplace(id, std::move(deck));
    return id;
}

std::vector<EntityId> EntityStore::deckAndDescendants(EntityId deckId) const {
    std::vector<EntityId> out;
    const Deck* root = getDeck(deckId);
    if (!root) return out;

    for (const auto& d : deck_table) {
        if (DeckPath::isSelfOrDescendant(d.second.name, root->name)) out.push_back(d.first);
    }
    return out;
}

void EntityStore::renameDeck(EntityId deckId, const std::string& newName) {
    Deck& deck = deckRef(deckId);
    std::string target = DeckPath::normalize(newName);
    if (target.empty())
        throw IntegrityError("Invalid deck name '" + newName + "'");
    if (target == deck.name) return;

    const std::string oldName = deck.name;
    if (DeckPath::isDescendant(target, oldName))
        throw IntegrityError("Cannot move deck '" + oldName + "' under itself");

    auto moving = deckAndDescendants(deckId);
    std::set<EntityId> movingSet(moving.begin(), moving.end());
    for (EntityId id : moving) {
        std::string renamed = DeckPath::reparent(deck_table.at(id).name, oldName, target);
        const Deck* clash = findDeckByName(renamed);
        if (clash && !movingSet.count(clash->id))
            throw IntegrityError("Deck '" + renamed + "' already exists");
    }

    for (EntityId id : moving) {
        Deck& d = deck_table.at(id);
        d.name = DeckPath::reparent(d.name, oldName, target);
    }
    spdlog::info("Renamed deck '{}' -> '{}' ({} deck(s) affected)", oldName, target, moving.size());
}

void EntityStore::setDeckLimits(EntityId deckId, DeckLimits limits) {
    if (limits.new_per_day < 0 || limits.reviews_per_day < 0)
        throw IntegrityError("Daily limits cannot be negative");
    deckRef(deckId).limits = limits;
}

void EntityStore::setDeckCollapsed(EntityId deckId, bool collapsed) {
    deckRef(deckId).collapsed = collapsed;
}

bool EntityStore::removeDeck(EntityId deckId) {
    auto tree = deckAndDescendants(deckId);
    if (tree.empty()) return false;
    std::set<EntityId> scope(tree.begin(), tree.end());

    for (const auto& c : card_table) {
        if (scope.count(c.second.deck_id) || scope.count(c.second.original_deck)) {
            spdlog::warn("Deck id={} still owns cards; not removed", deckId);
            return false;
        }
    }

    for (EntityId id : tree) deck_table.erase(id);
    spdlog::info("Removed {} deck(s) rooted at id={}", tree.size(), deckId);
    return true;
}

EntityId EntityStore::defaultDeckFor(EntityId noteId) const {
    auto existing = cardsOfNote(noteId, true);
    if (!existing.empty()) {
        const Card* first = existing.front();
        return first->isRelocated() ? first->original_deck : first->deck_id;
    }
    for (const auto& d : deck_table) {
        if (!d.second.is_filtered) return d.first;
    }
    throw IntegrityError("No deck available for note " + std::to_string(noteId));
}

/* -------------------------
   Notes
   ------------------------- */

EntityId EntityStore::createCard(const Note& note, EntityId deckId, int ord, std::time_t now) {
    Card card;
    card.id = allocateId();
    card.note_id = note.id;
    card.deck_id = deckId;
    card.ord = ord;
    card.queue = CardQueue::New;
    card.type = CardType::New;
    card.due = takeNextPosition();
    card.ease = DEFAULT_EASE;
    card.modified = now;

    card_by_ordinal[{ note.id, ord }] = card.id;
    card_table.emplace(card.id, card);
    return card.id;
}

EntityId EntityStore::addNote(EntityId modelId, EntityId deckId,
    const std::vector<std::string>& fieldValues,
    const std::vector<std::string>& tags,
    std::time_t now)
{
    now = resolveNow(now);
    const Model& model = modelRef(modelId);
    const Deck& deck = deckRef(deckId);
    if (deck.is_filtered)
        throw IntegrityError("Cannot add notes to filtered deck '" + deck.name + "'");
    checkFields(model, fieldValues);

    Note note;
    note.model_id = modelId;
    note.guid = Note::generateGuid();
    note.setFieldValues(fieldValues);
    note.setTags(tags);
    note.modified = now;

    auto ords = ordinalsFor(model, note);
    if (ords.empty())
        throw IntegrityError("Cloze note has no cloze deletions");

    note.id = allocateId();
    EntityId id = note.id;
    note_table.emplace(id, note);
    for (int ord : ords) createCard(note_table.at(id), deckId, ord, now);

    spdlog::info("Added note id={} model='{}' cards={}", id, model.name, ords.size());
    return id;
}

void EntityStore::insertNote(const Note& note) {
    if (note.id == NO_ID)
        throw IntegrityError("insertNote requires an id");
    if (note_table.count(note.id))
        throw IntegrityError("Note id " + std::to_string(note.id) + " already in use");

    const Model* model = getModel(note.model_id);
    if (!model)
        throw IntegrityError("Note " + std::to_string(note.id) + " references missing model " +
            std::to_string(note.model_id));
    if (note.fieldCount() != model->fieldCount())
        throw IntegrityError("Note " + std::to_string(note.id) + " has " +
            std::to_string(note.fieldCount()) + " fields, model expects " +
            std::to_string(model->fieldCount()));

    trackId(note.id);
    note_table.emplace(note.id, note);
}

NoteEdit EntityStore::updateNoteFields(EntityId noteId, const std::vector<std::string>& fieldValues, std::time_t now) {
    now = resolveNow(now);
    Note& note = noteRef(noteId);
    if (note.deleted)
        throw IntegrityError("Note " + std::to_string(noteId) + " is deleted");
    const Model& model = modelRef(note.model_id);
    checkFields(model, fieldValues);

    NoteEdit edit;
    note.setFieldValues(fieldValues);
    note.modified = now;

    if (!model.isCloze()) {
        spdlog::debug("Note id={} fields updated", noteId);
        return edit;
    }

    // diff the old and new cloze ordinal sets
    auto wanted = ordinalsFor(model, note);
    std::set<int> wantedSet(wanted.begin(), wanted.end());

    for (int ord : wanted) {
        auto it = card_by_ordinal.find({ noteId, ord });
        if (it == card_by_ordinal.end()) {
            edit.added.push_back(createCard(note, defaultDeckFor(noteId), ord, now));
            continue;
        }
        Card& card = card_table.at(it->second);
        if (card.deleted) {
            card.deleted = false;
            card.modified = now;
            edit.restored.push_back(card.id);
        }
    }

    for (const Card* existing : cardsOfNote(noteId)) {
        if (wantedSet.count(existing->ord)) continue;
        Card& card = card_table.at(existing->id);
        card.deleted = true;
        card.modified = now;
        edit.orphaned.push_back(card.id);
    }

    spdlog::info("Note id={} cloze edit: +{} new, {} orphaned, {} restored",
        noteId, edit.added.size(), edit.orphaned.size(), edit.restored.size());
    return edit;
}

void EntityStore::setNoteTags(EntityId noteId, const std::vector<std::string>& tags) {
    Note& note = noteRef(noteId);
    note.setTags(tags);
    note.modified = std::time(nullptr);
}

void EntityStore::deleteNote(EntityId noteId, DeleteMode mode) {
    noteRef(noteId);
    auto owned = cardsOfNote(noteId, true);

    if (mode == DeleteMode::Soft) {
        note_table.at(noteId).deleted = true;
        for (const Card* c : owned) card_table.at(c->id).deleted = true;
        spdlog::info("Soft-deleted note id={} and {} card(s)", noteId, owned.size());
        return;
    }

    std::vector<std::pair<EntityId, int>> keys;
    std::set<EntityId> gone;
    for (const Card* c : owned) {
        keys.emplace_back(c->id, c->ord);
        gone.insert(c->id);
    }
    for (const auto& k : keys) {
        card_by_ordinal.erase({ noteId, k.second });
        card_table.erase(k.first);
    }
    note_table.erase(noteId);

    // the log may only name cards that exist
    const std::size_t before = review_log.size();
    review_log.erase(std::remove_if(review_log.begin(), review_log.end(),
        [&gone](const ReviewLogEntry& e) { return gone.count(e.card_id) > 0; }), review_log.end());
    spdlog::info("Deleted note id={}, {} card(s) and {} review(s)", noteId, keys.size(), before - review_log.size());
}

void EntityStore::restoreNote(EntityId noteId) {
    Note& note = noteRef(noteId);
    if (!note.deleted) return;
    const Model& model = modelRef(note.model_id);

    note.deleted = false;
    auto wanted = ordinalsFor(model, note);
    std::set<int> wantedSet(wanted.begin(), wanted.end());
    for (const Card* c : cardsOfNote(noteId, true)) {
        if (wantedSet.count(c->ord)) card_table.at(c->id).deleted = false;
    }
    spdlog::info("Restored note id={}", noteId);
}

/* -------------------------
   Cards
   ------------------------- */

void EntityStore::replaceCard(const Card& card) {
    auto it = card_table.find(card.id);
    if (it == card_table.end())
        throw IntegrityError("Card " + std::to_string(card.id) + " not found");
    if (it->second.note_id != card.note_id || it->second.ord != card.ord)
        throw IntegrityError("Card " + std::to_string(card.id) + " cannot change note or ordinal");
    if (!getDeck(card.deck_id))
        throw IntegrityError("Card " + std::to_string(card.id) + " references missing deck");
    if (card.original_deck != NO_ID && !getDeck(card.original_deck))
        throw IntegrityError("Card " + std::to_string(card.id) + " references missing original deck");

    it->second = card;
}

void EntityStore::insertCard(const Card& card) {
    if (card.id == NO_ID)
        throw IntegrityError("insertCard requires an id");
    if (card_table.count(card.id))
        throw IntegrityError("Card id " + std::to_string(card.id) + " already in use");

    const Note* note = getNote(card.note_id);
    if (!note)
        throw IntegrityError("Card " + std::to_string(card.id) + " references missing note " +
            std::to_string(card.note_id));
    if (!getDeck(card.deck_id))
        throw IntegrityError("Card " + std::to_string(card.id) + " references missing deck " +
            std::to_string(card.deck_id));
    if (card.original_deck != NO_ID && !getDeck(card.original_deck))
        throw IntegrityError("Card " + std::to_string(card.id) + " references missing original deck");
    if (card_by_ordinal.count({ card.note_id, card.ord }))
        throw IntegrityError("Note " + std::to_string(card.note_id) + " already has a card with ordinal " +
            std::to_string(card.ord));

    const Model& model = model_table.at(note->model_id);
    if (card.ord < 0 || (!model.isCloze() && card.ord >= static_cast<int>(model.templates.size())))
        throw IntegrityError("Card " + std::to_string(card.id) + " has invalid ordinal " +
            std::to_string(card.ord));

    trackId(card.id);
    card_by_ordinal[{ card.note_id, card.ord }] = card.id;
    card_table.emplace(card.id, card);
}

/* -------------------------
   Review log
   ------------------------- */

void EntityStore::appendReview(const ReviewLogEntry& entry) {
    if (!getCard(entry.card_id))
        throw IntegrityError("Review log entry references missing card " + std::to_string(entry.card_id));
    review_log.push_back(entry);
}
