#pragma once
#include <string>
#include <vector>
#include <map>
#include <ctime>
#include <json/json.h>
#include "../core/Model.hpp"
#include "../core/Deck.hpp"
#include "../core/Note.hpp"
#include "../core/Card.hpp"

struct sqlite3;

// Deck row as found in the package, before ids are remapped.
struct PackageDeck {
    Deck deck;
    EntityId config_id = NO_ID;
};

/*
  Reads the embedded collection database of a package:
    col     one row; models, decks and dconf are JSON text
    notes   id, guid, mid, mod, tags, flds
    cards   id, nid, did, ord, type, queue, due, ivl, factor, reps, lapses, left, odue, odid, flags
    revlog  optional

  A missing table, a missing col row or unparsable col JSON throws
  ImportError. A single bad row is skipped and described in `warnings`.
*/
class CollectionReader {
public:
    explicit CollectionReader(const std::string& dbPath);
    ~CollectionReader();

    CollectionReader(const CollectionReader&) = delete;
    CollectionReader& operator=(const CollectionReader&) = delete;

    std::time_t createdAt() const { return created_at; }

    std::vector<Model> readModels(std::vector<std::string>& warnings) const;
    std::vector<PackageDeck> readDecks(std::vector<std::string>& warnings) const;
    std::vector<Note> readNotes(std::vector<std::string>& warnings) const;
    std::vector<Card> readCards(std::vector<std::string>& warnings) const;
    std::vector<ReviewLogEntry> readReviewLog(std::vector<std::string>& warnings) const;

    bool hasTable(const std::string& name) const;

private:
    sqlite3* db = nullptr;
    std::string db_path;
    std::time_t created_at = 0;
    Json::Value models_json;
    Json::Value decks_json;
    Json::Value dconf_json;

    void readCollectionRow();
};
