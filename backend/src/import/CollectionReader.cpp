#include "CollectionReader.hpp"
#include "../core/Errors.hpp"
#include "../utils/Config.hpp"
#include <algorithm>
#include <cstdlib>
#include <sqlite3.h>
#include <spdlog/spdlog.h>

namespace
{
    // Owns a prepared statement for the lifetime of one query.
    class Statement {
    public:
        Statement(sqlite3* db, const std::string& sql) {
            rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
        }
        ~Statement() { sqlite3_finalize(stmt); }

        Statement(const Statement&) = delete;
        Statement& operator=(const Statement&) = delete;

        bool ok() const { return rc == SQLITE_OK; }
        sqlite3_stmt* get() const { return stmt; }

    private:
        sqlite3_stmt* stmt = nullptr;
        int rc = SQLITE_ERROR;
    };

    bool parseInt64(const std::string& text, std::int64_t& out) {
        if (text.empty()) return false;
        char* end = nullptr;
        long long v = std::strtoll(text.c_str(), &end, 10);
        if (*end != '\0') return false;
        out = v;
        return true;
    }

    bool columnInt64(sqlite3_stmt* s, int col, std::int64_t& out) {
        switch (sqlite3_column_type(s, col)) {
        case SQLITE_INTEGER:
            out = sqlite3_column_int64(s, col);
            return true;
        case SQLITE_FLOAT:
            out = static_cast<std::int64_t>(sqlite3_column_double(s, col));
            return true;
        case SQLITE_TEXT:
            return parseInt64(reinterpret_cast<const char*>(sqlite3_column_text(s, col)), out);
        default:
            return false;
        }
    }

    int columnInt(sqlite3_stmt* s, int col, int fallback = 0) {
        std::int64_t v = 0;
        return columnInt64(s, col, v) ? static_cast<int>(v) : fallback;
    }

    bool columnText(sqlite3_stmt* s, int col, std::string& out) {
        const int type = sqlite3_column_type(s, col);
        if (type == SQLITE_NULL) return false;
        const void* data = type == SQLITE_BLOB ? sqlite3_column_blob(s, col) : sqlite3_column_text(s, col);
        const int len = sqlite3_column_bytes(s, col);
        out.assign(static_cast<const char*>(data), static_cast<std::size_t>(len));
        return true;
    }

    // Ids in col JSON show up as numbers or as strings depending on the exporter.
    bool jsonId(const Json::Value& v, std::int64_t& out) {
        if (v.isIntegral()) {
            out = v.asInt64();
            return true;
        }
        if (v.isDouble()) {
            out = static_cast<std::int64_t>(v.asDouble());
            return true;
        }
        if (v.isString()) return parseInt64(v.asString(), out);
        return false;
    }

    bool jsonFlag(const Json::Value& v) {
        if (v.isBool()) return v.asBool();
        if (v.isNumeric()) return v.asInt() != 0;
        return false;
    }

    Json::Value parseColumnJson(const std::string& text, const char* column) {
        Json::Value root;
        std::string errors;
        if (!Config::parseJson(text, root, &errors) || !root.isObject()) {
            throw ImportError(ImportError::Stage::Metadata,
                std::string("Collection ") + column + " JSON is unreadable: " + errors);
        }
        return root;
    }

    void stepFailed(sqlite3* db, const char* table) {
        throw ImportError(ImportError::Stage::Database,
            std::string("Failed reading ") + table + ": " + sqlite3_errmsg(db));
    }
}

CollectionReader::CollectionReader(const std::string& dbPath)
    : db_path(dbPath)
{
    int rc = sqlite3_open_v2(dbPath.c_str(), &db, SQLITE_OPEN_READONLY, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        db = nullptr;
        throw ImportError(ImportError::Stage::Database, "Cannot open collection database: " + msg);
    }

    try {
        Statement probe(db, "SELECT name FROM sqlite_master WHERE type='table'");
        if (!probe.ok())
            throw ImportError(ImportError::Stage::Database,
                std::string("Collection database is unreadable: ") + sqlite3_errmsg(db));

        for (const char* required : { "col", "notes", "cards" }) {
            if (!hasTable(required))
                throw ImportError(ImportError::Stage::Schema,
                    std::string("Collection database has no '") + required + "' table");
        }
        readCollectionRow();
    }
    catch (...) {
        sqlite3_close(db);
        db = nullptr;
        throw;
    }

    spdlog::info("Opened collection database '{}' (crt={})", dbPath, created_at);
}

CollectionReader::~CollectionReader() {
    if (db) sqlite3_close(db);
}

bool CollectionReader::hasTable(const std::string& name) const {
    Statement stmt(db, "SELECT 1 FROM sqlite_master WHERE type='table' AND name=?1");
    if (!stmt.ok()) return false;
    sqlite3_bind_text(stmt.get(), 1, name.c_str(), -1, SQLITE_TRANSIENT);
    return sqlite3_step(stmt.get()) == SQLITE_ROW;
}

void CollectionReader::readCollectionRow() {
    Statement stmt(db, "SELECT crt, models, decks, dconf FROM col LIMIT 1");
    if (!stmt.ok())
        throw ImportError(ImportError::Stage::Schema,
            std::string("Collection table is missing columns: ") + sqlite3_errmsg(db));

    if (sqlite3_step(stmt.get()) != SQLITE_ROW)
        throw ImportError(ImportError::Stage::Schema, "Collection table has no row");

    std::int64_t crt = 0;
    columnInt64(stmt.get(), 0, crt);
    created_at = static_cast<std::time_t>(crt);

    std::string text;
    if (!columnText(stmt.get(), 1, text))
        throw ImportError(ImportError::Stage::Metadata, "Collection has no models");
    models_json = parseColumnJson(text, "models");

    if (!columnText(stmt.get(), 2, text))
        throw ImportError(ImportError::Stage::Metadata, "Collection has no decks");
    decks_json = parseColumnJson(text, "decks");

    // deck options are optional; limits fall back to the defaults
    std::string errors;
    if (!columnText(stmt.get(), 3, text) || !Config::parseJson(text, dconf_json, &errors) || !dconf_json.isObject()) {
        spdlog::warn("Collection deck options unreadable; default limits apply");
        dconf_json = Json::Value(Json::objectValue);
    }
}

/* -------------------------
   JSON metadata
   ------------------------- */

std::vector<Model> CollectionReader::readModels(std::vector<std::string>& warnings) const {
    std::vector<Model> models;

    for (const auto& key : models_json.getMemberNames()) {
        const Json::Value& m = models_json[key];
        auto skip = [&](const std::string& why) {
            warnings.push_back("Skipped model " + key + ": " + why);
            spdlog::warn("Skipped model {}: {}", key, why);
        };

        Model model;
        if (!m.isObject()) { skip("not an object"); continue; }
        if (!parseInt64(key, model.id) && !jsonId(m["id"], model.id)) { skip("bad id"); continue; }
        if (!m["name"].isString()) { skip("missing name"); continue; }
        if (!m["flds"].isArray() || m["flds"].empty()) { skip("no fields"); continue; }
        if (!m["tmpls"].isArray() || m["tmpls"].empty()) { skip("no templates"); continue; }

        model.name = m["name"].asString();
        model.kind = m["type"].isNumeric() && m["type"].asInt() == 1 ? ModelKind::Cloze : ModelKind::Standard;
        model.css = m["css"].isString() ? m["css"].asString() : "";
        model.sort_field = m["sortf"].isNumeric() ? m["sortf"].asInt() : 0;
        model.modified = m["mod"].isNumeric() ? static_cast<std::time_t>(m["mod"].asInt64()) : 0;

        std::vector<std::pair<int, std::string>> fields;
        for (const auto& f : m["flds"]) {
            int ord = f["ord"].isNumeric() ? f["ord"].asInt() : static_cast<int>(fields.size());
            fields.emplace_back(ord, f["name"].isString() ? f["name"].asString() : "");
        }
        std::stable_sort(fields.begin(), fields.end(),
            [](const std::pair<int, std::string>& a, const std::pair<int, std::string>& b) { return a.first < b.first; });
        for (const auto& f : fields) model.fields.push_back(f.second);

        std::vector<CardTemplate> templates;
        for (const auto& t : m["tmpls"]) {
            CardTemplate tmpl;
            tmpl.name = t["name"].isString() ? t["name"].asString() : "";
            tmpl.ord = t["ord"].isNumeric() ? t["ord"].asInt() : static_cast<int>(templates.size());
            tmpl.question_format = t["qfmt"].isString() ? t["qfmt"].asString() : "";
            tmpl.answer_format = t["afmt"].isString() ? t["afmt"].asString() : "";
            templates.push_back(tmpl);
        }
        std::stable_sort(templates.begin(), templates.end(),
            [](const CardTemplate& a, const CardTemplate& b) { return a.ord < b.ord; });
        model.templates = templates;

        models.push_back(model);
    }

    std::sort(models.begin(), models.end(), [](const Model& a, const Model& b) { return a.id < b.id; });
    spdlog::info("Read {} model(s) from collection", models.size());
    return models;
}

std::vector<PackageDeck> CollectionReader::readDecks(std::vector<std::string>& warnings) const {
    std::vector<PackageDeck> decks;

    for (const auto& key : decks_json.getMemberNames()) {
        const Json::Value& d = decks_json[key];
        PackageDeck entry;
        Deck& deck = entry.deck;

        if (!d.isObject() || (!parseInt64(key, deck.id) && !jsonId(d["id"], deck.id)) || !d["name"].isString()) {
            warnings.push_back("Skipped deck " + key + ": missing id or name");
            spdlog::warn("Skipped deck {}: missing id or name", key);
            continue;
        }

        deck.name = d["name"].asString();
        deck.description = d["desc"].isString() ? d["desc"].asString() : "";
        deck.collapsed = jsonFlag(d["collapsed"]);
        deck.browser_collapsed = jsonFlag(d["browserCollapsed"]);
        deck.is_filtered = jsonFlag(d["dyn"]);
        deck.modified = d["mod"].isNumeric() ? static_cast<std::time_t>(d["mod"].asInt64()) : 0;

        if (jsonId(d["conf"], entry.config_id)) {
            const Json::Value& conf = dconf_json[std::to_string(entry.config_id)];
            if (conf.isObject()) {
                if (conf["new"]["perDay"].isNumeric()) deck.limits.new_per_day = conf["new"]["perDay"].asInt();
                if (conf["rev"]["perDay"].isNumeric()) deck.limits.reviews_per_day = conf["rev"]["perDay"].asInt();
            }
        }

        decks.push_back(entry);
    }

    std::sort(decks.begin(), decks.end(),
        [](const PackageDeck& a, const PackageDeck& b) { return a.deck.id < b.deck.id; });
    spdlog::info("Read {} deck(s) from collection", decks.size());
    return decks;
}

/* -------------------------
   Tables
   ------------------------- */

std::vector<Note> CollectionReader::readNotes(std::vector<std::string>& warnings) const {
    Statement stmt(db, "SELECT id, guid, mid, mod, tags, flds FROM notes ORDER BY id");
    if (!stmt.ok())
        throw ImportError(ImportError::Stage::Schema,
            std::string("Notes table is missing columns: ") + sqlite3_errmsg(db));

    std::vector<Note> notes;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        Note note;
        std::int64_t mod = 0;
        std::string tags;

        if (!columnInt64(stmt.get(), 0, note.id) || !columnInt64(stmt.get(), 2, note.model_id) ||
            !columnText(stmt.get(), 5, note.fields)) {
            warnings.push_back("Skipped malformed note row " + std::to_string(notes.size() + 1));
            spdlog::warn("Skipped malformed note row {}", notes.size() + 1);
            continue;
        }
        columnText(stmt.get(), 1, note.guid);
        if (columnInt64(stmt.get(), 3, mod)) note.modified = static_cast<std::time_t>(mod);
        if (columnText(stmt.get(), 4, tags)) note.tags = Note::parseTags(tags);

        notes.push_back(note);
    }
    if (rc != SQLITE_DONE) stepFailed(db, "notes");

    spdlog::info("Read {} note(s) from collection", notes.size());
    return notes;
}

std::vector<Card> CollectionReader::readCards(std::vector<std::string>& warnings) const {
    Statement stmt(db,
        "SELECT id, nid, did, ord, type, queue, due, ivl, factor, reps, lapses, left, odue, odid, flags "
        "FROM cards ORDER BY id");
    if (!stmt.ok())
        throw ImportError(ImportError::Stage::Schema,
            std::string("Cards table is missing columns: ") + sqlite3_errmsg(db));

    std::vector<Card> cards;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        sqlite3_stmt* s = stmt.get();
        Card card;
        std::int64_t due = 0;

        bool ok = columnInt64(s, 0, card.id) && columnInt64(s, 1, card.note_id) &&
            columnInt64(s, 2, card.deck_id) && columnInt64(s, 6, due);
        const int type = columnInt(s, 4, -1);
        const int queue = columnInt(s, 5, -100);
        if (!ok || type < 0 || type > 3 || queue < -3 || queue > 4) {
            std::string label = card.id != NO_ID ? std::to_string(card.id) : "row " + std::to_string(cards.size() + 1);
            warnings.push_back("Skipped malformed card " + label);
            spdlog::warn("Skipped malformed card {}", label);
            continue;
        }

        card.ord = columnInt(s, 3);
        card.type = static_cast<CardType>(type);
        card.queue = static_cast<CardQueue>(queue);
        card.due = due;
        card.interval = std::max(0, columnInt(s, 7));
        card.ease = columnInt(s, 8);
        card.reps = columnInt(s, 9);
        card.lapses = columnInt(s, 10);
        card.remaining_steps = columnInt(s, 11) % 1000;   // left = today*1000 + steps left
        columnInt64(s, 12, card.original_due);
        columnInt64(s, 13, card.original_deck);
        card.flags = columnInt(s, 14) & 0x7;

        cards.push_back(card);
    }
    if (rc != SQLITE_DONE) stepFailed(db, "cards");

    spdlog::info("Read {} card(s) from collection", cards.size());
    return cards;
}

std::vector<ReviewLogEntry> CollectionReader::readReviewLog(std::vector<std::string>& warnings) const {
    std::vector<ReviewLogEntry> entries;
    if (!hasTable("revlog")) return entries;

    Statement stmt(db, "SELECT id, cid, ease, ivl, lastIvl, factor, time, type FROM revlog ORDER BY id");
    if (!stmt.ok()) {
        warnings.push_back("Review history unreadable; skipped");
        spdlog::warn("Review history unreadable: {}", sqlite3_errmsg(db));
        return entries;
    }

    int skipped = 0;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        sqlite3_stmt* s = stmt.get();
        ReviewLogEntry e;
        const int type = columnInt(s, 7, -1);
        if (!columnInt64(s, 0, e.id) || !columnInt64(s, 1, e.card_id) || type < 0 || type > 3) {
            ++skipped;
            continue;
        }
        e.ease = columnInt(s, 2);
        e.interval = columnInt(s, 3);
        e.last_interval = columnInt(s, 4);
        e.factor = columnInt(s, 5);
        e.time_taken_ms = columnInt(s, 6);
        e.kind = static_cast<ReviewKind>(type);
        e.was_new = e.kind == ReviewKind::Learn && e.last_interval == 0;
        entries.push_back(e);
    }
    if (rc != SQLITE_DONE) stepFailed(db, "revlog");

    if (skipped > 0) {
        warnings.push_back("Skipped " + std::to_string(skipped) + " malformed review log entries");
        spdlog::warn("Skipped {} malformed review log entries", skipped);
    }
    spdlog::info("Read {} review log entries from collection", entries.size());
    return entries;
}
