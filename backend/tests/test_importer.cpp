#include "TestSuite.hpp"
#include "../src/import/PackageImporter.hpp"
#include "../src/core/Errors.hpp"
#include "../src/utils/Config.hpp"

#include <filesystem>
#include <fstream>
#include <functional>
#include <sodium.h>
#include <sqlite3.h>
#include <zlib.h>

namespace {

const std::string SEP(1, FIELD_SEPARATOR);

const EntityId MODEL_ID = 1600000000001;
const EntityId DECK_ID = 1600000000100;
const EntityId CRAM_ID = 1600000000200;
const EntityId NOTE_HOLA = 1600000001000;
const EntityId NOTE_ADIOS = 1600000002000;
const EntityId CARD_REVIEW = 1600000003000;
const EntityId CARD_NEW = 1600000004000;

// Package collection created ten study days before the target store.
const std::time_t PACKAGE_CRT = T0 - 10 * DAY;

/* -------------------------
   Package fixture
   ------------------------- */

void put16(std::string& out, std::uint16_t v) {
    out.push_back(static_cast<char>(v & 0xFF));
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
}

void put32(std::string& out, std::uint32_t v) {
    put16(out, static_cast<std::uint16_t>(v & 0xFFFF));
    put16(out, static_cast<std::uint16_t>(v >> 16));
}

std::string rawDeflate(const std::string& data) {
    z_stream zs{};
    deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY);
    std::string out(deflateBound(&zs, static_cast<uLong>(data.size())), '\0');
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());
    zs.next_out = reinterpret_cast<Bytef*>(&out[0]);
    zs.avail_out = static_cast<uInt>(out.size());
    deflate(&zs, Z_FINISH);
    out.resize(zs.total_out);
    deflateEnd(&zs);
    return out;
}

// Minimal zip writer: stored or raw-deflated entries, no extras.
struct ZipBuilder {
    struct Entry {
        std::string name;
        std::string data;
        bool deflated;
        std::uint32_t claimed;          // recorded uncompressed size, 0 for the real one
    };
    std::vector<Entry> entries;

    void add(const std::string& name, const std::string& data, bool deflated = false, std::uint32_t claimed = 0) {
        entries.push_back({ name, data, deflated, claimed });
    }

    void write(const std::string& path) const {
        std::string body;
        std::string directory;
        for (const auto& e : entries) {
            const std::uint32_t crc = static_cast<std::uint32_t>(
                crc32(0L, reinterpret_cast<const Bytef*>(e.data.data()), static_cast<uInt>(e.data.size())));
            const std::string payload = e.deflated ? rawDeflate(e.data) : e.data;
            const std::uint16_t method = e.deflated ? 8 : 0;
            const std::uint32_t offset = static_cast<std::uint32_t>(body.size());
            const std::uint32_t size = e.claimed ? e.claimed : static_cast<std::uint32_t>(e.data.size());

            put32(body, 0x04034b50);
            put16(body, 20);
            put16(body, 0);
            put16(body, method);
            put32(body, 0);                 // time + date
            put32(body, crc);
            put32(body, static_cast<std::uint32_t>(payload.size()));
            put32(body, size);
            put16(body, static_cast<std::uint16_t>(e.name.size()));
            put16(body, 0);
            body += e.name;
            body += payload;

            put32(directory, 0x02014b50);
            put16(directory, 20);
            put16(directory, 20);
            put16(directory, 0);
            put16(directory, method);
            put32(directory, 0);
            put32(directory, crc);
            put32(directory, static_cast<std::uint32_t>(payload.size()));
            put32(directory, size);
            put16(directory, static_cast<std::uint16_t>(e.name.size()));
            put16(directory, 0);            // extra
            put16(directory, 0);            // comment
            put16(directory, 0);            // disk
            put16(directory, 0);            // internal attributes
            put32(directory, 0);            // external attributes
            put32(directory, offset);
            directory += e.name;
        }

        std::string eocd;
        put32(eocd, 0x06054b50);
        put16(eocd, 0);
        put16(eocd, 0);
        put16(eocd, static_cast<std::uint16_t>(entries.size()));
        put16(eocd, static_cast<std::uint16_t>(entries.size()));
        put32(eocd, static_cast<std::uint32_t>(directory.size()));
        put32(eocd, static_cast<std::uint32_t>(body.size()));
        put16(eocd, 0);

        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << body << directory << eocd;
    }
};

bool exec(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::cerr << "fixture SQL failed: " << (err ? err : "?") << std::endl;
        sqlite3_free(err);
        return false;
    }
    return true;
}

bool insertNote(sqlite3* db, EntityId id, const std::string& guid, const std::string& tags, const std::string& fields) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, "INSERT INTO notes VALUES (?1, ?2, ?3, 0, -1, ?4, ?5, '', 0, 0, '')", -1, &stmt, nullptr) != SQLITE_OK)
        return false;
    sqlite3_bind_int64(stmt, 1, id);
    sqlite3_bind_text(stmt, 2, guid.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, MODEL_ID);
    sqlite3_bind_text(stmt, 4, tags.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, fields.c_str(), -1, SQLITE_TRANSIENT);
    bool ok = sqlite3_step(stmt) == SQLITE_DONE;
    sqlite3_finalize(stmt);
    return ok;
}

std::string modelsJson() {
    return "{\"" + std::to_string(MODEL_ID) + "\": {"
        "\"name\": \"Basic\", \"type\": 0, \"sortf\": 0, \"css\": \".card {}\", \"mod\": 0,"
        "\"flds\": [{\"name\": \"Front\", \"ord\": 0}, {\"name\": \"Back\", \"ord\": 1}],"
        "\"tmpls\": [{\"name\": \"Card 1\", \"ord\": 0, \"qfmt\": \"{{Front}}\", \"afmt\": \"{{Back}}\"}]}}";
}

std::string decksJson() {
    return "{\"1\": {\"name\": \"Default\", \"dyn\": 0, \"conf\": 1},"
        "\"" + std::to_string(DECK_ID) + "\": {\"name\": \"Lang::Spanish\", \"dyn\": 0, \"conf\": 1, \"desc\": \"words\"},"
        "\"" + std::to_string(CRAM_ID) + "\": {\"name\": \"Cram\", \"dyn\": 1}}";
}

// Writes the collection database: one review card with history, one new
// card currently pulled into a filtered deck, one orphaned history row.
bool buildCollection(const std::string& path, bool withCardsTable = true) {
    sqlite3* db = nullptr;
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
        sqlite3_close(db);
        return false;
    }

    bool ok = exec(db,
        "CREATE TABLE col (id integer primary key, crt integer, mod integer, scm integer, ver integer,"
        " dty integer, usn integer, ls integer, conf text, models text, decks text, dconf text, tags text);"
        "CREATE TABLE notes (id integer primary key, guid text, mid integer, mod integer, usn integer,"
        " tags text, flds text, sfld text, csum integer, flags integer, data text);"
        "CREATE TABLE revlog (id integer primary key, cid integer, usn integer, ease integer, ivl integer,"
        " lastIvl integer, factor integer, time integer, type integer);");

    if (ok && withCardsTable) {
        ok = exec(db,
            "CREATE TABLE cards (id integer primary key, nid integer, did integer, ord integer, mod integer,"
            " usn integer, type integer, queue integer, due integer, ivl integer, factor integer, reps integer,"
            " lapses integer, left integer, odue integer, odid integer, flags integer, data text);");
    }

    sqlite3_stmt* col = nullptr;
    ok = ok && sqlite3_prepare_v2(db, "INSERT INTO col VALUES (1, ?1, 0, 0, 11, 0, 0, 0, '{}', ?2, ?3, ?4, '{}')",
        -1, &col, nullptr) == SQLITE_OK;
    if (ok) {
        const std::string models = modelsJson();
        const std::string decks = decksJson();
        const std::string dconf = "{\"1\": {\"new\": {\"perDay\": 7}, \"rev\": {\"perDay\": 70}}}";
        sqlite3_bind_int64(col, 1, PACKAGE_CRT);
        sqlite3_bind_text(col, 2, models.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(col, 3, decks.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(col, 4, dconf.c_str(), -1, SQLITE_TRANSIENT);
        ok = sqlite3_step(col) == SQLITE_DONE;
    }
    sqlite3_finalize(col);

    ok = ok && insertNote(db, NOTE_HOLA, "guid-hola", " vocab Spanish ", "hola" + SEP + "<img src=\"cat.jpg\">");
    ok = ok && insertNote(db, NOTE_ADIOS, "guid-adios", "", "adios" + SEP + "[sound:bye.mp3]");

    if (ok && withCardsTable) {
        const std::string d = std::to_string(DECK_ID);
        ok = exec(db,
            "INSERT INTO cards VALUES (" + std::to_string(CARD_REVIEW) + ", " + std::to_string(NOTE_HOLA) + ", " + d +
            ", 0, 0, -1, 2, 2, 15, 12, 2300, 5, 1, 0, 0, 0, 3, '');"
            "INSERT INTO cards VALUES (" + std::to_string(CARD_NEW) + ", " + std::to_string(NOTE_ADIOS) + ", " +
            std::to_string(CRAM_ID) + ", 0, 0, -1, 0, 0, -100000, 0, 0, 0, 0, 0, 7, " + d + ", 0, '');"
            "INSERT INTO revlog VALUES (1599000000000, " + std::to_string(CARD_REVIEW) + ", -1, 3, 12, 5, 2300, 5000, 1);"
            "INSERT INTO revlog VALUES (1599000000001, 999, -1, 1, -600, 0, 2500, 3000, 0);");
    }

    sqlite3_close(db);
    return ok;
}

std::string readAll(const std::string& path) {
    std::string text;
    Config::readFile(path, text);
    return text;
}

// Builds "<dir>/deck.apkg"; media tokens 0 (stored) and 1 (deflated).
std::string buildPackage(const TempDir& dir, bool withCardsTable = true) {
    const std::string dbPath = dir.file("fixture.anki2");
    std::filesystem::remove(dbPath);
    if (!buildCollection(dbPath, withCardsTable)) return "";

    ZipBuilder zip;
    zip.add("collection.anki2", readAll(dbPath));
    zip.add("media", "{\"0\": \"cat.jpg\", \"1\": \"bye.mp3\"}", true);
    zip.add("0", "CATDATA");
    zip.add("1", std::string(100000, 'm') + "MP3", true);

    const std::string path = dir.file("deck.apkg");
    zip.write(path);
    return path;
}

bool throwsImport(const std::function<void()>& fn, ImportError::Stage stage) {
    try {
        fn();
    }
    catch (const ImportError& e) {
        return e.stage() == stage;
    }
    return false;
}

/* -------------------------
   Tests
   ------------------------- */

void test_progress_text(TestSuite& suite) {
    ImportProgress p;
    suite.require(p.describe() == "Reading package...", "reading");
    p.phase = ImportPhase::Notes;
    p.total = 412;
    suite.require(p.describe() == "Importing 412 notes...", "phase with total");
    p.phase = ImportPhase::Cards;
    p.done = 50;
    p.total = 100;
    suite.require(p.describe() == "Importing cards (50/100)...", "phase in flight");
    p.phase = ImportPhase::Finished;
    suite.require(p.describe() == "Import finished", "finished");
}

void test_parse(TestSuite& suite) {
    TempDir dir("import-parse");
    const std::string path = buildPackage(dir);
    suite.require(!path.empty(), "fixture built");

    EntityStore store(T0);
    DirectoryMediaStore media(dir.file("media"));
    PackageImporter importer(store, media);

    std::vector<ImportPhase> phases;
    ImportOptions options;
    options.on_progress = [&phases](const ImportProgress& p) {
        phases.push_back(p.phase);
        return true;
    };
    ImportResult result = importer.parse(path, options);

    suite.require(result.source_created_at == PACKAGE_CRT, "collection creation time");
    suite.require(result.models.size() == 1 && result.models[0].fields.size() == 2, "model read");
    suite.require(result.decks.size() == 3, "decks read");
    suite.require(result.notes.size() == 2 && result.cards.size() == 2, "notes and cards read");
    suite.require(result.review_log.size() == 2, "review log read");
    suite.require(result.media_map.size() == 2 && result.media.size() == 2, "media read");
    suite.require(result.hasProgress(), "review state detected");
    suite.require(!result.spill, "in-memory media needs no spill directory");

    for (const auto& m : result.media) {
        if (m.original_name == "bye.mp3") suite.require(m.bytes.size() == 100003, "deflated media inflated");
        if (m.original_name == "cat.jpg") suite.require(m.bytes == "CATDATA", "stored media copied");
    }
    for (const auto& n : result.notes) {
        if (n.id == NOTE_HOLA) suite.require(n.tags == std::vector<std::string>({ "vocab", "Spanish" }), "tags parsed");
    }

    suite.require(!phases.empty() && phases.front() == ImportPhase::Reading && phases.back() == ImportPhase::Finished,
        "progress from reading to finished");
    suite.require(store.noteCount() == 0 && !media.exists("cat.jpg"), "parse writes nothing");
}

void test_commit_with_progress(TestSuite& suite) {
    TempDir dir("import-progress");
    const std::string path = buildPackage(dir);

    EntityStore store(T0);
    DirectoryMediaStore media(dir.file("media"));
    PackageImporter importer(store, media);
    ImportSummary summary = importer.importPackage(path, ImportMode::WithProgress);

    suite.require(summary.models == 1 && summary.notes == 2 && summary.cards == 2, "rows imported");
    suite.require(summary.decks_added == 1 && summary.decks_merged == 0, "only the used deck added");
    suite.require(store.findDeckByName("Default") == nullptr, "unused default deck skipped");
    suite.require(store.findDeckByName("Cram") == nullptr, "filtered deck skipped");
    suite.require(summary.review_entries == 1 && store.reviewLog().size() == 1, "history of imported cards kept");
    suite.require(!summary.warnings.empty(), "orphaned history reported");

    const Deck* deck = store.findDeckByName("Lang::Spanish");
    suite.require(deck && deck->limits.new_per_day == 7 && deck->limits.reviews_per_day == 70, "deck options read");
    suite.require(deck && deck->description == "words", "deck description");

    const Card* review = store.getCard(summary.card_ids[CARD_REVIEW]);
    suite.require(review && review->queue == CardQueue::Review && review->interval == 12 && review->ease == 2300,
        "review state kept");
    suite.require(review && review->due == 5, "review due moved to our day numbering");
    suite.require(review && review->flags == 3 && review->reps == 5 && review->lapses == 1, "counters kept");
    suite.require(review && deck && review->deck_id == deck->id, "card in imported deck");

    const Card* fresh = store.getCard(summary.card_ids[CARD_NEW]);
    suite.require(fresh && !fresh->isRelocated() && deck && fresh->deck_id == deck->id, "filtered card sent home");
    suite.require(fresh && fresh->queue == CardQueue::New && fresh->due == 1, "new card gets our next position");
    suite.require(fresh && fresh->ease == DEFAULT_EASE, "missing ease defaulted");

    suite.require(review && !store.reviewLog().empty() && store.reviewLog()[0].card_id == review->id,
        "history points at the new card id");
    suite.require(media.exists("cat.jpg") && media.exists("bye.mp3"), "media stored");

    const Note* note = store.getNote(summary.note_ids[NOTE_HOLA]);
    suite.require(note && note->fieldValue(1) == "<img src=\"cat.jpg\">", "unchanged media names leave fields alone");
    suite.require(note && note->guid == "guid-hola", "guid kept");
}

void test_commit_fresh(TestSuite& suite) {
    TempDir dir("import-fresh");
    const std::string path = buildPackage(dir);

    EntityStore store(T0);
    EntityId basic = store.addModel(Model::basic());
    EntityId existing = store.addDeck("Lang::Spanish");
    store.addNote(basic, existing, { "uno", "one" }, {}, T0);

    DirectoryMediaStore media(dir.file("media"));
    media.write("cat.jpg", "A DIFFERENT CAT");
    media.write("bye.mp3", std::string(100000, 'm') + "MP3");

    PackageImporter importer(store, media);
    ImportSummary summary = importer.importPackage(path, ImportMode::Fresh);

    suite.require(summary.decks_merged == 1 && summary.decks_added == 0, "deck merged by name");
    suite.require(store.deckCount() == 1, "no duplicate deck");
    suite.require(summary.review_entries == 0 && store.reviewLog().empty(), "history dropped");

    const Card* first = store.getCard(summary.card_ids[CARD_REVIEW]);
    const Card* second = store.getCard(summary.card_ids[CARD_NEW]);
    suite.require(first && first->queue == CardQueue::New && first->type == CardType::New && first->reps == 0,
        "scheduling reset");
    suite.require(first && second && first->due == 2 && second->due == 3, "positions follow existing cards");
    suite.require(first && first->deck_id == existing, "cards land in the merged deck");

    const std::string renamed = summary.media_names["cat.jpg"];
    suite.require(renamed != "cat.jpg" && renamed.find("cat_") == 0, "clashing media renamed");
    suite.require(readAll(dir.file("media/cat.jpg")) == "A DIFFERENT CAT", "existing media untouched");
    suite.require(summary.media_names["bye.mp3"] == "bye.mp3", "identical media reused");

    const Note* note = store.getNote(summary.note_ids[NOTE_HOLA]);
    suite.require(note && note->fieldValue(1) == "<img src=\"" + renamed + "\">", "field points at the renamed file");
}

void test_streaming(TestSuite& suite) {
    TempDir dir("import-stream");
    const std::string path = buildPackage(dir);

    EntityStore store(T0);
    DirectoryMediaStore media(dir.file("media"));
    PackageImporter importer(store, media);

    ImportOptions options;
    options.streaming = true;
    ImportResult result = importer.parse(path, options);
    suite.require(result.spill != nullptr, "spill directory kept for the commit");
    bool spilled = !result.media.empty();
    for (const auto& m : result.media) spilled = spilled && m.bytes.empty() && !m.spill_path.empty();
    suite.require(spilled, "media spilled to disk");

    ImportSummary summary = importer.commit(result, ImportMode::WithProgress);
    suite.require(summary.media_files == 2 && readAll(dir.file("media/cat.jpg")) == "CATDATA", "spilled media copied");
}

void test_abort(TestSuite& suite) {
    TempDir dir("import-abort");
    const std::string path = buildPackage(dir);

    EntityStore store(T0);
    DirectoryMediaStore media(dir.file("media"));
    PackageImporter importer(store, media);
    ImportResult result = importer.parse(path);

    bool aborted = false;
    try {
        importer.commit(result, ImportMode::WithProgress,
            [](const ImportProgress& p) { return p.phase != ImportPhase::Notes; });
    }
    catch (const ImportAborted&) {
        aborted = true;
    }
    suite.require(aborted, "callback stops the import");
    suite.require(store.noteCount() == 0 && store.deckCount() == 0 && store.modelCount() == 0, "store untouched");
    suite.require(!media.exists("cat.jpg") && !media.exists("bye.mp3"), "written media removed");

    bool parseAborted = false;
    ImportOptions options;
    options.on_progress = [](const ImportProgress& p) { return p.phase != ImportPhase::Cards; };
    try {
        importer.parse(path, options);
    }
    catch (const ImportAborted&) {
        parseAborted = true;
    }
    suite.require(parseAborted, "parse can be stopped too");
}

void test_lying_media_sizes(TestSuite& suite) {
    TempDir dir("import-sizes");
    const std::string dbPath = dir.file("fixture.anki2");
    suite.require(buildCollection(dbPath, true), "fixture built");

    ZipBuilder zip;
    zip.add("collection.anki2", readAll(dbPath));
    zip.add("media", "{\"0\": \"cat.jpg\", \"1\": \"bye.mp3\", \"2\": \"big.mp3\"}", true);
    zip.add("0", "CATDATA", false, 0xFFFFFFF0u);
    zip.add("1", std::string(5000, 'b'), true, 0xFFFFFFF0u);
    zip.add("2", std::string(100000, 'g'), true, 1000);
    const std::string path = dir.file("sizes.apkg");
    zip.write(path);

    EntityStore store(T0);
    DirectoryMediaStore media(dir.file("media"));
    PackageImporter importer(store, media);

    for (bool streaming : { false, true }) {
        ImportOptions options;
        options.streaming = streaming;
        ImportResult result = importer.parse(path, options);
        suite.require(result.media.empty(), "entries with false sizes skipped");
        suite.require(result.warnings.size() >= 3, "each bad entry warned about");
        suite.require(result.notes.size() == 2 && result.cards.size() == 2, "rest of the package still read");
    }
}

void test_structural_errors(TestSuite& suite) {
    TempDir dir("import-errors");
    EntityStore store(T0);
    DirectoryMediaStore media(dir.file("media"));
    PackageImporter importer(store, media);

    {
        std::ofstream out(dir.file("plain.txt"));
        out << "this is not a zip archive at all";
    }
    suite.require(throwsImport([&] { importer.parse(dir.file("plain.txt")); }, ImportError::Stage::Archive),
        "non-zip rejected");
    suite.require(throwsImport([&] { importer.parse(dir.file("absent.apkg")); }, ImportError::Stage::Archive),
        "missing file rejected");

    ZipBuilder mediaOnly;
    mediaOnly.add("media", "{}");
    mediaOnly.write(dir.file("empty.apkg"));
    suite.require(throwsImport([&] { importer.parse(dir.file("empty.apkg")); }, ImportError::Stage::Archive),
        "package without a collection rejected");

    const std::string noCards = buildPackage(dir, false);
    suite.require(throwsImport([&] { importer.parse(noCards); }, ImportError::Stage::Schema),
        "collection without cards table rejected");

    ZipBuilder junkDb;
    junkDb.add("collection.anki2", "definitely not sqlite");
    junkDb.write(dir.file("junk.apkg"));
    bool rejected = false;
    try {
        importer.parse(dir.file("junk.apkg"));
    }
    catch (const ImportError& e) {
        rejected = e.stage() == ImportError::Stage::Database || e.stage() == ImportError::Stage::Schema;
    }
    suite.require(rejected, "unreadable database rejected");
    suite.require(store.noteCount() == 0, "store untouched by failures");
}

}  // namespace

int main() {
    Log::initConsole();
    if (sodium_init() < 0) {
        std::cerr << "libsodium init failed" << std::endl;
        return 1;
    }
    TestSuite suite;

    test_progress_text(suite);
    test_parse(suite);
    test_commit_with_progress(suite);
    test_commit_fresh(suite);
    test_streaming(suite);
    test_abort(suite);
    test_lying_media_sizes(suite);
    test_structural_errors(suite);

    return suite.finish("Importer");
}
