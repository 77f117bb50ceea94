#include "Storage.hpp"
#include "../core/Errors.hpp"
#include "../utils/Config.hpp"
#include "../utils/Text.hpp"
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sodium.h>
#include <spdlog/spdlog.h>

static const char MAGIC_HDR[] = "FCDATA1\n";
static const int SNAPSHOT_VERSION = 1;
static constexpr std::size_t SALT_BYTES = crypto_pwhash_SALTBYTES;

/* -------------------------
   Snapshot
   ------------------------- */

static Json::Value stringArray(const std::vector<std::string>& values) {
    Json::Value arr(Json::arrayValue);
    for (const auto& v : values) arr.append(v);
    return arr;
}

static std::vector<std::string> readStringArray(const Json::Value& arr) {
    std::vector<std::string> out;
    for (const auto& v : arr) out.push_back(v.asString());
    return out;
}

static Json::Value modelToJson(const Model& m) {
    Json::Value v;
    v["id"] = Json::Int64(m.id);
    v["name"] = m.name;
    v["kind"] = static_cast<int>(m.kind);
    v["fields"] = stringArray(m.fields);
    v["sort_field"] = m.sort_field;
    v["css"] = m.css;
    v["modified"] = Json::Int64(m.modified);

    Json::Value tmpls(Json::arrayValue);
    for (const auto& t : m.templates) {
        Json::Value tv;
        tv["name"] = t.name;
        tv["ord"] = t.ord;
        tv["qfmt"] = t.question_format;
        tv["afmt"] = t.answer_format;
        tmpls.append(tv);
    }
    v["templates"] = tmpls;
    return v;
}

static Model modelFromJson(const Json::Value& v) {
    Model m;
    m.id = v["id"].asInt64();
    m.name = v["name"].asString();
    m.kind = v["kind"].asInt() == 1 ? ModelKind::Cloze : ModelKind::Standard;
    m.fields = readStringArray(v["fields"]);
    m.sort_field = v["sort_field"].asInt();
    m.css = v["css"].asString();
    m.modified = static_cast<std::time_t>(v["modified"].asInt64());
    for (const auto& tv : v["templates"]) {
        CardTemplate t;
        t.name = tv["name"].asString();
        t.ord = tv["ord"].asInt();
        t.question_format = tv["qfmt"].asString();
        t.answer_format = tv["afmt"].asString();
        m.templates.push_back(t);
    }
    return m;
}

static Json::Value deckToJson(const Deck& d) {
    Json::Value v;
    v["id"] = Json::Int64(d.id);
    v["name"] = d.name;
    v["description"] = d.description;
    v["new_per_day"] = d.limits.new_per_day;
    v["reviews_per_day"] = d.limits.reviews_per_day;
    v["collapsed"] = d.collapsed;
    v["browser_collapsed"] = d.browser_collapsed;
    v["filtered"] = d.is_filtered;
    v["modified"] = Json::Int64(d.modified);
    return v;
}

static Deck deckFromJson(const Json::Value& v) {
    Deck d(v["id"].asInt64(), v["name"].asString());
    d.description = v["description"].asString();
    d.limits.new_per_day = v["new_per_day"].asInt();
    d.limits.reviews_per_day = v["reviews_per_day"].asInt();
    d.collapsed = v["collapsed"].asBool();
    d.browser_collapsed = v["browser_collapsed"].asBool();
    d.is_filtered = v["filtered"].asBool();
    d.modified = static_cast<std::time_t>(v["modified"].asInt64());
    return d;
}

static Json::Value noteToJson(const Note& n) {
    Json::Value v;
    v["id"] = Json::Int64(n.id);
    v["model_id"] = Json::Int64(n.model_id);
    v["guid"] = n.guid;
    v["fields"] = n.fields;
    v["tags"] = stringArray(n.tags);
    v["modified"] = Json::Int64(n.modified);
    v["deleted"] = n.deleted;
    return v;
}

static Note noteFromJson(const Json::Value& v) {
    Note n;
    n.id = v["id"].asInt64();
    n.model_id = v["model_id"].asInt64();
    n.guid = v["guid"].asString();
    n.fields = v["fields"].asString();
    n.tags = readStringArray(v["tags"]);
    n.modified = static_cast<std::time_t>(v["modified"].asInt64());
    n.deleted = v["deleted"].asBool();
    return n;
}

static Json::Value cardToJson(const Card& c) {
    Json::Value v;
    v["id"] = Json::Int64(c.id);
    v["note_id"] = Json::Int64(c.note_id);
    v["deck_id"] = Json::Int64(c.deck_id);
    v["ord"] = c.ord;
    v["queue"] = static_cast<int>(c.queue);
    v["type"] = static_cast<int>(c.type);
    v["due"] = Json::Int64(c.due);
    v["interval"] = c.interval;
    v["ease"] = c.ease;
    v["reps"] = c.reps;
    v["lapses"] = c.lapses;
    v["remaining_steps"] = c.remaining_steps;
    v["original_due"] = Json::Int64(c.original_due);
    v["original_deck"] = Json::Int64(c.original_deck);
    v["flags"] = c.flags;
    v["deleted"] = c.deleted;
    v["modified"] = Json::Int64(c.modified);
    return v;
}

static Card cardFromJson(const Json::Value& v) {
    Card c;
    c.id = v["id"].asInt64();
    c.note_id = v["note_id"].asInt64();
    c.deck_id = v["deck_id"].asInt64();
    c.ord = v["ord"].asInt();

    int queue = v["queue"].asInt();
    int type = v["type"].asInt();
    if (queue < -3 || queue > 4 || type < 0 || type > 3)
        throw IntegrityError("Card " + std::to_string(c.id) + " has an unknown queue or type");
    c.queue = static_cast<CardQueue>(queue);
    c.type = static_cast<CardType>(type);

    c.due = v["due"].asInt64();
    c.interval = v["interval"].asInt();
    c.ease = v["ease"].asInt();
    c.reps = v["reps"].asInt();
    c.lapses = v["lapses"].asInt();
    c.remaining_steps = v["remaining_steps"].asInt();
    c.original_due = v["original_due"].asInt64();
    c.original_deck = v["original_deck"].asInt64();
    c.flags = v["flags"].asInt() & 7;
    c.deleted = v["deleted"].asBool();
    c.modified = static_cast<std::time_t>(v["modified"].asInt64());
    return c;
}

static Json::Value reviewToJson(const ReviewLogEntry& e) {
    Json::Value v;
    v["id"] = Json::Int64(e.id);
    v["card_id"] = Json::Int64(e.card_id);
    v["ease"] = e.ease;
    v["interval"] = e.interval;
    v["last_interval"] = e.last_interval;
    v["factor"] = e.factor;
    v["time_taken_ms"] = e.time_taken_ms;
    v["kind"] = static_cast<int>(e.kind);
    v["was_new"] = e.was_new;
    return v;
}

static ReviewLogEntry reviewFromJson(const Json::Value& v) {
    ReviewLogEntry e;
    e.id = v["id"].asInt64();
    e.card_id = v["card_id"].asInt64();
    e.ease = v["ease"].asInt();
    e.interval = v["interval"].asInt();
    e.last_interval = v["last_interval"].asInt();
    e.factor = v["factor"].asInt();
    e.time_taken_ms = v["time_taken_ms"].asInt();
    int kind = v["kind"].asInt();
    e.kind = kind >= 0 && kind <= 3 ? static_cast<ReviewKind>(kind) : ReviewKind::Review;
    e.was_new = v["was_new"].asBool();
    return e;
}

namespace Snapshot
{
    Json::Value toJson(const EntityStore& store) {
        Json::Value root;
        root["version"] = SNAPSHOT_VERSION;

        const CollectionInfo& info = store.info();
        root["collection"]["created_at"] = Json::Int64(info.created_at);
        root["collection"]["rollover_hour"] = info.rollover_hour;
        root["collection"]["next_position"] = Json::Int64(info.next_position);

        root["models"] = Json::Value(Json::arrayValue);
        for (const Model* m : store.models()) root["models"].append(modelToJson(*m));

        root["decks"] = Json::Value(Json::arrayValue);
        for (const Deck* d : store.decks()) root["decks"].append(deckToJson(*d));

        root["notes"] = Json::Value(Json::arrayValue);
        for (const Note* n : store.notes(true)) root["notes"].append(noteToJson(*n));

        root["cards"] = Json::Value(Json::arrayValue);
        for (const Card* c : store.cards(true)) root["cards"].append(cardToJson(*c));

        root["revlog"] = Json::Value(Json::arrayValue);
        for (const auto& e : store.reviewLog()) root["revlog"].append(reviewToJson(e));

        return root;
    }

    bool fromJson(const Json::Value& root, EntityStore& out) {
        if (!root.isObject() || root["version"].asInt() != SNAPSHOT_VERSION) {
            spdlog::error("Unsupported snapshot version");
            return false;
        }

        try {
            const Json::Value& col = root["collection"];
            CollectionInfo info;
            info.created_at = static_cast<std::time_t>(col["created_at"].asInt64());
            info.rollover_hour = col["rollover_hour"].asInt();
            info.next_position = col["next_position"].asInt64();

            EntityStore store(info.created_at, info.rollover_hour);
            for (const auto& v : root["models"]) store.insertModel(modelFromJson(v));
            for (const auto& v : root["decks"]) store.insertDeck(deckFromJson(v));
            for (const auto& v : root["notes"]) store.insertNote(noteFromJson(v));
            for (const auto& v : root["cards"]) store.insertCard(cardFromJson(v));
            std::size_t dangling = 0;
            for (const auto& v : root["revlog"]) {
                ReviewLogEntry entry = reviewFromJson(v);
                if (!store.getCard(entry.card_id)) {
                    ++dangling;
                    continue;
                }
                store.appendReview(entry);
            }
            if (dangling > 0)
                spdlog::warn("Snapshot: dropped {} review(s) of cards that no longer exist", dangling);
            store.restoreCollectionInfo(info);

            out = std::move(store);
        }
        catch (const IntegrityError& e) {
            spdlog::error("Snapshot rejected: {}", e.what());
            return false;
        }
        catch (const Json::Exception& e) {
            spdlog::error("Snapshot malformed: {}", e.what());
            return false;
        }

        spdlog::info("Snapshot restored: {} models, {} decks, {} notes, {} cards",
            out.modelCount(), out.deckCount(), out.noteCount(), out.cardCount());
        return true;
    }
}

/* -------------------------
   EncryptedFilePersistence
   ------------------------- */

EncryptedFilePersistence::EncryptedFilePersistence(const std::string& filename, const std::vector<unsigned char>& derivedKey)
    : file_path(filename),
    key(derivedKey)
{
}

bool EncryptedFilePersistence::save(const EntityStore& store) {
    spdlog::info("Saving collection ({} notes, {} cards) to '{}'", store.noteCount(), store.cardCount(), file_path);
    if (key.size() != crypto_secretbox_KEYBYTES) {
        spdlog::error("Invalid key size");
        return false;
    }

    std::string plain = Config::writeJson(Snapshot::toJson(store));
    const unsigned char* p = reinterpret_cast<const unsigned char*>(plain.data());
    unsigned long long plen = plain.size();

    std::vector<unsigned char> ciphertext(plen + crypto_secretbox_MACBYTES);

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    randombytes_buf(nonce, sizeof(nonce));

    if (crypto_secretbox_easy(ciphertext.data(), p, plen, nonce, key.data()) != 0) {
        spdlog::error("Encryption failed");
        return false;
    }

    // write next to the target, then swap, so a failed write keeps the old file
    const std::string tmp = file_path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            spdlog::error("Failed to open '{}' for encrypted write", tmp);
            return false;
        }

        out.write(MAGIC_HDR, sizeof(MAGIC_HDR) - 1);
        out.write(reinterpret_cast<const char*>(nonce), sizeof(nonce));
        out.write(reinterpret_cast<const char*>(ciphertext.data()), ciphertext.size());
        if (!out) {
            spdlog::error("Short write to '{}'", tmp);
            return false;
        }
    }

    if (std::rename(tmp.c_str(), file_path.c_str()) != 0) {
        spdlog::error("Failed to replace '{}'", file_path);
        std::remove(tmp.c_str());
        return false;
    }
    return true;
}

std::optional<EntityStore> EncryptedFilePersistence::load() {
    spdlog::info("Loading collection from '{}'", file_path);

    if (key.size() != crypto_secretbox_KEYBYTES) {
        spdlog::error("Invalid key size");
        return std::nullopt;
    }

    std::ifstream in(file_path, std::ios::binary);
    if (!in) {
        spdlog::warn("Collection file '{}' not found", file_path);
        return std::nullopt;
    }

    char hdr[sizeof(MAGIC_HDR) - 1];
    in.read(hdr, sizeof(hdr));
    if (in.gcount() != sizeof(hdr) || std::strncmp(hdr, MAGIC_HDR, sizeof(hdr)) != 0) {
        spdlog::error("Invalid magic header");
        return std::nullopt;
    }

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    in.read(reinterpret_cast<char*>(nonce), sizeof(nonce));
    if (in.gcount() != sizeof(nonce)) {
        spdlog::error("Failed to read nonce");
        return std::nullopt;
    }

    std::vector<unsigned char> ciphertext(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>());

    if (ciphertext.size() < crypto_secretbox_MACBYTES) {
        spdlog::error("Ciphertext too short");
        return std::nullopt;
    }

    std::vector<unsigned char> plain(ciphertext.size() - crypto_secretbox_MACBYTES);
    if (crypto_secretbox_open_easy(plain.data(), ciphertext.data(), ciphertext.size(), nonce, key.data()) != 0) {
        spdlog::error("Decryption failed (wrong passphrase or corrupted file)");
        return std::nullopt;
    }

    std::string plain_str(reinterpret_cast<char*>(plain.data()), plain.size());
    Json::Value root;
    std::string errors;
    if (!Config::parseJson(plain_str, root, &errors)) {
        spdlog::error("Collection JSON unreadable: {}", errors);
        return std::nullopt;
    }

    EntityStore store;
    if (!Snapshot::fromJson(root, store)) return std::nullopt;
    return store;
}

/* -------------------------
   Key helpers
   ------------------------- */

std::string EncryptedFilePersistence::newSalt() {
    unsigned char salt[SALT_BYTES];
    randombytes_buf(salt, SALT_BYTES);

    char hex[2 * SALT_BYTES + 1];
    sodium_bin2hex(hex, sizeof(hex), salt, SALT_BYTES);
    return std::string(hex);
}

bool EncryptedFilePersistence::deriveKey(const std::string& passphrase, const std::string& saltHex, std::vector<unsigned char>& out) {
    spdlog::debug("Deriving collection key (not logging passphrase or salt)");

    std::vector<unsigned char> salt(SALT_BYTES);
    std::size_t binLen = 0;
    if (sodium_hex2bin(salt.data(), salt.size(), saltHex.c_str(), saltHex.size(),
        nullptr, &binLen, nullptr) != 0 || binLen != SALT_BYTES)
    {
        spdlog::error("Failed to decode salt for key derivation");
        return false;
    }

    out.assign(crypto_secretbox_KEYBYTES, 0);
    if (crypto_pwhash(out.data(),
        out.size(),
        passphrase.c_str(),
        static_cast<unsigned long long>(passphrase.size()),
        salt.data(),
        crypto_pwhash_OPSLIMIT_INTERACTIVE,
        crypto_pwhash_MEMLIMIT_INTERACTIVE,
        crypto_pwhash_ALG_DEFAULT) != 0)
    {
        spdlog::error("crypto_pwhash failed during key derivation");
        out.clear();
        return false;
    }
    return true;
}

bool EncryptedFilePersistence::saltFor(const std::string& filename, std::string& saltHex) {
    const std::string saltPath = filename + ".salt";
    std::string text;
    if (Config::readFile(saltPath, text)) {
        saltHex = Text::trim(text);
        return !saltHex.empty();
    }

    saltHex = newSalt();
    std::ofstream out(saltPath, std::ios::trunc);
    if (!out) {
        spdlog::error("Failed to write salt file '{}'", saltPath);
        return false;
    }
    out << saltHex << "\n";
    spdlog::info("Created salt file '{}'", saltPath);
    return true;
}
