#pragma once
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>
#include "../core/EntityStore.hpp"

// Saves and loads a whole collection. The engine itself never touches disk.
class Persistence {
public:
    virtual ~Persistence() = default;

    virtual bool save(const EntityStore& store) = 0;

    // std::nullopt when nothing usable is stored
    virtual std::optional<EntityStore> load() = 0;
};

namespace Snapshot
{
    // Every table plus the collection metadata as one JSON document.
    Json::Value toJson(const EntityStore& store);

    // Rebuilds through the store's insert calls, so a snapshot that breaks
    // referential integrity is rejected. Returns false and logs on failure.
    bool fromJson(const Json::Value& root, EntityStore& out);
}

// Snapshot JSON sealed with crypto_secretbox.
//
// File layout:
//   Header: 8 bytes ASCII "FCDATA1\n" (magic + version)
//   Nonce: crypto_secretbox_NONCEBYTES
//   Ciphertext: remaining bytes
//
// The key is derived from a passphrase with crypto_pwhash; the salt lives in
// a "<file>.salt" text file next to the collection (hex).
class EncryptedFilePersistence : public Persistence {
public:
    EncryptedFilePersistence(const std::string& filename, const std::vector<unsigned char>& key);

    bool save(const EntityStore& store) override;
    std::optional<EntityStore> load() override;

    const std::string& path() const { return file_path; }

    // Key helpers
    static std::string newSalt();
    static bool deriveKey(const std::string& passphrase, const std::string& saltHex, std::vector<unsigned char>& key);

    // Reads the salt file of `filename`, creating one when absent.
    static bool saltFor(const std::string& filename, std::string& saltHex);

private:
    std::string file_path;
    std::vector<unsigned char> key;
};
