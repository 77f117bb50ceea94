#pragma once
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <functional>
#include <ctime>
#include "CollectionReader.hpp"
#include "MediaStore.hpp"
#include "SpillDirectory.hpp"
#include "../core/EntityStore.hpp"

enum class ImportPhase {
    Reading,
    Database,
    Models,
    Decks,
    Notes,
    Cards,
    ReviewLog,
    Media,
    Finished
};

struct ImportProgress {
    ImportPhase phase = ImportPhase::Reading;
    std::size_t done = 0;
    std::size_t total = 0;

    // "Importing 412 notes..." style line for a status bar
    std::string describe() const;
};

// Return false to abort. Called between table batches, never per row.
using ProgressCallback = std::function<bool(const ImportProgress&)>;

struct ImportOptions {
    bool streaming = false;             // spill media to disk instead of memory
    ProgressCallback on_progress;
    std::string temp_dir;               // "" -> system temp dir
};

enum class ImportMode {
    Fresh,                              // every card starts over as New
    WithProgress                        // scheduling state and review log kept
};

struct MediaFile {
    std::string token;                  // numeric name inside the archive
    std::string original_name;
    std::string bytes;                  // in-memory mode
    std::string spill_path;             // streaming mode
};

struct ImportResult {
    std::time_t source_created_at = 0;
    std::vector<Model> models;
    std::vector<PackageDeck> decks;
    std::vector<Note> notes;
    std::vector<Card> cards;
    std::vector<ReviewLogEntry> review_log;
    std::map<std::string, std::string> media_map;   // token -> original filename
    std::vector<MediaFile> media;
    std::vector<std::string> warnings;
    std::shared_ptr<SpillDirectory> spill;

    // True when any card carries scheduling state worth keeping.
    bool hasProgress() const;
};

struct ImportSummary {
    int models = 0;
    int decks_added = 0;
    int decks_merged = 0;
    int notes = 0;
    int cards = 0;
    int review_entries = 0;
    int media_files = 0;
    std::map<EntityId, EntityId> deck_ids;          // package id -> store id
    std::map<EntityId, EntityId> note_ids;
    std::map<EntityId, EntityId> card_ids;
    std::map<std::string, std::string> media_names; // original name -> stored name
    std::vector<std::string> warnings;
};

/*
  Imports .apkg packages: zip container, embedded collection database and
  media manifest.

  parse() only reads; commit() writes into a copy of the store and swaps it
  in at the end, so a structural failure or an abort from the progress
  callback leaves the store untouched and removes media already written.
*/
class PackageImporter {
public:
    PackageImporter(EntityStore& store, MediaStore& media);

    ImportResult parse(const std::string& archivePath, const ImportOptions& options = ImportOptions());
    ImportSummary commit(const ImportResult& result, ImportMode mode,
        const ProgressCallback& onProgress = ProgressCallback());

    // parse + commit
    ImportSummary importPackage(const std::string& archivePath, ImportMode mode,
        const ImportOptions& options = ImportOptions());

private:
    EntityStore& store;
    MediaStore& media;
};
