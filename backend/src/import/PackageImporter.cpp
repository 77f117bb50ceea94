#include "PackageImporter.hpp"
#include "ZipArchive.hpp"
#include "../core/Errors.hpp"
#include "../utils/Config.hpp"
#include <algorithm>
#include <set>
#include <spdlog/spdlog.h>

static const std::size_t ROW_BATCH = 1000;
static const std::size_t MEDIA_BATCH = 100;
static const EntityId DEFAULT_DECK_ID = 1;
static const std::int64_t TIMESTAMP_THRESHOLD = 1000000000;

static const char* phaseNoun(ImportPhase phase) {
    switch (phase) {
    case ImportPhase::Models: return "note types";
    case ImportPhase::Decks: return "decks";
    case ImportPhase::Notes: return "notes";
    case ImportPhase::Cards: return "cards";
    case ImportPhase::ReviewLog: return "review log entries";
    case ImportPhase::Media: return "media files";
    default: return "";
    }
}

std::string ImportProgress::describe() const {
    switch (phase) {
    case ImportPhase::Reading: return "Reading package...";
    case ImportPhase::Database: return "Opening collection...";
    case ImportPhase::Finished: return "Import finished";
    default: break;
    }
    const std::string noun = phaseNoun(phase);
    if (total == 0) return "Importing " + noun + "...";
    if (done > 0 && done < total)
        return "Importing " + noun + " (" + std::to_string(done) + "/" + std::to_string(total) + ")...";
    return "Importing " + std::to_string(total) + " " + noun + "...";
}

bool ImportResult::hasProgress() const {
    if (!review_log.empty()) return true;
    return std::any_of(cards.begin(), cards.end(), [](const Card& c) {
        return c.type != CardType::New || c.queue != CardQueue::New;
    });
}

// Gives the caller a chance to abort between batches.
static void report(const ProgressCallback& callback, ImportPhase phase, std::size_t done, std::size_t total) {
    if (!callback) return;
    ImportProgress progress;
    progress.phase = phase;
    progress.done = done;
    progress.total = total;
    spdlog::debug("{}", progress.describe());
    if (!callback(progress)) {
        spdlog::warn("Import aborted by caller at: {}", progress.describe());
        throw ImportAborted();
    }
}

PackageImporter::PackageImporter(EntityStore& entityStore, MediaStore& mediaStore)
    : store(entityStore),
    media(mediaStore)
{
}

/* -------------------------
   Parsing
   ------------------------- */

ImportResult PackageImporter::parse(const std::string& archivePath, const ImportOptions& options) {
    const ProgressCallback& callback = options.on_progress;
    spdlog::info("Parsing package '{}' (streaming={})", archivePath, options.streaming);
    report(callback, ImportPhase::Reading, 0, 0);

    ZipArchive zip(archivePath);

    // newer exporters write collection.anki21 next to a stub collection.anki2
    const ZipEntry* collection = zip.find("collection.anki21");
    if (!collection) collection = zip.find("collection.anki2");
    if (!collection)
        throw ImportError(ImportError::Stage::Archive, "Package contains no collection database");

    auto spill = std::make_shared<SpillDirectory>(options.temp_dir);
    const std::string dbPath = spill->file("collection.db");
    std::string problem;
    if (!zip.extractTo(*collection, dbPath, problem))
        throw ImportError(ImportError::Stage::Archive, "Cannot extract " + collection->name + ": " + problem);

    report(callback, ImportPhase::Database, 0, 0);

    ImportResult result;
    {
        CollectionReader reader(dbPath);
        result.source_created_at = reader.createdAt();

        result.models = reader.readModels(result.warnings);
        report(callback, ImportPhase::Models, result.models.size(), result.models.size());

        result.decks = reader.readDecks(result.warnings);
        report(callback, ImportPhase::Decks, result.decks.size(), result.decks.size());

        result.notes = reader.readNotes(result.warnings);
        report(callback, ImportPhase::Notes, result.notes.size(), result.notes.size());

        result.cards = reader.readCards(result.warnings);
        report(callback, ImportPhase::Cards, result.cards.size(), result.cards.size());

        result.review_log = reader.readReviewLog(result.warnings);
        report(callback, ImportPhase::ReviewLog, result.review_log.size(), result.review_log.size());
    }

    auto warn = [&result](const std::string& msg) {
        result.warnings.push_back(msg);
        spdlog::warn("{}", msg);
    };

    const ZipEntry* manifest = zip.find("media");
    if (!manifest) {
        spdlog::info("Package has no media manifest");
    }
    else {
        std::string text;
        Json::Value root;
        if (!zip.read(*manifest, text, problem) || !Config::parseJson(text, root) || !root.isObject()) {
            warn("Media manifest unreadable; media skipped");
        }
        else {
            for (const auto& token : root.getMemberNames()) {
                if (root[token].isString()) result.media_map[token] = root[token].asString();
                else warn("Media manifest entry " + token + " has no filename");
            }
        }
    }

    const std::size_t total = result.media_map.size();
    report(callback, ImportPhase::Media, 0, total);
    std::size_t done = 0;
    for (const auto& entry : result.media_map) {
        ++done;
        const ZipEntry* file = zip.find(entry.first);
        if (!file) {
            warn("Media file " + entry.first + " (" + entry.second + ") missing from package");
            continue;
        }

        MediaFile m;
        m.token = entry.first;
        m.original_name = entry.second;
        bool ok;
        if (options.streaming) {
            m.spill_path = spill->file("media-" + std::to_string(done));
            ok = zip.extractTo(*file, m.spill_path, problem);
        }
        else {
            ok = zip.read(*file, m.bytes, problem);
        }
        if (!ok) {
            warn("Media file " + entry.first + " (" + entry.second + ") unreadable: " + problem);
            continue;
        }
        result.media.push_back(std::move(m));

        if (done % MEDIA_BATCH == 0 && done < total) report(callback, ImportPhase::Media, done, total);
    }
    if (total > 0) report(callback, ImportPhase::Media, total, total);

    if (options.streaming && !result.media.empty()) result.spill = spill;

    report(callback, ImportPhase::Finished, 0, 0);
    spdlog::info("Parsed package: {} note types, {} decks, {} notes, {} cards, {} media, {} warning(s)",
        result.models.size(), result.decks.size(), result.notes.size(), result.cards.size(),
        result.media.size(), result.warnings.size());
    return result;
}

/* -------------------------
   Committing
   ------------------------- */

ImportSummary PackageImporter::commit(const ImportResult& result, ImportMode mode, const ProgressCallback& onProgress) {
    spdlog::info("Committing import ({} mode)", mode == ImportMode::Fresh ? "fresh" : "with progress");

    ImportSummary summary;
    summary.warnings = result.warnings;
    auto warn = [&summary](const std::string& msg) {
        summary.warnings.push_back(msg);
        spdlog::warn("{}", msg);
    };

    EntityStore work = store;
    std::vector<std::string> written;

    try {
        // note types
        std::map<EntityId, EntityId> modelIds;
        report(onProgress, ImportPhase::Models, 0, result.models.size());
        for (const auto& source : result.models) {
            Model model = source;
            model.id = NO_ID;
            try {
                modelIds[source.id] = work.addModel(model);
                ++summary.models;
            }
            catch (const IntegrityError& e) {
                warn("Skipped note type '" + source.name + "': " + e.what());
            }
        }

        // decks, merged by full name
        std::set<EntityId> usedDecks;
        for (const auto& c : result.cards)
            usedDecks.insert(c.original_deck != NO_ID ? c.original_deck : c.deck_id);

        report(onProgress, ImportPhase::Decks, 0, result.decks.size());
        for (const auto& entry : result.decks) {
            const Deck& source = entry.deck;
            if (source.is_filtered) {
                spdlog::debug("Skipping filtered deck '{}'", source.name);
                continue;
            }
            if (source.id == DEFAULT_DECK_ID && !usedDecks.count(DEFAULT_DECK_ID)) {
                spdlog::debug("Skipping empty default deck");
                continue;
            }

            const std::string name = DeckPath::normalize(source.name);
            if (name.empty()) {
                warn("Skipped deck with invalid name '" + source.name + "'");
                continue;
            }
            if (const Deck* existing = work.findDeckByName(name)) {
                summary.deck_ids[source.id] = existing->id;
                ++summary.decks_merged;
                continue;
            }

            Deck deck = source;
            deck.id = NO_ID;
            deck.name = name;
            try {
                summary.deck_ids[source.id] = work.insertDeck(deck);
                ++summary.decks_added;
            }
            catch (const IntegrityError& e) {
                warn("Skipped deck '" + source.name + "': " + e.what());
            }
        }

        // media first, so note fields can point at the stored names
        std::map<std::string, std::string> renames;
        std::size_t mediaDone = 0;
        report(onProgress, ImportPhase::Media, 0, result.media.size());
        for (const auto& file : result.media) {
            ++mediaDone;
            std::string sum;
            if (file.spill_path.empty()) {
                sum = Media::checksum(file.bytes);
            }
            else if (!Media::checksumFile(file.spill_path, sum)) {
                warn("Media file '" + file.original_name + "' vanished from the spill directory");
                continue;
            }

            std::string name = Media::sanitizeFilename(file.original_name);
            if (name != file.original_name)
                spdlog::warn("Sanitized media filename '{}' to '{}'", file.original_name, name);
            if (media.exists(name) && media.checksum(name) != sum)
                name = Media::withSuffix(name, sum.substr(0, 8));

            if (!(media.exists(name) && media.checksum(name) == sum)) {
                bool ok = file.spill_path.empty() ? media.write(name, file.bytes) : media.copyFrom(name, file.spill_path);
                if (!ok) {
                    warn("Failed to store media '" + file.original_name + "'");
                    continue;
                }
                written.push_back(name);
            }

            renames[file.original_name] = name;
            renames[file.token] = name;
            summary.media_names[file.original_name] = name;
            ++summary.media_files;

            if (mediaDone % MEDIA_BATCH == 0) report(onProgress, ImportPhase::Media, mediaDone, result.media.size());
        }

        // notes, in package id order so re-imports allocate ids the same way
        report(onProgress, ImportPhase::Notes, 0, result.notes.size());
        std::size_t notesDone = 0;
        for (const auto& source : result.notes) {
            ++notesDone;
            auto model = modelIds.find(source.model_id);
            if (model == modelIds.end()) {
                warn("Skipped note " + std::to_string(source.id) + ": unknown note type " + std::to_string(source.model_id));
                continue;
            }

            Note note = source;
            note.id = work.allocateId();
            note.model_id = model->second;
            note.deleted = false;
            if (note.guid.empty()) note.guid = Note::generateGuid();

            try {
                if (!renames.empty()) {
                    auto values = note.fieldValues();
                    for (auto& v : values) Media::rewriteReferences(v, renames);
                    note.setFieldValues(values);
                }
                work.insertNote(note);
                summary.note_ids[source.id] = note.id;
                ++summary.notes;
            }
            catch (const IntegrityError& e) {
                warn("Skipped note " + std::to_string(source.id) + ": " + e.what());
            }

            if (notesDone % ROW_BATCH == 0) report(onProgress, ImportPhase::Notes, notesDone, result.notes.size());
        }

        // new-card positions continue after the target's last position
        std::vector<const Card*> restarting;
        for (const auto& c : result.cards) {
            if (mode == ImportMode::Fresh || c.type == CardType::New) restarting.push_back(&c);
        }
        std::stable_sort(restarting.begin(), restarting.end(), [mode](const Card* a, const Card* b) {
            if (mode == ImportMode::Fresh) {
                if (a->note_id != b->note_id) return a->note_id < b->note_id;
                return a->ord < b->ord;
            }
            if (a->due != b->due) return a->due < b->due;
            return a->id < b->id;
        });
        std::map<EntityId, std::int64_t> positions;
        for (const Card* c : restarting) positions[c->id] = work.takeNextPosition();

        // day counters move from the package's creation day to ours
        const std::int64_t dayShift = work.today(result.source_created_at);

        report(onProgress, ImportPhase::Cards, 0, result.cards.size());
        std::size_t cardsDone = 0;
        for (const auto& source : result.cards) {
            ++cardsDone;
            const EntityId home = source.original_deck != NO_ID ? source.original_deck : source.deck_id;
            auto note = summary.note_ids.find(source.note_id);
            auto deck = summary.deck_ids.find(home);
            if (note == summary.note_ids.end() || deck == summary.deck_ids.end()) {
                warn("Skipped card " + std::to_string(source.id) + ": " +
                    (note == summary.note_ids.end() ? "note" : "deck") + " not imported");
                continue;
            }

            Card card = source;
            card.id = work.allocateId();
            card.note_id = note->second;
            card.deck_id = deck->second;
            card.deleted = false;
            if (source.original_deck != NO_ID) card.due = source.original_due;
            card.original_deck = NO_ID;
            card.original_due = 0;

            if (mode == ImportMode::Fresh) {
                card.type = CardType::New;
                card.queue = CardQueue::New;
                card.due = positions[source.id];
                card.interval = 0;
                card.ease = DEFAULT_EASE;
                card.reps = 0;
                card.lapses = 0;
                card.remaining_steps = 0;
            }
            else {
                if (card.ease <= 0) card.ease = DEFAULT_EASE;
                const bool learning = card.type == CardType::Learning || card.type == CardType::Relearning;
                if (card.queue == CardQueue::UserBuried || card.queue == CardQueue::SchedBuried ||
                    card.queue == CardQueue::Preview) {
                    if (card.type == CardType::New) card.queue = CardQueue::New;
                    else if (card.type == CardType::Review) card.queue = CardQueue::Review;
                    else card.queue = card.due >= TIMESTAMP_THRESHOLD ? CardQueue::Learning : CardQueue::DayLearn;
                }

                if (card.type == CardType::New) {
                    card.due = positions[source.id];
                }
                else if (card.type == CardType::Review || (learning && card.due < TIMESTAMP_THRESHOLD)) {
                    card.due += dayShift;
                }
            }

            try {
                work.insertCard(card);
                summary.card_ids[source.id] = card.id;
                ++summary.cards;
            }
            catch (const IntegrityError& e) {
                warn("Skipped card " + std::to_string(source.id) + ": " + e.what());
            }

            if (cardsDone % ROW_BATCH == 0) report(onProgress, ImportPhase::Cards, cardsDone, result.cards.size());
        }

        if (mode == ImportMode::WithProgress) {
            report(onProgress, ImportPhase::ReviewLog, 0, result.review_log.size());
            int orphaned = 0;
            for (const auto& source : result.review_log) {
                auto card = summary.card_ids.find(source.card_id);
                if (card == summary.card_ids.end()) {
                    ++orphaned;
                    continue;
                }
                ReviewLogEntry entry = source;
                entry.card_id = card->second;
                work.appendReview(entry);
                ++summary.review_entries;
            }
            if (orphaned > 0) warn("Dropped " + std::to_string(orphaned) + " review log entries of cards not imported");
        }

        report(onProgress, ImportPhase::Finished, 0, 0);
    }
    catch (...) {
        for (const auto& name : written) media.remove(name);
        spdlog::warn("Import rolled back; {} media file(s) removed", written.size());
        throw;
    }

    store = std::move(work);
    spdlog::info("Import committed: {} note types, {} decks added, {} merged, {} notes, {} cards, {} reviews, {} media",
        summary.models, summary.decks_added, summary.decks_merged, summary.notes, summary.cards,
        summary.review_entries, summary.media_files);
    return summary;
}

ImportSummary PackageImporter::importPackage(const std::string& archivePath, ImportMode mode, const ImportOptions& options) {
    ImportResult result = parse(archivePath, options);
    return commit(result, mode, options.on_progress);
}
