#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <sodium.h>
#include <algorithm>
#include <limits>
#include <ctime>

#include "../utils/logging.hpp"
#include "../utils/Config.hpp"
#include "../utils/Text.hpp"
#include "../core/Cloze.hpp"
#include "../core/Errors.hpp"
#include "../core/Scheduler.hpp"
#include "../import/PackageImporter.hpp"
#include "../search/SearchIndex.hpp"
#include "../storage/Storage.hpp"

struct CliOptions {
    std::string config_path = "config/scheduler.json";
    std::string collection_path = "collection.dat";
    std::string media_dir = "media";
    std::string log_path = "flashcore.log";
    bool verbose = false;
};

static void printUsage() {
    std::cout << "Usage: flashcore [--config FILE] [--collection FILE] [--media DIR] [--log FILE] [--verbose]\n";
}

static bool parseArgs(int argc, char** argv, CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&](std::string& target) {
            if (i + 1 >= argc) return false;
            target = argv[++i];
            return true;
        };

        if (arg == "--config") { if (!value(opts.config_path)) return false; }
        else if (arg == "--collection") { if (!value(opts.collection_path)) return false; }
        else if (arg == "--media") { if (!value(opts.media_dir)) return false; }
        else if (arg == "--log") { if (!value(opts.log_path)) return false; }
        else if (arg == "--verbose") opts.verbose = true;
        else return false;
    }
    return true;
}

static int readChoice() {
    int choice;
    if (!(std::cin >> choice)) {
        std::cin.clear();
        std::string dummy; std::getline(std::cin, dummy);
        return -1;
    }
    std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    return choice;
}

static std::string prompt(const std::string& label) {
    std::cout << label;
    std::string line;
    std::getline(std::cin, line);
    return line;
}

int askQuality() {
    while (true) {
        std::cout << "\nChoose difficulty:\n"
            " 1 = AGAIN (Failed)\n"
            " 2 = HARD\n"
            " 3 = GOOD\n"
            " 4 = EASY\n> ";
        int q = readChoice();
        if (q >= 1 && q <= 4) return q;
        std::cout << "Invalid input.\n";
    }
}

/* -------------------------
   Rendering
   ------------------------- */

static std::string fillTemplate(std::string format, const Model& model, const Note& note) {
    for (int i = 0; i < model.fieldCount(); ++i)
        Text::replaceAll(format, "{{" + model.fields[i] + "}}", note.fieldValue(i));
    return format;
}

static void renderCard(const EntityStore& store, const Card& card, std::string& question, std::string& answer) {
    const Note* note = store.getNote(card.note_id);
    const Model* model = note ? store.getModel(note->model_id) : nullptr;
    if (!note || !model) {
        question = answer = "(missing note)";
        return;
    }

    if (model->isCloze()) {
        std::string text = note->fieldValue(model->clozeFieldIndex());
        question = Text::plainText(ClozeEngine::renderQuestion(text, card.ord + 1));
        answer = Text::plainText(ClozeEngine::renderAnswer(text, card.ord + 1));
        return;
    }

    const CardTemplate& tmpl = model->templates.at(card.ord);
    question = fillTemplate(tmpl.question_format, *model, *note);
    std::string back = tmpl.answer_format;
    Text::replaceAll(back, "{{FrontSide}}", question);
    question = Text::plainText(question);
    answer = Text::plainText(fillTemplate(back, *model, *note));
}

/* -------------------------
   Menu actions
   ------------------------- */

void listDecks(const EntityStore& store) {
    std::cout << "\n===== DECKS =====\n";
    auto decks = store.decks();
    if (decks.empty()) {
        std::cout << "No decks.\n";
        return;
    }

    for (std::size_t i = 0; i < decks.size(); ++i) {
        const Deck* d = decks[i];
        std::cout << i + 1 << ". " << std::string(2 * (DeckPath::depth(d->name) - 1), ' ')
            << DeckPath::leaf(d->name)
            << "  [" << store.cardsInDeckTree(d->id).size() << " cards]"
            << (d->is_filtered ? " (filtered)" : "") << "\n";
    }
}

const Deck* chooseDeck(const EntityStore& store) {
    auto decks = store.decks();
    if (decks.empty()) {
        std::cout << "No decks available.\n";
        return nullptr;
    }
    listDecks(store);
    std::cout << "Choose deck number: ";
    int sel = readChoice();
    if (sel < 1 || static_cast<std::size_t>(sel) > decks.size()) {
        std::cout << "Invalid selection.\n";
        return nullptr;
    }
    return decks[sel - 1];
}

void importPackage(EntityStore& store, DirectoryMediaStore& media, SearchIndex& index) {
    std::string path = Text::trim(prompt("Package path (.apkg): "));
    if (path.empty()) return;

    ImportOptions options;
    options.streaming = true;
    options.on_progress = [](const ImportProgress& p) {
        std::cout << "  " << p.describe() << "\n";
        return true;
    };

    PackageImporter importer(store, media);
    try {
        ImportResult result = importer.parse(path, options);

        ImportMode mode = ImportMode::Fresh;
        if (result.hasProgress()) {
            std::string answer = Text::toLower(prompt("Package has study progress. Keep it? (y/n): "));
            if (!answer.empty() && answer[0] == 'y') mode = ImportMode::WithProgress;
        }

        ImportSummary summary = importer.commit(result, mode, options.on_progress);
        std::cout << "Imported " << summary.notes << " notes, " << summary.cards << " cards, "
            << summary.decks_added << " new decks (" << summary.decks_merged << " merged), "
            << summary.media_files << " media files.\n";
        if (!summary.warnings.empty())
            std::cout << summary.warnings.size() << " warning(s); see the log for details.\n";
        index.indexAll();
    }
    catch (const ImportError& e) {
        std::cout << "Import failed: " << e.what() << "\n";
    }
    catch (const ImportAborted& e) {
        std::cout << e.what() << "\n";
    }
}

void studyDeck(EntityStore& store, Scheduler& scheduler) {
    const Deck* deck = chooseDeck(store);
    if (!deck) return;

    StudySession session = scheduler.startSession(deck->id, std::time(nullptr));
    int answered = 0;

    while (true) {
        std::time_t now = std::time(nullptr);
        const Card* card = scheduler.nextCard(session, now);
        if (!card) {
            std::cout << (answered ? "Congratulations! Deck finished for now.\n" : "No cards due.\n");
            return;
        }

        std::string question, answer;
        renderCard(store, *card, question, answer);
        std::cout << "\nQ: " << question << "\n";
        std::string reveal = prompt("(press Enter to show the answer, 'q' + Enter to stop) ");
        if (!reveal.empty() && (reveal[0] == 'q' || reveal[0] == 'Q')) return;
        std::cout << "A: " << answer << "\n";

        int q = askQuality();
        try {
            AnswerOutcome out = scheduler.answer(session, card->id, static_cast<ReviewQuality>(q),
                std::time(nullptr), static_cast<int>(std::time(nullptr) - now) * 1000);
            ++answered;
            if (out.leech) std::cout << "This card is a leech (tagged 'leech').\n";
        }
        catch (const SchedulingError& e) {
            std::cout << "Could not record answer: " << e.what() << "\n";
            return;
        }
    }
}

void searchNotes(const SearchIndex& index) {
    std::string query = prompt("Search: ");
    auto hits = index.search(query);
    if (hits.empty()) {
        std::cout << "No matches.\n";
        return;
    }
    for (std::size_t i = 0; i < hits.size(); ++i)
        std::cout << i + 1 << ". " << index.getPreview(hits[i], 80) << "\n";
}

static EntityId stockModel(EntityStore& store, bool cloze) {
    Model stock = cloze ? Model::cloze() : Model::basic();
    if (const Model* existing = store.findModelByName(stock.name)) return existing->id;
    return store.addModel(stock);
}

void addNote(EntityStore& store, SearchIndex& index) {
    std::cout << "Note type:\n 1. Basic\n 2. Cloze\n> ";
    int type = readChoice();
    if (type != 1 && type != 2) {
        std::cout << "Invalid.\n";
        return;
    }

    std::string deckName = DeckPath::normalize(prompt("Deck name: "));
    if (deckName.empty()) {
        std::cout << "Deck name required.\n";
        return;
    }

    try {
        EntityId modelId = stockModel(store, type == 2);
        const Deck* deck = store.findDeckByName(deckName);
        EntityId deckId = deck ? deck->id : store.addDeck(deckName);

        std::vector<std::string> values;
        for (const auto& field : store.getModel(modelId)->fields)
            values.push_back(prompt(field + ": "));

        if (type == 2) {
            for (const auto& issue : ClozeEngine::validate(values[0]))
                std::cout << "  note: " << issue.message << "\n";
        }

        auto tags = Note::parseTags(prompt("Tags (space-separated): "));
        EntityId noteId = store.addNote(modelId, deckId, values, tags);
        index.indexNote(noteId);
        std::cout << "Note added with " << store.cardsOfNote(noteId).size() << " card(s).\n";
    }
    catch (const IntegrityError& e) {
        std::cout << "Note not added: " << e.what() << "\n";
    }
}

static bool fileExists(const std::string& path) {
    std::ifstream in(path);
    return static_cast<bool>(in);
}

int main(int argc, char** argv) {
    CliOptions opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage();
        return 2;
    }

    if (sodium_init() < 0) {
        std::cerr << "Failed to initialize libsodium\n";
        return 1;
    }

    if (opts.verbose) Log::initConsole(spdlog::level::debug);
    else Log::init(opts.log_path);

    SchedulerConfig cfg;
    if (!Config::loadSchedulerConfig(opts.config_path, cfg))
        spdlog::info("Using default scheduler settings");

    // UNLOCK
    std::string salt;
    if (!EncryptedFilePersistence::saltFor(opts.collection_path, salt)) {
        std::cerr << "Cannot read or create the salt file\n";
        return 1;
    }
    std::string passphrase = prompt("Passphrase: ");
    std::vector<unsigned char> key;
    if (passphrase.empty() || !EncryptedFilePersistence::deriveKey(passphrase, salt, key)) {
        std::cerr << "Cannot derive collection key\n";
        return 1;
    }

    EncryptedFilePersistence persistence(opts.collection_path, key);
    EntityStore store;
    if (fileExists(opts.collection_path)) {
        auto loaded = persistence.load();
        if (!loaded) {
            std::cerr << "Cannot open collection (wrong passphrase?)\n";
            return 1;
        }
        store = std::move(*loaded);
    }
    else {
        std::cout << "Starting a new collection.\n";
    }

    DirectoryMediaStore media(opts.media_dir);
    Scheduler scheduler(store, cfg);
    SearchIndex index(store);
    index.indexAll();

    // MAIN LOOP
    while (true) {
        std::cout << "\n===== MAIN MENU =====\n"
            "1. Import Package\n"
            "2. Study Deck\n"
            "3. Search Notes\n"
            "4. List Decks\n"
            "5. Add Note\n"
            "6. Save & Exit\n> ";

        int choice = readChoice();
        if (choice < 0) {
            if (std::cin.eof()) break;
            continue;
        }

        if (choice == 1) importPackage(store, media, index);
        else if (choice == 2) studyDeck(store, scheduler);
        else if (choice == 3) searchNotes(index);
        else if (choice == 4) listDecks(store);
        else if (choice == 5) addNote(store, index);
        else if (choice == 6) {
            if (!persistence.save(store)) {
                std::cout << "Error saving collection.\n";
                continue;
            }
            std::cout << "Goodbye!\n";
            return 0;
        }
        else std::cout << "Invalid.\n";
    }

    return 0;
}
