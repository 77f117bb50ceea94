#include "TestSuite.hpp"
#include "../src/search/SearchIndex.hpp"

#include <vector>

namespace {

struct Fixture {
    EntityStore store{ T0 };
    EntityId basic = NO_ID;
    EntityId deck = NO_ID;

    Fixture() {
        basic = store.addModel(Model::basic());
        deck = store.addDeck("Default");
    }

    EntityId add(const std::string& front, const std::string& back,
        const std::vector<std::string>& tags = {}, EntityId target = NO_ID) {
        return store.addNote(basic, target == NO_ID ? deck : target, { front, back }, tags, T0);
    }
};

void test_tokenize(TestSuite& suite) {
    suite.require(SearchIndex::tokenize("Hello, World! a b2") == std::vector<std::string>({ "hello", "world", "b2" }),
        "lowercased words, single letters dropped");
    suite.require(SearchIndex::tokenize("snake_case").size() == 1, "underscore is part of a word");
    suite.require(SearchIndex::normalize("<b>Bold</b>&amp;more") == "Bold &more", "markup and entities removed");
    suite.require(SearchIndex::normalize("one\x1ftwo") == "one two", "field separator is a space");
}

void test_matching(TestSuite& suite) {
    Fixture f;
    EntityId apple = f.add("Apple", "Fruit");
    EntityId cat = f.add("cat", "x");
    EntityId category = f.add("category", "x");
    SearchIndex index(f.store);
    index.indexAll();

    auto found = index.search("appl");
    suite.require(found.size() == 1 && found[0] == apple, "prefix match across fields");
    suite.require(index.search("FRUIT").size() == 1, "query is case-insensitive");
    suite.require(index.search("ruit").size() == 1, "substring match");

    auto ranked = index.search("cat");
    suite.require(ranked.size() == 2 && ranked[0] == cat && ranked[1] == category, "exact beats prefix");

    suite.require(index.search("").empty(), "empty query matches nothing");
    suite.require(index.search("a").empty(), "single letter matches nothing");
    suite.require(index.search("!!! ...").empty(), "punctuation matches nothing");
    suite.require(index.search("zebra").empty(), "unknown word");
}

void test_tags_and_ranking(TestSuite& suite) {
    Fixture f;
    EntityId twice = f.add("dog", "dog");
    EntityId tagged = f.add("dog", "", { "dogs" });
    EntityId verb = f.add("correr", "to run", { "verb" });
    SearchIndex index(f.store);
    index.indexAll();

    auto ranked = index.search("dog");
    suite.require(ranked.size() == 2 && ranked[0] == tagged && ranked[1] == twice, "tag match adds weight");

    SearchFilter byTag;
    byTag.tag = "verb";
    auto verbs = index.search("run", byTag);
    suite.require(verbs.size() == 1 && verbs[0] == verb, "tag filter");
    byTag.tag = "ver";
    suite.require(index.search("run", byTag).empty(), "tag filter needs the whole tag");
    byTag.tag = "dogs";
    suite.require(index.search("dog", byTag).size() == 1, "tag filter narrows results");

    SearchFilter limited;
    limited.limit = 1;
    auto one = index.search("dog", limited);
    suite.require(one.size() == 1 && one[0] == tagged, "limit keeps the best");
}

void test_deck_filter(TestSuite& suite) {
    Fixture f;
    EntityId lang = f.store.addDeck("Lang");
    EntityId spanish = f.store.addDeck("Lang::Spanish");
    EntityId other = f.store.addDeck("Other");
    EntityId hola = f.add("hola", "hello", {}, spanish);
    f.add("hello", "there", {}, other);
    SearchIndex index(f.store);
    index.indexAll();

    SearchFilter filter;
    filter.deck_id = lang;
    auto found = index.search("hello", filter);
    suite.require(found.size() == 1 && found[0] == hola, "parent deck covers its children");

    filter.deck_id = spanish;
    suite.require(index.search("hello", filter).size() == 1, "deck itself");
    suite.require(index.search("hello").size() == 2, "no filter searches every deck");
}

void test_maintenance(TestSuite& suite) {
    Fixture f;
    EntityId first = f.add("Hello world x", "");
    SearchIndex index(f.store);
    index.indexAll();

    SearchStats s = index.stats();
    suite.require(s.notes == 1 && s.tokens == 2, "stats count notes and tokens");
    suite.require(index.getPreview(first, 5) == "Hello...", "preview cut with ellipsis");
    suite.require(index.getPreview(first) == "Hello world x", "short preview untouched");
    suite.require(index.getPreview(12345).empty(), "unknown note has no preview");

    EntityId second = f.add("gone", "soon");
    suite.require(!index.contains(second), "index is a snapshot");
    index.indexNote(second);
    suite.require(index.search("gone").size() == 1, "indexed on request");

    f.store.updateNoteFields(second, { "changed", "text" }, T0 + 10);
    index.updateNote(second);
    suite.require(index.search("gone").empty() && index.search("changed").size() == 1, "update replaces tokens");

    f.store.deleteNote(second);
    index.indexNote(second);
    suite.require(!index.contains(second), "deleted note dropped");
    index.indexAll();
    suite.require(index.stats().notes == 1, "indexAll skips deleted notes");

    index.removeNote(first);
    suite.require(index.search("hello").empty(), "removed from the index");
}

void test_utf8(TestSuite& suite) {
    Fixture f;
    EntityId note = f.add("über straße", "h\xc3\xa9llo");
    SearchIndex index(f.store);
    index.indexAll();

    auto found = index.search("üb");
    suite.require(found.size() == 1 && found[0] == note, "non-ASCII prefix");
    suite.require(index.search("straße").size() == 1, "non-ASCII exact");

    EntityId accented = f.add("h\xc3\xa9llo", "");
    index.indexNote(accented);
    suite.require(index.getPreview(accented, 2) == "h...", "preview never splits a character");
}

}  // namespace

int main() {
    Log::initConsole();
    TestSuite suite;

    test_tokenize(suite);
    test_matching(suite);
    test_tags_and_ranking(suite);
    test_deck_filter(suite);
    test_maintenance(suite);
    test_utf8(suite);

    return suite.finish("Search");
}
