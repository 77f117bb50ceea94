#include "TestSuite.hpp"
#include "../src/core/Scheduler.hpp"
#include "../src/core/Errors.hpp"

#include <algorithm>
#include <functional>

namespace {

const std::time_t NOW = T0 + HOUR;     // 23:13, still study day 0

SchedulerConfig exactConfig() {
    SchedulerConfig cfg;
    cfg.fuzz_fraction = 0.0;
    return cfg;
}

bool throwsScheduling(const std::function<void()>& fn) {
    try {
        fn();
    }
    catch (const SchedulingError&) {
        return true;
    }
    return false;
}

struct Fixture {
    EntityStore store{ T0 };
    EntityId basic = NO_ID;
    EntityId deck = NO_ID;

    Fixture() {
        basic = store.addModel(Model::basic());
        deck = store.addDeck("Deck");
    }

    EntityId addCard(const std::string& front) {
        EntityId note = store.addNote(basic, deck, { front, "back" }, {}, T0);
        return store.cardsOfNote(note)[0]->id;
    }

    // Turns a fresh card into a review card due today.
    EntityId addReviewCard(const std::string& front, int interval, int ease = 2500, int lapses = 0) {
        EntityId id = addCard(front);
        Card card = *store.getCard(id);
        card.type = CardType::Review;
        card.queue = CardQueue::Review;
        card.interval = interval;
        card.ease = ease;
        card.lapses = lapses;
        card.due = store.today(NOW);
        store.replaceCard(card);
        return id;
    }
};

bool inQueue(const std::vector<const Card*>& due, EntityId id) {
    return std::any_of(due.begin(), due.end(), [id](const Card* c) { return c->id == id; });
}

void test_learning_steps(TestSuite& suite) {
    Fixture f;
    Scheduler sched(f.store, exactConfig(), 42);
    EntityId id = f.addCard("step");
    auto session = sched.startSession(f.deck, NOW);

    auto first = sched.answer(session, id, ReviewQuality::GOOD, NOW);
    suite.require(first.card.queue == CardQueue::Learning && first.card.due == NOW + 60, "first step is one minute");
    suite.require(first.card.ease == 2500 && first.log.was_new && first.log.interval == -60, "first answer logged as new");

    auto second = sched.answer(session, id, ReviewQuality::GOOD, NOW + 60);
    suite.require(second.card.queue == CardQueue::Learning && second.card.due == NOW + 660, "second step is ten minutes");

    auto done = sched.answer(session, id, ReviewQuality::GOOD, NOW + 660);
    suite.require(done.graduated && done.card.queue == CardQueue::Review, "graduates after the last step");
    suite.require(done.card.interval == 1 && done.card.due == 1, "graduating interval is one day");
    suite.require(done.card.reps == 3 && f.store.reviewLog().size() == 3, "three reviews logged");
    suite.require(f.store.reviewLog()[1].id > f.store.reviewLog()[0].id, "log ids grow");
}

void test_learning_step_waits(TestSuite& suite) {
    Fixture f;
    Scheduler sched(f.store, exactConfig(), 42);
    EntityId first = f.addCard("first");
    EntityId second = f.addCard("second");
    auto session = sched.startSession(f.deck, NOW);

    sched.answer(session, first, ReviewQuality::GOOD, NOW);
    const Card* next = sched.nextCard(session, NOW);
    suite.require(next && next->id == second, "card on a learning step waits for it");
    suite.require(throwsScheduling([&] { sched.answer(session, first, ReviewQuality::GOOD, NOW + 59); }),
        "step not over yet");
    suite.require(f.store.getCard(first)->remaining_steps == 2 && f.store.reviewLog().size() == 1,
        "early answer changes nothing");

    sched.answer(session, second, ReviewQuality::GOOD, NOW);
    suite.require(sched.nextCard(session, NOW + 30) == nullptr, "nothing due while both cards wait");

    next = sched.nextCard(session, NOW + 60);
    suite.require(next && next->id == first, "due again after one minute");
    auto out = sched.answer(session, first, ReviewQuality::GOOD, NOW + 60);
    suite.require(!out.graduated && out.card.queue == CardQueue::Learning, "second step still learning");
}

void test_learning_answers(TestSuite& suite) {
    Fixture f;
    Scheduler sched(f.store, exactConfig(), 42);
    EntityId easy = f.addCard("easy");
    EntityId again = f.addCard("again");
    auto session = sched.startSession(f.deck, NOW);

    auto e = sched.answer(session, easy, ReviewQuality::EASY, NOW);
    suite.require(e.graduated && e.card.interval == 4 && e.card.ease == 2650, "easy on a new card graduates");

    auto a = sched.answer(session, again, ReviewQuality::AGAIN, NOW);
    suite.require(a.card.queue == CardQueue::Learning && a.card.remaining_steps == 2, "again starts the steps");

    auto h = sched.answer(session, again, ReviewQuality::HARD, NOW + 60);
    suite.require(h.card.due == NOW + 120 && h.card.remaining_steps == 2, "hard repeats the current step");

    auto g = sched.answer(session, again, ReviewQuality::GOOD, NOW + 120);
    auto back = sched.answer(session, again, ReviewQuality::AGAIN, NOW + 720);
    suite.require(g.card.remaining_steps == 1 && back.card.remaining_steps == 2 && back.card.due == NOW + 780,
        "again in a later step returns to the first");
}

void test_day_learning(TestSuite& suite) {
    Fixture f;
    SchedulerConfig cfg = exactConfig();
    cfg.learning_steps = { 1, 2880 };
    Scheduler sched(f.store, cfg, 42);
    EntityId id = f.addCard("long");
    auto session = sched.startSession(f.deck, NOW);

    sched.answer(session, id, ReviewQuality::GOOD, NOW);
    auto dayStep = sched.answer(session, id, ReviewQuality::GOOD, NOW + 60);
    suite.require(dayStep.card.queue == CardQueue::DayLearn && dayStep.card.due == 2, "two-day step counted in days");
    suite.require(dayStep.log.interval == 2, "day step logged in days");
    suite.require(!inQueue(sched.dueCards(session, NOW + 120), id), "day step not due today");

    auto later = sched.startSession(f.deck, NOW + 2 * DAY);
    suite.require(inQueue(sched.dueCards(later, NOW + 2 * DAY), id), "day step due on its day");
    auto done = sched.answer(later, id, ReviewQuality::GOOD, NOW + 2 * DAY);
    suite.require(done.graduated && done.card.due == 3, "graduates from a day step");
}

void test_review_intervals(TestSuite& suite) {
    Fixture f;
    Scheduler sched(f.store, exactConfig(), 42);
    EntityId good = f.addReviewCard("good", 10);
    EntityId hard = f.addReviewCard("hard", 10);
    EntityId easy = f.addReviewCard("easy", 10);
    auto session = sched.startSession(f.deck, NOW);

    auto g = sched.answer(session, good, ReviewQuality::GOOD, NOW);
    suite.require(g.card.interval == 25 && g.card.ease == 2500 && g.card.due == 25, "good multiplies by ease");
    suite.require(g.log.kind == ReviewKind::Review && g.log.last_interval == 10, "review logged");

    auto h = sched.answer(session, hard, ReviewQuality::HARD, NOW);
    suite.require(h.card.interval == 12 && h.card.ease == 2350, "hard grows slowly and lowers ease");

    auto e = sched.answer(session, easy, ReviewQuality::EASY, NOW);
    suite.require(e.card.interval == 35 && e.card.ease == 2650, "easy adds the bonus");

    suite.require(session.reviews_done == 3, "session counts answered reviews");
}

void test_lapse_and_leech(TestSuite& suite) {
    Fixture f;
    Scheduler sched(f.store, exactConfig(), 42);
    EntityId lapse = f.addReviewCard("lapse", 10);
    EntityId leech = f.addReviewCard("leech", 10, 1400, 7);
    auto session = sched.startSession(f.deck, NOW);

    auto a = sched.answer(session, lapse, ReviewQuality::AGAIN, NOW);
    suite.require(a.lapsed && a.card.lapses == 1 && a.card.ease == 2300, "lapse lowers ease");
    suite.require(a.card.type == CardType::Relearning && a.card.queue == CardQueue::Learning, "lapse relearns");
    suite.require(a.card.interval == 5 && a.card.due == NOW + 600, "interval halved, first relearning step");

    auto back = sched.answer(session, lapse, ReviewQuality::GOOD, NOW + 600);
    suite.require(back.graduated && back.card.interval == 5 && back.card.due == 5, "relearning keeps the halved interval");
    suite.require(back.log.kind == ReviewKind::Relearn, "relearn logged");

    auto l = sched.answer(session, leech, ReviewQuality::AGAIN, NOW);
    suite.require(l.leech && l.card.lapses == 8, "eighth lapse is a leech");
    suite.require(l.card.ease == 1300, "ease floored at the minimum");
    suite.require(l.card.queue != CardQueue::Suspended, "leech stays in study");
    const Note* note = f.store.getNote(l.card.note_id);
    suite.require(note && note->hasTag("leech"), "leech tagged");
}

void test_leech_without_repeat(TestSuite& suite) {
    Fixture f;
    SchedulerConfig cfg = exactConfig();
    cfg.leech_threshold = 2;
    cfg.leech_repeat = 0;
    Scheduler sched(f.store, cfg, 42);
    EntityId atThreshold = f.addReviewCard("threshold", 10, 2500, 1);
    EntityId pastThreshold = f.addReviewCard("past", 10, 2500, 2);
    auto session = sched.startSession(f.deck, NOW);

    suite.require(sched.answer(session, atThreshold, ReviewQuality::AGAIN, NOW).leech, "threshold lapse reported");
    auto past = sched.answer(session, pastThreshold, ReviewQuality::AGAIN, NOW);
    suite.require(!past.leech && past.card.lapses == 3, "no repeat reports after the threshold");
}

void test_fuzz(TestSuite& suite) {
    SchedulerConfig cfg;
    int first = 0;
    int second = 0;
    for (int run = 0; run < 2; ++run) {
        Fixture f;
        Scheduler sched(f.store, cfg, 7);
        EntityId id = f.addReviewCard("fuzz", 100);
        auto session = sched.startSession(f.deck, NOW);
        auto out = sched.answer(session, id, ReviewQuality::GOOD, NOW);
        (run == 0 ? first : second) = out.card.interval;
    }
    suite.require(first >= 237 && first <= 263, "fuzz stays within five percent");
    suite.require(first == second, "same seed, same interval");

    Fixture f;
    SchedulerConfig capped = exactConfig();
    capped.maximum_interval = 30;
    Scheduler sched(f.store, capped, 7);
    EntityId id = f.addReviewCard("cap", 20);
    auto session = sched.startSession(f.deck, NOW);
    suite.require(sched.answer(session, id, ReviewQuality::EASY, NOW).card.interval == 30, "interval capped");
}

void test_queue_order_and_limits(TestSuite& suite) {
    Fixture f;
    f.store.setDeckLimits(f.deck, { 2, 200 });
    Scheduler sched(f.store, exactConfig(), 42);
    EntityId n1 = f.addCard("one");
    EntityId n2 = f.addCard("two");
    EntityId n3 = f.addCard("three");
    EntityId review = f.addReviewCard("review", 3);
    auto session = sched.startSession(f.deck, NOW);

    auto due = sched.dueCards(session, NOW);
    suite.require(due.size() == 3 && due[0]->id == review, "reviews come before new cards");
    suite.require(due[1]->id == n1 && due[2]->id == n2, "new cards by creation, capped at the limit");

    sched.answer(session, n1, ReviewQuality::GOOD, NOW);
    due = sched.dueCards(session, NOW + 60);
    suite.require(due.front()->id == n1, "learning card first once its step is over");
    suite.require(inQueue(due, n2) && !inQueue(due, n3), "one new card left today");

    sched.answer(session, n2, ReviewQuality::GOOD, NOW);
    suite.require(throwsScheduling([&] { sched.answer(session, n3, ReviewQuality::GOOD, NOW); }),
        "new limit reached");

    auto restarted = sched.startSession(f.deck, NOW + 60);
    suite.require(restarted.new_done == 2 && restarted.newRemaining() == 0, "counts rebuilt from the log");

    auto tomorrow = sched.startSession(f.deck, NOW + DAY);
    suite.require(tomorrow.new_done == 0 && inQueue(sched.dueCards(tomorrow, NOW + DAY), n3), "limit resets next day");
}

void test_learning_before_review_without_new(TestSuite& suite) {
    Fixture f;
    f.store.setDeckLimits(f.deck, { 0, 200 });
    Scheduler sched(f.store, exactConfig(), 42);
    EntityId fresh = f.addCard("fresh");
    EntityId review = f.addReviewCard("review", 4);
    EntityId learning = f.addCard("learning");

    Card step = *f.store.getCard(learning);
    step.type = CardType::Learning;
    step.queue = CardQueue::Learning;
    step.remaining_steps = 1;
    step.due = NOW;
    f.store.replaceCard(step);

    auto session = sched.startSession(f.deck, NOW);
    suite.require(session.newRemaining() == 0, "no new cards allowed");

    auto due = sched.dueCards(session, NOW);
    suite.require(due.size() == 2, "learning and review only");
    suite.require(due.size() == 2 && due[0]->id == learning && due[1]->id == review, "learning strictly before review");
    suite.require(!inQueue(due, fresh), "no new card at a zero cap");
}

void test_sibling_burying(TestSuite& suite) {
    Fixture f;
    Scheduler sched(f.store, exactConfig(), 42);
    EntityId reversed = f.store.addModel(Model::basicAndReversed());
    EntityId note = f.store.addNote(reversed, f.deck, { "perro", "dog" }, {}, T0);
    auto cards = f.store.cardsOfNote(note);
    const EntityId forward = cards[0]->id;
    const EntityId backward = cards[1]->id;

    auto session = sched.startSession(f.deck, NOW);
    sched.answer(session, forward, ReviewQuality::GOOD, NOW);
    auto due = sched.dueCards(session, NOW + 60);
    suite.require(inQueue(due, forward) && !inQueue(due, backward), "sibling hidden for the session");

    auto fresh = sched.startSession(f.deck, NOW);
    suite.require(inQueue(sched.dueCards(fresh, NOW), backward), "sibling back in a new session");
}

void test_card_state(TestSuite& suite) {
    Fixture f;
    Scheduler sched(f.store, exactConfig(), 42);
    EntityId id = f.addCard("state");
    EntityId later = f.addReviewCard("later", 10);
    Card future = *f.store.getCard(later);
    future.due = 5;
    f.store.replaceCard(future);
    auto session = sched.startSession(f.deck, NOW);

    sched.suspend(id);
    suite.require(!inQueue(sched.dueCards(session, NOW), id), "suspended card leaves the queue");
    suite.require(throwsScheduling([&] { sched.answer(session, id, ReviewQuality::GOOD, NOW); }),
        "suspended card cannot be answered");
    sched.unsuspend(id);
    suite.require(f.store.getCard(id)->queue == CardQueue::New, "unsuspend restores the new queue");

    sched.bury(id);
    suite.require(f.store.getCard(id)->queue == CardQueue::UserBuried, "buried");
    suite.require(sched.unburyDeck(f.deck) == 1 && f.store.getCard(id)->queue == CardQueue::New, "unburied");

    sched.setFlag(id, 3);
    suite.require(f.store.getCard(id)->flags == 3, "flag set");
    suite.require(throwsScheduling([&] { sched.setFlag(id, 9); }), "flag out of range");

    suite.require(throwsScheduling([&] { sched.answer(session, later, ReviewQuality::GOOD, NOW); }),
        "card due later cannot be answered");
    suite.require(throwsScheduling([&] { sched.answer(session, id, ReviewQuality::GOOD, NOW + DAY); }),
        "session from another day rejected");
    suite.require(f.store.getCard(id)->reps == 0 && f.store.reviewLog().empty(), "failed answers change nothing");
}

void test_filtered_decks(TestSuite& suite) {
    Fixture f;
    Scheduler sched(f.store, exactConfig(), 42);
    EntityId cram = f.store.addFilteredDeck("Cram");
    EntityId review = f.addReviewCard("review", 10);
    EntityId learning = f.addCard("learning");

    Card ahead = *f.store.getCard(review);
    ahead.due = 3;
    f.store.replaceCard(ahead);

    auto home = sched.startSession(f.deck, NOW);
    sched.answer(home, learning, ReviewQuality::GOOD, NOW);

    suite.require(throwsScheduling([&] { sched.relocate({ review }, f.deck, NOW); }), "target must be filtered");
    suite.require(sched.relocate({ review, learning }, cram, NOW) == 1, "learning cards stay home");

    const Card* moved = f.store.getCard(review);
    suite.require(moved->deck_id == cram && moved->original_deck == f.deck, "home deck remembered");
    suite.require(moved->due == 0 && moved->original_due == 3, "review due pulled to today");

    suite.require(sched.restore({ review }) == 1, "restored");
    suite.require(f.store.getCard(review)->deck_id == f.deck && f.store.getCard(review)->due == 3, "original due back");

    sched.relocate({ review }, cram, NOW);
    auto cramSession = sched.startSession(cram, NOW);
    suite.require(inQueue(sched.dueCards(cramSession, NOW), review), "studied from the filtered deck");
    auto out = sched.answer(cramSession, review, ReviewQuality::GOOD, NOW);
    suite.require(out.card.deck_id == f.deck && !out.card.isRelocated(), "answering sends the card home");
    suite.require(out.card.interval == 25, "scheduled as a normal review");
    suite.require(sched.emptyFilteredDeck(cram) == 0, "nothing left to return");
}

}  // namespace

int main() {
    Log::initConsole();
    TestSuite suite;

    test_learning_steps(suite);
    test_learning_step_waits(suite);
    test_learning_answers(suite);
    test_day_learning(suite);
    test_review_intervals(suite);
    test_lapse_and_leech(suite);
    test_leech_without_repeat(suite);
    test_fuzz(suite);
    test_queue_order_and_limits(suite);
    test_learning_before_review_without_new(suite);
    test_sibling_burying(suite);
    test_card_state(suite);
    test_filtered_decks(suite);

    return suite.finish("Scheduler");
}
