#include "Scheduler.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <spdlog/spdlog.h>

static constexpr int MINUTES_PER_DAY = 24 * 60;
static constexpr std::int64_t MILLIS = 1000;

// Learning due values above this are epoch seconds, below it day counters.
static constexpr std::int64_t TIMESTAMP_THRESHOLD = 1000000000;

static bool byDueThenId(const Card* a, const Card* b) {
    if (a->due != b->due) return a->due < b->due;
    return a->id < b->id;
}

int StudySession::newRemaining() const {
    return std::max(0, limits.new_per_day - new_done);
}

int StudySession::reviewsRemaining() const {
    return std::max(0, limits.reviews_per_day - reviews_done);
}

Scheduler::Scheduler(EntityStore& entityStore, const SchedulerConfig& config, unsigned int seed)
    : store(entityStore),
    cfg(config),
    rng(seed)
{
    store.setRolloverHour(cfg.rollover_hour);
    spdlog::info("Scheduler (SM-2) initialized: {} learning step(s), {} relearning step(s), leech threshold {}",
        cfg.learning_steps.size(), cfg.relearning_steps.size(), cfg.leech_threshold);
}

const Card& Scheduler::cardRef(EntityId cardId) const {
    const Card* card = store.getCard(cardId);
    if (!card) throw SchedulingError("Card " + std::to_string(cardId) + " not found");
    return *card;
}

/* -------------------------
   Sessions
   ------------------------- */

StudySession Scheduler::startSession(EntityId deckId, std::time_t now) const {
    const Deck* deck = store.getDeck(deckId);
    if (!deck) throw SchedulingError("Deck " + std::to_string(deckId) + " not found");

    StudySession session;
    session.deck_id = deckId;
    session.day = store.today(now);
    session.limits = deck->limits;
    for (EntityId id : store.deckAndDescendants(deckId)) session.scope.insert(id);

    const EntityId dayBegin = static_cast<EntityId>(store.dayStart(session.day)) * MILLIS;
    const EntityId dayEnd = static_cast<EntityId>(store.dayStart(session.day + 1)) * MILLIS;

    for (const auto& entry : store.reviewLog()) {
        if (entry.id < dayBegin || entry.id >= dayEnd) continue;
        const Card* card = store.getCard(entry.card_id);
        if (!card) continue;
        if (!session.scope.count(card->deck_id) && !session.scope.count(card->original_deck)) continue;

        if (entry.was_new) ++session.new_done;
        else if (entry.kind == ReviewKind::Review) ++session.reviews_done;
    }

    spdlog::info("Session for deck '{}' day {}: {} new and {} review(s) already done today",
        deck->name, session.day, session.new_done, session.reviews_done);
    return session;
}

bool Scheduler::isDue(const Card& card, int today, std::time_t now) const {
    switch (card.queue) {
    case CardQueue::New:
        return true;
    case CardQueue::Learning:
        return card.due <= static_cast<std::int64_t>(now);
    case CardQueue::DayLearn:
    case CardQueue::Review:
        return card.due <= today;
    default:
        return false;
    }
}

std::vector<const Card*> Scheduler::dueCards(const StudySession& session, std::time_t now) const {
    const int today = store.today(now);
    std::vector<const Card*> learning, dayLearning, reviews, fresh;

    for (const Card* card : store.cards()) {
        if (!session.scope.count(card->deck_id)) continue;
        if (!isDue(*card, today, now)) continue;
        const bool hidden = cfg.bury_siblings && session.siblingsBuried(card->note_id);

        switch (card->queue) {
        case CardQueue::Learning: learning.push_back(card); break;
        case CardQueue::DayLearn: dayLearning.push_back(card); break;
        case CardQueue::Review: if (!hidden) reviews.push_back(card); break;
        case CardQueue::New: if (!hidden) fresh.push_back(card); break;
        default: break;
        }
    }

    std::sort(learning.begin(), learning.end(), byDueThenId);
    std::sort(dayLearning.begin(), dayLearning.end(), byDueThenId);
    std::sort(reviews.begin(), reviews.end(), byDueThenId);
    std::sort(fresh.begin(), fresh.end(),
        [](const Card* a, const Card* b) { return a->id < b->id; });

    if (static_cast<int>(reviews.size()) > session.reviewsRemaining())
        reviews.resize(session.reviewsRemaining());
    if (static_cast<int>(fresh.size()) > session.newRemaining())
        fresh.resize(session.newRemaining());

    std::vector<const Card*> due;
    due.reserve(learning.size() + dayLearning.size() + reviews.size() + fresh.size());
    due.insert(due.end(), learning.begin(), learning.end());
    due.insert(due.end(), dayLearning.begin(), dayLearning.end());
    due.insert(due.end(), reviews.begin(), reviews.end());
    due.insert(due.end(), fresh.begin(), fresh.end());
    return due;
}

const Card* Scheduler::nextCard(const StudySession& session, std::time_t now) const {
    auto due = dueCards(session, now);
    return due.empty() ? nullptr : due.front();
}

/* -------------------------
   Answering
   ------------------------- */

AnswerOutcome Scheduler::answer(StudySession& session, EntityId cardId, ReviewQuality quality,
    std::time_t now, int timeTakenMs)
{
    const Card& stored = cardRef(cardId);
    if (stored.deleted)
        throw SchedulingError("Card " + std::to_string(cardId) + " is deleted");
    if (!isStudyQueue(stored.queue))
        throw SchedulingError("Card " + std::to_string(cardId) + " is suspended or buried");
    if (store.today(now) != session.day)
        throw SchedulingError("Session belongs to another study day; start a new session");

    auto due = dueCards(session, now);
    bool queued = std::any_of(due.begin(), due.end(),
        [cardId](const Card* c) { return c->id == cardId; });
    if (!queued)
        throw SchedulingError("Card " + std::to_string(cardId) + " is not in the session's queue");

    // work on a copy; the stored row is swapped only once the transition is complete
    Card card = stored;
    AnswerOutcome out;
    out.log.card_id = card.id;
    out.log.ease = static_cast<int>(quality);
    out.log.time_taken_ms = timeTakenMs;
    out.log.was_new = card.queue == CardQueue::New;
    out.log.last_interval = card.type == CardType::New ? 0 : card.interval;

    switch (card.type) {
    case CardType::New:
    case CardType::Learning: out.log.kind = ReviewKind::Learn; break;
    case CardType::Review: out.log.kind = ReviewKind::Review; break;
    case CardType::Relearning: out.log.kind = ReviewKind::Relearn; break;
    }

    if (card.isRelocated()) returnHome(card);

    switch (card.queue) {
    case CardQueue::New: answerNew(card, quality, now, out); break;
    case CardQueue::Learning:
    case CardQueue::DayLearn: answerLearning(card, quality, now, out); break;
    case CardQueue::Review: answerReview(card, quality, now, out); break;
    default:
        throw SchedulingError("Card " + std::to_string(cardId) + " has no active queue state");
    }

    card.reps += 1;
    card.modified = now;
    out.log.factor = card.ease;

    EntityId logId = static_cast<EntityId>(now) * MILLIS;
    const auto& history = store.reviewLog();
    if (!history.empty() && history.back().id >= logId) logId = history.back().id + 1;
    out.log.id = logId;

    store.replaceCard(card);
    store.appendReview(out.log);
    out.card = card;

    // same rule startSession() applies when it recounts the log
    if (out.log.was_new) ++session.new_done;
    else if (out.log.kind == ReviewKind::Review) ++session.reviews_done;

    if (out.leech) {
        const Note* note = store.getNote(card.note_id);
        if (note && !note->hasTag("leech")) {
            auto tags = note->tags;
            tags.push_back("leech");
            store.setNoteTags(note->id, tags);
        }
    }
    if (cfg.bury_siblings) session.burySiblings(card.note_id);

    spdlog::debug("Answered card {} q={} -> queue={} ivl={} due={} ease={}",
        card.id, static_cast<int>(quality), static_cast<int>(card.queue), card.interval, card.due, card.ease);
    return out;
}

void Scheduler::enterStep(Card& card, const std::vector<int>& steps, int stepIndex, std::time_t now, ReviewLogEntry& log) const {
    const int minutes = steps[stepIndex];
    card.remaining_steps = static_cast<int>(steps.size()) - stepIndex;

    if (minutes >= MINUTES_PER_DAY) {
        const int days = minutes / MINUTES_PER_DAY;
        card.queue = CardQueue::DayLearn;
        card.due = store.today(now) + days;
        log.interval = days;
    }
    else {
        card.queue = CardQueue::Learning;
        card.due = static_cast<std::int64_t>(now) + minutes * 60;
        log.interval = -minutes * 60;
    }
}

void Scheduler::graduate(Card& card, bool easy, std::time_t now, ReviewLogEntry& log) const {
    int interval;
    if (card.type == CardType::Relearning) {
        interval = std::max(cfg.minimum_lapse_interval, card.interval);
        if (easy) interval += 1;
    }
    else {
        interval = easy ? cfg.easy_interval : cfg.graduating_interval;
    }
    interval = std::max(1, static_cast<int>(std::ceil(interval * cfg.interval_modifier)));
    interval = std::min(interval, cfg.maximum_interval);

    card.type = CardType::Review;
    card.queue = CardQueue::Review;
    card.interval = interval;
    card.due = store.today(now) + interval;
    card.remaining_steps = 0;
    log.interval = interval;
}

void Scheduler::answerNew(Card& card, ReviewQuality q, std::time_t now, AnswerOutcome& out) const {
    card.type = CardType::Learning;
    card.ease = cfg.starting_ease;

    if (q == ReviewQuality::EASY) {
        card.ease = cfg.starting_ease + cfg.ease_easy_delta;
        graduate(card, true, now, out.log);
        out.graduated = true;
        return;
    }
    if (cfg.learning_steps.empty()) {
        graduate(card, false, now, out.log);
        out.graduated = true;
        return;
    }

    // every other answer starts the first learning step
    enterStep(card, cfg.learning_steps, 0, now, out.log);
}

void Scheduler::answerLearning(Card& card, ReviewQuality q, std::time_t now, AnswerOutcome& out) const {
    const bool relearning = card.type == CardType::Relearning;
    const auto& steps = relearning ? cfg.relearning_steps : cfg.learning_steps;
    const int total = static_cast<int>(steps.size());

    if (total == 0) {
        graduate(card, q == ReviewQuality::EASY, now, out.log);
        out.graduated = true;
        return;
    }

    const int remaining = std::clamp(card.remaining_steps, 1, total);
    const int index = total - remaining;

    switch (q) {
    case ReviewQuality::AGAIN:
        enterStep(card, steps, 0, now, out.log);
        break;
    case ReviewQuality::HARD:
        enterStep(card, steps, index, now, out.log);
        break;
    case ReviewQuality::GOOD:
        if (index + 1 >= total) {
            graduate(card, false, now, out.log);
            out.graduated = true;
        }
        else {
            enterStep(card, steps, index + 1, now, out.log);
        }
        break;
    case ReviewQuality::EASY:
        if (!relearning) card.ease += cfg.ease_easy_delta;
        graduate(card, true, now, out.log);
        out.graduated = true;
        break;
    }
}

void Scheduler::answerReview(Card& card, ReviewQuality q, std::time_t now, AnswerOutcome& out) {
    const int today = store.today(now);
    const int previous = std::max(1, card.interval);

    if (q == ReviewQuality::AGAIN) {
        card.lapses += 1;
        card.ease = std::max(cfg.minimum_ease, card.ease + cfg.ease_again_delta);
        card.interval = std::max(cfg.minimum_lapse_interval,
            static_cast<int>(std::floor(previous * cfg.lapse_multiplier)));
        card.type = CardType::Relearning;
        out.lapsed = true;
        out.leech = isLeech(card.lapses);

        if (cfg.relearning_steps.empty())
            graduate(card, false, now, out.log);
        else
            enterStep(card, cfg.relearning_steps, 0, now, out.log);

        spdlog::warn("Card {} lapsed. lapses={}, is_leech={}", card.id, card.lapses, out.leech);
        return;
    }

    double raw = previous;
    switch (q) {
    case ReviewQuality::HARD:
        card.ease = std::max(cfg.minimum_ease, card.ease + cfg.ease_hard_delta);
        raw = previous * cfg.hard_multiplier;
        break;
    case ReviewQuality::GOOD:
        raw = previous * (card.ease / 1000.0);
        break;
    case ReviewQuality::EASY:
        card.ease += cfg.ease_easy_delta;
        raw = previous * (card.ease / 1000.0) * cfg.easy_bonus;
        break;
    default:
        break;
    }

    raw = std::min(raw * cfg.interval_modifier, static_cast<double>(cfg.maximum_interval));
    int interval = applyFuzz(static_cast<int>(std::ceil(raw)));
    interval = std::max(interval, previous + 1);
    interval = std::min(interval, cfg.maximum_interval);

    card.type = CardType::Review;
    card.queue = CardQueue::Review;
    card.interval = interval;
    card.due = today + interval;
    out.log.interval = interval;
}

int Scheduler::applyFuzz(int interval) {
    if (interval < cfg.fuzz_min_interval || cfg.fuzz_fraction <= 0.0) return interval;

    const int spread = std::max(1, static_cast<int>(std::lround(interval * cfg.fuzz_fraction)));
    std::uniform_int_distribution<int> dist(interval - spread, interval + spread);
    return dist(rng);
}

bool Scheduler::isLeech(int lapses) const {
    if (lapses < cfg.leech_threshold) return false;
    // a non-positive repeat reports the threshold lapse only
    if (cfg.leech_repeat <= 0) return lapses == cfg.leech_threshold;
    return (lapses - cfg.leech_threshold) % cfg.leech_repeat == 0;
}

/* -------------------------
   Card state
   ------------------------- */

void Scheduler::returnHome(Card& card) {
    card.deck_id = card.original_deck;
    card.due = card.original_due;
    card.original_deck = NO_ID;
    card.original_due = 0;
}

CardQueue Scheduler::restingQueue(const Card& card) {
    switch (card.type) {
    case CardType::New: return CardQueue::New;
    case CardType::Review: return CardQueue::Review;
    default:
        return card.due >= TIMESTAMP_THRESHOLD ? CardQueue::Learning : CardQueue::DayLearn;
    }
}

void Scheduler::suspend(EntityId cardId) {
    Card card = cardRef(cardId);
    if (card.deleted) throw SchedulingError("Card " + std::to_string(cardId) + " is deleted");
    if (card.queue == CardQueue::Suspended) return;
    card.queue = CardQueue::Suspended;
    store.replaceCard(card);
    spdlog::info("Suspended card {}", cardId);
}

void Scheduler::unsuspend(EntityId cardId) {
    Card card = cardRef(cardId);
    if (card.queue != CardQueue::Suspended) return;
    card.queue = restingQueue(card);
    store.replaceCard(card);
    spdlog::info("Unsuspended card {}", cardId);
}

void Scheduler::bury(EntityId cardId) {
    Card card = cardRef(cardId);
    if (card.deleted || !isStudyQueue(card.queue))
        throw SchedulingError("Card " + std::to_string(cardId) + " cannot be buried");
    card.queue = CardQueue::UserBuried;
    store.replaceCard(card);
    spdlog::info("Buried card {}", cardId);
}

int Scheduler::unburyDeck(EntityId deckId) {
    std::vector<Card> buried;
    for (const Card* c : store.cardsInDeckTree(deckId)) {
        if (c->queue == CardQueue::UserBuried || c->queue == CardQueue::SchedBuried) buried.push_back(*c);
    }
    for (auto& card : buried) {
        card.queue = restingQueue(card);
        store.replaceCard(card);
    }
    spdlog::info("Unburied {} card(s) under deck {}", buried.size(), deckId);
    return static_cast<int>(buried.size());
}

void Scheduler::setFlag(EntityId cardId, int flag) {
    if (flag < 0 || flag > 7) throw SchedulingError("Flag must be within 0..7");
    Card card = cardRef(cardId);
    card.flags = flag;
    store.replaceCard(card);
}

/* -------------------------
   Filtered decks
   ------------------------- */

int Scheduler::relocate(const std::vector<EntityId>& cardIds, EntityId filteredDeckId, std::time_t now) {
    const Deck* deck = store.getDeck(filteredDeckId);
    if (!deck || !deck->is_filtered)
        throw SchedulingError("Deck " + std::to_string(filteredDeckId) + " is not a filtered deck");

    const int today = store.today(now);
    int moved = 0;
    for (EntityId id : cardIds) {
        const Card* current = store.getCard(id);
        if (!current || current->deleted || current->isRelocated()) continue;
        if (current->queue != CardQueue::New && current->queue != CardQueue::Review) continue;

        Card card = *current;
        card.original_deck = card.deck_id;
        card.original_due = card.due;
        card.deck_id = filteredDeckId;
        if (card.queue == CardQueue::Review) card.due = std::min<std::int64_t>(card.due, today);
        store.replaceCard(card);
        ++moved;
    }

    spdlog::info("Moved {} of {} card(s) into filtered deck '{}'", moved, cardIds.size(), deck->name);
    return moved;
}

int Scheduler::restore(const std::vector<EntityId>& cardIds) {
    int restored = 0;
    for (EntityId id : cardIds) {
        const Card* current = store.getCard(id);
        if (!current || !current->isRelocated()) continue;

        Card card = *current;
        returnHome(card);
        store.replaceCard(card);
        ++restored;
    }
    spdlog::info("Returned {} card(s) to their home decks", restored);
    return restored;
}

int Scheduler::emptyFilteredDeck(EntityId filteredDeckId) {
    std::vector<EntityId> ids;
    for (const Card* c : store.cards(true)) {
        if (c->deck_id == filteredDeckId && c->isRelocated()) ids.push_back(c->id);
    }
    return restore(ids);
}
