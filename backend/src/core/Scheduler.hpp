#pragma once
#include <vector>
#include <set>
#include <ctime>
#include <random>
#include "EntityStore.hpp"
#include "SchedulerConfig.hpp"

enum class ReviewQuality {
    AGAIN = 1,
    HARD = 2,
    GOOD = 3,
    EASY = 4
};

/*
  Study session bootstrap state. Counters are rebuilt from the review log
  every time a session starts, never cached across restarts.
*/
struct StudySession {
    EntityId deck_id = NO_ID;
    int day = 0;
    std::set<EntityId> scope;           // deck and its descendants
    DeckLimits limits;
    int new_done = 0;
    int reviews_done = 0;
    std::set<EntityId> buried_notes;    // siblings hidden for this session

    int newRemaining() const;
    int reviewsRemaining() const;
    void burySiblings(EntityId noteId) { buried_notes.insert(noteId); }
    bool siblingsBuried(EntityId noteId) const { return buried_notes.count(noteId) > 0; }
};

struct AnswerOutcome {
    Card card;                          // state after the answer
    ReviewLogEntry log;
    bool graduated = false;
    bool lapsed = false;
    bool leech = false;
};

/*
  SM-2 style scheduler over the EntityStore's cards:
   - New cards enter the learning steps on their first answer
   - learning and relearning steps in minutes; a step of a day or more moves
     the card to the DayLearn queue
   - review intervals grow with the ease factor, with fuzz and a hard cap
   - lapses drop into relearning; leeches are reported, never suspended
   - cards can be relocated into filtered decks and restored

  answer() builds the new card row on a copy and swaps it in, so a failure
  leaves the stored card untouched.
*/

class Scheduler {
public:
    Scheduler(EntityStore& store, const SchedulerConfig& config, unsigned int seed = std::random_device{}());

    const SchedulerConfig& config() const { return cfg; }

    StudySession startSession(EntityId deckId, std::time_t now) const;

    // Learning (by due time), then Review (by due, id, capped), then New (by id, capped).
    std::vector<const Card*> dueCards(const StudySession& session, std::time_t now) const;
    const Card* nextCard(const StudySession& session, std::time_t now) const;

    // Throws SchedulingError when the card is not in the session's queue.
    AnswerOutcome answer(StudySession& session, EntityId cardId, ReviewQuality quality,
        std::time_t now, int timeTakenMs = 0);

    // Card state
    void suspend(EntityId cardId);
    void unsuspend(EntityId cardId);
    void bury(EntityId cardId);
    int unburyDeck(EntityId deckId);
    void setFlag(EntityId cardId, int flag);

    // Filtered decks
    int relocate(const std::vector<EntityId>& cardIds, EntityId filteredDeckId, std::time_t now);
    int restore(const std::vector<EntityId>& cardIds);
    int emptyFilteredDeck(EntityId filteredDeckId);

private:
    EntityStore& store;
    SchedulerConfig cfg;
    std::mt19937 rng;

    const Card& cardRef(EntityId cardId) const;
    bool isDue(const Card& card, int today, std::time_t now) const;

    void enterStep(Card& card, const std::vector<int>& steps, int stepIndex, std::time_t now, ReviewLogEntry& log) const;
    void graduate(Card& card, bool easy, std::time_t now, ReviewLogEntry& log) const;
    void answerNew(Card& card, ReviewQuality q, std::time_t now, AnswerOutcome& out) const;
    void answerLearning(Card& card, ReviewQuality q, std::time_t now, AnswerOutcome& out) const;
    void answerReview(Card& card, ReviewQuality q, std::time_t now, AnswerOutcome& out);

    int applyFuzz(int interval);
    bool isLeech(int lapses) const;
    static void returnHome(Card& card);
    static CardQueue restingQueue(const Card& card);
};
