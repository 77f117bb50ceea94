#pragma once
#include <ctime>
#include "Schema.hpp"

// One reviewable side of a note. Carries all scheduling state.
struct Card {
    EntityId id = NO_ID;
    EntityId note_id = NO_ID;
    EntityId deck_id = NO_ID;
    int ord = 0;                        // template ordinal, or cloze index - 1

    CardQueue queue = CardQueue::New;
    CardType type = CardType::New;

    // New: position; Learning: epoch seconds; Review/DayLearn: day counter
    std::int64_t due = 0;
    int interval = 0;                   // days
    int ease = DEFAULT_EASE;            // permille
    int reps = 0;
    int lapses = 0;
    int remaining_steps = 0;            // learning/relearning steps left

    // Only set while relocated into a filtered deck
    std::int64_t original_due = 0;
    EntityId original_deck = NO_ID;

    int flags = 0;                      // colour marker 0..7
    bool deleted = false;
    std::time_t modified = 0;

    bool isRelocated() const { return original_deck != NO_ID; }
};

// One answer, appended by the scheduler or carried over by the importer.
struct ReviewLogEntry {
    EntityId id = NO_ID;                // epoch millis of the answer
    EntityId card_id = NO_ID;
    int ease = 0;                       // button 1..4
    int interval = 0;                   // > 0 days, < 0 seconds
    int last_interval = 0;
    int factor = 0;
    int time_taken_ms = 0;
    ReviewKind kind = ReviewKind::Learn;
    bool was_new = false;               // card was in the New queue before this answer
};
