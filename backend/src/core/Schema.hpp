#pragma once
#include <cstdint>

// Identifiers follow the package format: 64-bit integers, usually epoch millis.
using EntityId = std::int64_t;

constexpr EntityId NO_ID = 0;

// Reserved byte joining a note's field values. Never allowed inside a value.
constexpr char FIELD_SEPARATOR = '\x1f';

// Separates levels of a deck name: "Parent::Child".
constexpr const char* DECK_SEPARATOR = "::";

// Ease factors are stored in permille (2500 == 250%).
constexpr int DEFAULT_EASE = 2500;

// cards.type
enum class CardType {
    New = 0,
    Learning = 1,
    Review = 2,
    Relearning = 3
};

// cards.queue; negative values are excluded from study sessions
enum class CardQueue {
    SchedBuried = -3,
    UserBuried = -2,
    Suspended = -1,
    New = 0,
    Learning = 1,   // due is an epoch timestamp (seconds)
    Review = 2,     // due is a day counter
    DayLearn = 3,   // learning step of a day or more; due is a day counter
    Preview = 4
};

enum class ModelKind {
    Standard = 0,
    Cloze = 1
};

// revlog.type
enum class ReviewKind {
    Learn = 0,
    Review = 1,
    Relearn = 2,
    Filtered = 3
};

inline bool isStudyQueue(CardQueue q) {
    return q == CardQueue::New || q == CardQueue::Learning ||
        q == CardQueue::Review || q == CardQueue::DayLearn;
}
