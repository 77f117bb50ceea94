#pragma once
#include <stdexcept>
#include <string>

// Referential violation through the public store API (unknown model/note/deck,
// wrong field count, reserved separator inside a field value, duplicate ordinal).
class IntegrityError : public std::runtime_error {
public:
    explicit IntegrityError(const std::string& msg) : std::runtime_error(msg) {}
};

// Answering a card outside the active session queue. Card state is untouched.
class SchedulingError : public std::runtime_error {
public:
    explicit SchedulingError(const std::string& msg) : std::runtime_error(msg) {}
};

// Structural import failure: the whole import is abandoned and the target
// store is left exactly as it was.
class ImportError : public std::runtime_error {
public:
    enum class Stage {
        Archive,    // container missing/unreadable
        Database,   // embedded database missing/unreadable
        Schema,     // required tables or collection row absent
        Metadata    // collection JSON unparsable
    };

    ImportError(Stage stage, const std::string& msg)
        : std::runtime_error(msg), failed_stage(stage) {}

    Stage stage() const { return failed_stage; }

private:
    Stage failed_stage;
};

// The progress callback asked the importer to stop.
class ImportAborted : public std::runtime_error {
public:
    ImportAborted() : std::runtime_error("Import cancelled by caller") {}
};
