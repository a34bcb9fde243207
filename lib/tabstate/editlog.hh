#pragma once

#include <cstdint>
#include <string>

#include "tabstate/block.hh"

namespace tabstate {

// DELETED_CONTENT_DELIMITER separates the live text from recovered deleted
// text in the output of EditLog::text.
extern const char16_t DELETED_CONTENT_DELIMITER[];

// EditLog replays multi-block records, in file order, against a live buffer.
// Offsets in a record refer to the buffer as it is just before that record
// is applied.
struct EditLog {
    // buffer is the live text. Edits shift everything after the offset.
    std::u16string buffer;

    // deleted accumulates removed text in the order it was removed, if
    // keep_deleted is set.
    std::u16string deleted;
    bool keep_deleted;

    // applied is the number of records replayed, no-ops included.
    uint64_t applied;

    // clamped is the number of records whose range fell outside the buffer.
    uint64_t clamped;

    explicit EditLog(bool keep_deleted = false):
        keep_deleted(keep_deleted), applied(0), clamped(0) {}

    // apply replays one record. An insert past the end of the buffer appends;
    // a delete is cut down to the part inside the buffer. Both are counted in
    // `clamped` and logged.
    void apply(const MultiDataBlock& b);

    // text returns the live text, followed by the delimiter and the deleted
    // text when keep_deleted is set.
    std::u16string text() const;
};

}
