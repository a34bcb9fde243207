#include "tabstate/editlog.hh"

#include <algorithm>

#include "logger.hh"

namespace tabstate {

const char16_t DELETED_CONTENT_DELIMITER[] = u" --- DELETED-CONTENT: ";

void EditLog::apply(const MultiDataBlock& b) {
    // Records are numbered from zero, like checksum and read diagnostics.
    uint64_t index = applied++;
    size_t size = buffer.size();

    if (b.added > 0) {
        size_t at = static_cast<size_t>(b.offset);
        if (b.offset > size) {
            LOG(Logger::WARNING)
                << "record " << index << " inserts at offset " << b.offset
                << " past the end of the " << size << " unit buffer; appending";
            ++clamped;
            at = size;
        }

        buffer.insert(at, b.data);
    } else if (b.deleted > 0) {
        if (b.offset > size || b.deleted > size - b.offset) {
            LOG(Logger::WARNING)
                << "record " << index << " deletes " << b.deleted
                << " units at offset " << b.offset << " from a " << size
                << " unit buffer; clamping";
            ++clamped;
        }
        if (b.offset >= size)
            return;

        size_t at = static_cast<size_t>(b.offset);
        size_t n = static_cast<size_t>(std::min<uint64_t>(b.deleted, size - at));
        if (keep_deleted)
            deleted.append(buffer, at, n);
        buffer.erase(at, n);
    }
}

std::u16string EditLog::text() const {
    if (!keep_deleted)
        return buffer;

    std::u16string out;
    out.reserve(buffer.size() + deleted.size() + 32);
    out += buffer;
    out += DELETED_CONTENT_DELIMITER;
    out += deleted;
    return out;
}

}
