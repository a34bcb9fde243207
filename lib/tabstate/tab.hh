// tabstate recovers the text of editor tab state files, including edits that
// were never flushed and, on request, the text those edits deleted.
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "util/error.hh"
#include "tabstate/block.hh"
#include "tabstate/header.hh"
#include "tabstate/parser.hh"

namespace tabstate {

enum {
    // CHECKSUM_START is the file offset where checksummed header bytes begin:
    // the file state byte. The signature and the reserved byte are not covered.
    CHECKSUM_START = 3,
};

// ChecksumMismatch records a stored CRC32 that does not match the bytes it
// covers. Mismatches never stop a decode.
struct ChecksumMismatch {
    enum Record {
        SINGLE_BLOCK,
        EXTRA_HEADER,
        MULTI_BLOCK,
    };

    Record record;

    // index is the zero based position of the record among multi-block
    // records. Zero for the other kinds.
    uint64_t index;

    uint32_t stored;
    uint32_t actual;
};

enum Layout {
    SINGLE,
    MULTI,
};

// TabContent is the result of decoding one tab state file.
struct TabContent {
    // content is the recovered text, as UTF-16 code units. With deleted
    // content recovery it is followed by DELETED_CONTENT_DELIMITER and the
    // deleted text.
    std::u16string content;

    // content_length is content.size().
    uint64_t content_length;

    // path is the source of the data, passed through from the caller.
    std::string path;

    // filename is the last component of path.
    std::string filename;

    Header header;
    Metadata metadata;
    Layout layout;

    // block_count is the number of multi-block records replayed.
    uint64_t block_count;

    // clamped is the number of records whose range fell outside the live
    // buffer.
    uint64_t clamped;

    std::vector<ChecksumMismatch> checksum_mismatches;
};

struct TabFile {
    // parse decodes a whole tab state file from p. path is only used for
    // diagnostics and passed through to the result. c is only written on
    // success.
    static Error parse(
            TabContent* c,
            Parser* p,
            bool include_deleted,
            const std::string& path = std::string());

    // read decodes a tab state file held in memory.
    static Error read(
            TabContent* c,
            const uint8_t* data,
            size_t size,
            bool include_deleted,
            const std::string& path = std::string());

    // open maps filename and decodes it. The mapping is released before open
    // returns.
    static Error open(
            TabContent* c,
            const char* filename,
            bool include_deleted);
};

const char* layout_str(Layout l);
const char* record_str(ChecksumMismatch::Record r);

}
