#include "tabstate/tab.hh"

#include <iomanip>

#include "logger.hh"
#include "tabstate/checksum.hh"
#include "tabstate/editlog.hh"
#include "tabstate/file.hh"
#include "util/convert.hh"

namespace tabstate {

const char* layout_str(Layout l) {
    switch (l) {
    case SINGLE:
        return "single";
    case MULTI:
        return "multi";
    }

    return "?";
}

const char* record_str(ChecksumMismatch::Record r) {
    switch (r) {
    case ChecksumMismatch::SINGLE_BLOCK:
        return "single block";
    case ChecksumMismatch::EXTRA_HEADER:
        return "extra header";
    case ChecksumMismatch::MULTI_BLOCK:
        return "multi block";
    }

    return "?";
}

static std::string basename(const std::string& path) {
    size_t slash = path.find_last_of("/\\");
    if (slash == std::string::npos)
        return path;

    return path.substr(slash + 1);
}

static void check(
        TabContent* c,
        ChecksumMismatch::Record record,
        uint64_t index,
        const uint8_t* begin,
        const uint8_t* end,
        uint32_t stored) {
    uint32_t actual = 0;
    if (verify(begin, end, stored, &actual))
        return;

    c->checksum_mismatches.push_back(ChecksumMismatch{ record, index, stored, actual });

    auto m = LOG(Logger::WARNING);
    m << "CRC32 mismatch in " << record_str(record);
    if (record == ChecksumMismatch::MULTI_BLOCK)
        m << " " << index;
    m << " of " << (c->path.empty() ? std::wstring(L"<memory>") : util::to_wide(c->path))
      << std::hex << std::setfill(L'0')
      << " (expected=" << std::setw(8) << stored
      << ", actual=" << std::setw(8) << actual << ")";
}

Error TabFile::parse(
        TabContent* c,
        Parser* p,
        bool include_deleted,
        const std::string& path) {
    TabContent out;
    out.path = path;
    out.filename = basename(path);
    out.block_count = 0;
    out.clamped = 0;

    // Checksummed header bytes are relative to where the file begins, which
    // need not be the start of the parser's extents.
    const uint8_t* checksummed = p->address + CHECKSUM_START;

    CHECK(Header::parse(&out.header, p),
        Error::BADREAD) << "failed to read header";
    CHECK(Metadata::parse(&out.metadata, p, out.header.file_state),
        Error::BADREAD) << "failed to read metadata";

    // The block layout follows the metadata's file size, not the file state:
    // an unsaved tab can carry a single block and a saved one an edit log.
    if (out.metadata.file_size() != 0) {
        out.layout = SINGLE;
        LOG(Logger::DEBUG) << "single-block layout, file size "
            << out.metadata.file_size();

        SingleDataBlock block;
        CHECK(SingleDataBlock::parse(&block, p),
            Error::BADREAD) << "failed to read data block";
        check(&out, ChecksumMismatch::SINGLE_BLOCK, 0,
            checksummed, block.checksum_at, block.checksum);

        if (!p->eof())
            LOG(Logger::DEBUG) << p->remaining()
                << " trailing bytes after single data block";

        out.content = std::move(block.data);
    } else {
        out.layout = MULTI;
        LOG(Logger::DEBUG) << "multi-block layout";

        MultiDataExtraHeader extra;
        CHECK(MultiDataExtraHeader::parse(&extra, p),
            Error::BADREAD) << "failed to read extra header";
        check(&out, ChecksumMismatch::EXTRA_HEADER, 0,
            checksummed, extra.checksum_at, extra.checksum);

        EditLog log(include_deleted);

        // There is no record count. Reaching the end of the data between
        // records ends the log; running out inside a record is fatal.
        MultiDataBlock block;
        while (!p->eof()) {
            size_t at = p->position();
            CHECK(MultiDataBlock::parse(&block, p),
                Error::BADREAD) << "failed to read record " << out.block_count
                << " at offset " << at;
            check(&out, ChecksumMismatch::MULTI_BLOCK, out.block_count,
                block.begin, block.checksum_at, block.checksum);

            log.apply(block);
            ++out.block_count;
        }

        out.clamped = log.clamped;
        out.content = log.text();
    }

    out.content_length = out.content.size();
    *c = std::move(out);

    return Error();
}

Error TabFile::read(
        TabContent* c,
        const uint8_t* data,
        size_t size,
        bool include_deleted,
        const std::string& path) {
    Parser p = Parser::over(data, size);
    return parse(c, &p, include_deleted, path);
}

Error TabFile::open(
        TabContent* c,
        const char* filename,
        bool include_deleted) {
    MappedFile f;
    CHECK(MappedFile::open(&f, filename),
        Error::BADREAD) << "failed to open tab state file";

    Parser p;
    p.file = f.file;
    p.address = f.file.start;
    TabContent out;
    CHECK(parse(&out, &p, include_deleted, filename),
        Error::BADREAD) << "failed to decode " << filename;

    CHECK(f.close(),
        Error::BADREAD) << "failed to release " << filename;

    *c = std::move(out);
    return Error();
}

}
