#include "tabstate/block.hh"

namespace tabstate {

Error SingleDataBlock::parse(
        SingleDataBlock* b,
        Parser* p) {
    CHECK(p->varint(&b->offset),
        Error::BADREAD) << "failed to read block offset";
    CHECK(p->varint(&b->deleted),
        Error::BADREAD) << "failed to read block deleted count";
    CHECK(p->varint(&b->added),
        Error::BADREAD) << "failed to read block added count";
    CHECK(p->wstring(&b->data, b->added),
        Error::BADREAD) << "failed to read block data";
    CHECK(p->u8(&b->reserved),
        Error::BADREAD) << "failed to read block reserved byte";

    b->checksum_at = p->address;
    CHECK(p->checksum(&b->checksum),
        Error::BADREAD) << "failed to read block checksum";

    return Error();
}

Error MultiDataExtraHeader::parse(
        MultiDataExtraHeader* h,
        Parser* p) {
    CHECK(p->bytes(h->reserved, sizeof(h->reserved)),
        Error::BADREAD) << "failed to read extra header reserved bytes";

    h->checksum_at = p->address;
    CHECK(p->checksum(&h->checksum),
        Error::BADREAD) << "failed to read extra header checksum";

    return Error();
}

Error MultiDataBlock::parse(
        MultiDataBlock* b,
        Parser* p) {
    b->begin = p->address;

    CHECK(p->varint(&b->offset),
        Error::BADREAD) << "failed to read block offset";
    CHECK(p->varint(&b->deleted),
        Error::BADREAD) << "failed to read block deleted count";
    CHECK(p->varint(&b->added),
        Error::BADREAD) << "failed to read block added count";

    b->data.clear();
    if (b->added > 0) {
        CHECK(p->wstring(&b->data, b->added),
            Error::BADREAD) << "failed to read block data";
    }

    b->checksum_at = p->address;
    CHECK(p->checksum(&b->checksum),
        Error::BADREAD) << "failed to read block checksum";

    return Error();
}

}
