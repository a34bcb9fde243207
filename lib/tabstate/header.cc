#include "tabstate/header.hh"

#include "util.hh"

namespace tabstate {

static const uint8_t SIGNATURE[2] = { 'N', 'P' };

Error Header::parse(
        Header* h,
        Parser* p) {
    CHECK(p->bytes(h->signature, sizeof(h->signature)),
        Error::BADREAD) << "failed to read signature";
    if (h->signature[0] != SIGNATURE[0] || h->signature[1] != SIGNATURE[1])
        return error_new(Error::INVALIDFORMAT)
            << "bad signature 0x" << std::hex
            << static_cast<unsigned>(h->signature[0]) << " 0x"
            << static_cast<unsigned>(h->signature[1]);

    CHECK(p->u8(&h->reserved),
        Error::BADREAD) << "failed to read header reserved byte";

    uint8_t state = 0;
    CHECK(p->u8(&state),
        Error::BADREAD) << "failed to read file state";
    switch (state) {
    case UNSAVED:
    case SAVED:
        break;
    default:
        return error_new(Error::INVALIDFORMAT)
            << "unknown file state " << static_cast<unsigned>(state);
    }
    h->file_state = static_cast<FileState>(state);

    return Error();
}

Error SavedTabMetadata::parse(
        SavedTabMetadata* m,
        Parser* p) {
    uint64_t path_length = 0;
    CHECK(p->varint(&path_length),
        Error::BADREAD) << "failed to read file path length";
    CHECK(p->wstring(&m->path, path_length),
        Error::BADREAD) << "failed to read file path";
    CHECK(p->varint(&m->file_size),
        Error::BADREAD) << "failed to read file size";
    CHECK(p->varint(&m->encoding),
        Error::BADREAD) << "failed to read encoding";
    CHECK(p->varint(&m->carriage_return_type),
        Error::BADREAD) << "failed to read carriage return type";
    CHECK(p->varint(&m->timestamp),
        Error::BADREAD) << "failed to read timestamp";
    CHECK(p->bytes(m->content_hash, sizeof(m->content_hash)),
        Error::BADREAD) << "failed to read content hash";
    CHECK(p->bytes(m->reserved, sizeof(m->reserved)),
        Error::BADREAD) << "failed to read saved metadata reserved bytes";

    return Error();
}

Error UnsavedTabMetadata::parse(
        UnsavedTabMetadata* m,
        Parser* p) {
    CHECK(p->u8(&m->reserved1),
        Error::BADREAD) << "failed to read unsaved metadata reserved byte";
    CHECK(p->varint(&m->file_size),
        Error::BADREAD) << "failed to read file size";
    CHECK(p->varint(&m->file_size_duplicate),
        Error::BADREAD) << "failed to read duplicate file size";
    CHECK(p->u8(&m->reserved2),
        Error::BADREAD) << "failed to read unsaved metadata reserved byte";
    CHECK(p->u8(&m->reserved3),
        Error::BADREAD) << "failed to read unsaved metadata reserved byte";

    return Error();
}

uint64_t Metadata::file_size() const {
    return std::visit(Visitor {
        [](const UnsavedTabMetadata& m) {
            return m.file_size;
        },
        [](const SavedTabMetadata& m) {
            return m.file_size;
        },
    }, metadata);
}

Error Metadata::parse(
        Metadata* m,
        Parser* p,
        FileState state) {
    if (state == SAVED) {
        SavedTabMetadata saved;
        CHECK(SavedTabMetadata::parse(&saved, p),
            Error::BADREAD) << "failed to read saved tab metadata";
        m->metadata = std::move(saved);
    } else {
        UnsavedTabMetadata unsaved;
        CHECK(UnsavedTabMetadata::parse(&unsaved, p),
            Error::BADREAD) << "failed to read unsaved tab metadata";
        m->metadata = std::move(unsaved);
    }

    return Error();
}

}
