#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include "util/error.hh"
#include "tabstate/parser.hh"

namespace tabstate {

enum FileState : uint8_t {
    UNSAVED = 0,
    SAVED = 1,
};

// Header is the fixed 4 byte prefix of every tab state file.
struct Header {
    // signature is the magic characters for the file, always "NP".
    uint8_t signature[2];

    uint8_t reserved;

    // file_state selects the shape of the metadata record that follows. It
    // does not select the block layout; see Metadata::file_size.
    FileState file_state;

    static Error parse(
            Header* h,
            Parser* p);
};

// SavedTabMetadata follows the header of a tab backed by a file on disk.
struct SavedTabMetadata {
    // path is the location of the backing file. For diagnostics only.
    std::u16string path;

    uint64_t file_size;
    uint64_t encoding;
    uint64_t carriage_return_type;

    // timestamp is the last write time of the backing file, as a FILETIME
    // (100ns intervals since 1601-01-01).
    uint64_t timestamp;

    // content_hash is the SHA-256 of the backing file's contents.
    uint8_t content_hash[32];

    uint8_t reserved[6];

    static Error parse(
            SavedTabMetadata* m,
            Parser* p);
};

// UnsavedTabMetadata follows the header of a tab never saved to disk.
struct UnsavedTabMetadata {
    uint8_t reserved1;
    uint64_t file_size;
    uint64_t file_size_duplicate;
    uint8_t reserved2;
    uint8_t reserved3;

    static Error parse(
            UnsavedTabMetadata* m,
            Parser* p);
};

struct Metadata {
    std::variant<
        UnsavedTabMetadata,
        SavedTabMetadata> metadata;

    // file_size is the field that selects between the single-block layout
    // (nonzero) and the multi-block layout (zero). Both variants carry it.
    uint64_t file_size() const;

    bool saved() const {
        return std::holds_alternative<SavedTabMetadata>(metadata);
    }

    static Error parse(
            Metadata* m,
            Parser* p,
            FileState state);
};

}
