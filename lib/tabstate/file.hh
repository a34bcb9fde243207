#pragma once

#include <string>
#include <utility>

#include "util/error.hh"
#include "tabstate/extents.hh"

namespace tabstate {

// MappedFile is a read-only memory mapping of one tab state file. The mapping
// and descriptor are released by the destructor on every path, including a
// failed decode.
struct MappedFile {
    // fd is the OS file descriptor of the opened file, or -1.
    int fd;

    // file is the memory extents of the mapped contents. An empty file has
    // empty extents and no mapping.
    Extents file;

    std::string path;

    // open maps filename into memory.
    static Error open(
            MappedFile* f,
            const char* filename);

    // close unmaps the file, if it was mapped by this MappedFile.
    Error close();

    MappedFile():
        fd(-1), file{ nullptr, nullptr } {}

    MappedFile(MappedFile&& rhs):
        fd(std::exchange(rhs.fd, -1)),
        file(std::exchange(rhs.file, Extents{ nullptr, nullptr })),
        path(std::move(rhs.path)) {}

    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;

    ~MappedFile();
};

}
