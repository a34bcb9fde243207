#include "tabstate/file.hh"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include "logger.hh"

namespace tabstate {

Error MappedFile::open(
        MappedFile* f,
        const char* filename) {
    if (f->fd >= 0)
        return error_new(Error::INVALIDUSAGE)
            << "file already open: " << f->path.c_str();

    int fd = ::open(filename, O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        int err = errno;
        if (err == ENOENT)
            return error_new(Error::NOTFOUND)
                << "no such file: " << filename;
        return error_new(Error::OPENFAILED)
            << "failed to open " << filename << " for read: " << ::strerror(err);
    }

    struct stat st;
    if (::fstat(fd, &st) != 0) {
        int err = errno;
        ::close(fd);
        return error_new(Error::OPENFAILED)
            << "failed to stat " << filename << ": " << ::strerror(err);
    }
    if (!S_ISREG(st.st_mode)) {
        ::close(fd);
        return error_new(Error::OPENFAILED)
            << filename << " is not a regular file";
    }

    size_t size = static_cast<size_t>(st.st_size);
    const uint8_t* start = nullptr;
    if (size > 0) {
        void* addr = ::mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0);
        if (addr == MAP_FAILED) {
            int err = errno;
            ::close(fd);
            return error_new(Error::OPENFAILED)
                << "failed to mmap " << filename << ": " << ::strerror(err);
        }
        start = static_cast<const uint8_t*>(addr);
    }

    f->fd = fd;
    f->file.start = start;
    f->file.end = start + size;
    f->path = filename;

    return Error();
}

Error MappedFile::close() {
    if (fd < 0) return Error();

    if (file.start) {
        int ret = ::munmap(const_cast<uint8_t*>(file.start), file.size());
        if (ret)
            return error_new(Error::CLOSEFAILED)
                << "failed to unmap " << path.c_str() << ": " << ::strerror(errno);
    }
    file.start = nullptr;
    file.end = nullptr;

    int ret = ::close(fd);
    fd = -1;
    if (ret)
        return error_new(Error::CLOSEFAILED)
            << "failed to close " << path.c_str() << ": " << ::strerror(errno);

    return Error();
}

MappedFile::~MappedFile() {
    if (Error e = close())
        LOG(Logger::ERROR) << e;
}

}
