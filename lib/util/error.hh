#pragma once

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

struct Error {
    enum Kind {
        NONE,
        BADREAD,
        INVALIDFORMAT,
        TRUNCATEDSTREAM,
        OPENFAILED,
        CLOSEFAILED,
        NOTFOUND,
        INVALIDUSAGE,
    };

    struct Frame {
        Kind kind;
        const char* file;
        size_t line;
        std::wstringstream message;

        Frame(Kind kind,
                const char* file,
                size_t line):
            kind(kind), file(file), line(line) {}

        Frame(const Frame& rhs):
            kind(rhs.kind), file(rhs.file), line(rhs.line), message(rhs.message.str()) {}
    };

    std::vector<Frame> frames;

    template <typename T>
        Error& operator<<(T t) {
            frames.back().message << t;
            return *this;
        }

    Error(
            Kind kind,
            const char* file,
            size_t line): frames() {
        push(kind, file, line);
    }

    Error(): frames() {}

    Error& push(
            Kind kind,
            const char* file,
            size_t line) {
        frames.emplace_back(kind, file, line);
        return *this;
    }

    explicit operator bool() const {
        return frames.size() > 0;
    }

    // cause returns the kind of the innermost frame, i.e. the failure that
    // started the chain. Outer frames only add context.
    Kind cause() const {
        if (frames.size() == 0)
            return NONE;

        return frames.front().kind;
    }

    void print(std::wostream& os) const {
        if (frames.size() == 0) {
            os << "no error";
        }

        for (size_t i = 0, l = frames.size(); i < l; ++i) {
            const Frame& f = frames[i];
            os << f.file << ":" << f.line << ": " << f.message.str() << "\n";
        }
    }

    std::wstring str() const {
        std::wstringstream ss;
        print(ss);
        return ss.str();
    }
};

inline const char* error_kind_str(Error::Kind k) {
    switch (k) {
    case Error::NONE:
        return "NONE";
    case Error::BADREAD:
        return "BADREAD";
    case Error::INVALIDFORMAT:
        return "INVALIDFORMAT";
    case Error::TRUNCATEDSTREAM:
        return "TRUNCATEDSTREAM";
    case Error::OPENFAILED:
        return "OPENFAILED";
    case Error::CLOSEFAILED:
        return "CLOSEFAILED";
    case Error::NOTFOUND:
        return "NOTFOUND";
    case Error::INVALIDUSAGE:
        return "INVALIDUSAGE";
    }

    return "??";
}

inline std::wostream& operator<<(std::wostream& os, const Error& e) {
    e.print(os);
    return os;
}

#define error_push(e, k) \
    e.push(k, __FILE__, __LINE__)

#define error_new(k) \
    Error(k, __FILE__, __LINE__)

#define CHECK(x, k) \
    if (Error __error__ = (x)) return error_push(__error__, k)
