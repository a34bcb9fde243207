#include "tabstate/dump.hh"

#include <filesystem>
#include <system_error>

#include "tabstate/discover.hh"
#include "util/convert.hh"

namespace tabstate {

const char DUMP_USAGE[] =
    "usage: tabstate-dump [--include-deleted-content] [--verbose] [--quiet] PATH...\n"
    "\n"
    "Recovers the text of tab state files. A directory PATH is scanned for\n"
    "*.bin files, skipping the *.0.bin and *.1.bin sidecars.\n";

Error parse_args(
        DumpOptions* o,
        const std::vector<std::string>& args) {
    for (size_t i = 1, l = args.size(); i < l; ++i) {
        const std::string& arg = args[i];
        if (arg == "--include-deleted-content") {
            o->include_deleted = true;
        } else if (arg == "--verbose" || arg == "-v") {
            o->threshold = Logger::DEBUG;
        } else if (arg == "--quiet" || arg == "-q") {
            o->threshold = Logger::ERROR;
        } else if (arg == "--") {
            o->paths.insert(o->paths.end(), args.begin() + i + 1, args.end());
            break;
        } else if (arg.size() > 1 && arg[0] == '-') {
            return error_new(Error::INVALIDUSAGE)
                << "unknown option " << arg.c_str();
        } else {
            o->paths.push_back(arg);
        }
    }

    if (o->paths.empty()) {
        return error_new(Error::INVALIDUSAGE)
            << "please provide a tab state file or directory";
    }

    return Error();
}

Error collect(
        std::vector<std::string>* files,
        const std::vector<std::string>& paths) {
    for (const std::string& path : paths) {
        std::error_code ec;
        if (std::filesystem::is_directory(path, ec)) {
            CHECK(discover(files, path),
                Error::BADREAD) << "failed to scan " << path.c_str();
        } else {
            files->push_back(path);
        }
    }

    return Error();
}

void print(
        std::ostream& out,
        const TabContent& c) {
    out << "== " << c.path
        << " filename=" << c.filename
        << " state=" << (c.metadata.saved() ? "saved" : "unsaved")
        << " layout=" << layout_str(c.layout)
        << " content_length=" << c.content_length;
    if (c.layout == MULTI)
        out << " records=" << c.block_count;
    if (c.clamped != 0)
        out << " clamped=" << c.clamped;
    if (!c.checksum_mismatches.empty())
        out << " checksum_mismatches=" << c.checksum_mismatches.size();
    out << "\n" << util::to_utf8(c.content) << "\n";
}

Error dump(
        const DumpOptions& o,
        std::ostream& out,
        bool* failed) {
    std::vector<std::string> files;
    CHECK(collect(&files, o.paths),
        Error::BADREAD) << "failed to collect tab state files";

    for (const std::string& file : files) {
        TabContent content;
        if (Error e = TabFile::open(&content, file.c_str(), o.include_deleted)) {
            LOG(Logger::ERROR) << "skipping " << file.c_str()
                << " (" << error_kind_str(e.cause()) << "):\n" << e;
            *failed = true;
            continue;
        }

        print(out, content);
    }

    return Error();
}

}
