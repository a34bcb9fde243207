#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "logger.hh"
#include "util/error.hh"
#include "tabstate/tab.hh"

namespace tabstate {

extern const char DUMP_USAGE[];

// DumpOptions is the configuration of a tabstate-dump run.
struct DumpOptions {
    bool include_deleted = false;
    Logger::Level threshold = Logger::WARNING;

    // paths are files or directories, in command line order.
    std::vector<std::string> paths;
};

// parse_args fills o from a command line. args[0] is the program name.
// Everything after `--` is a path.
Error parse_args(
        DumpOptions* o,
        const std::vector<std::string>& args);

// collect expands paths into tab state files. Directories are scanned with
// discover; anything else is passed through and checked when it is opened.
Error collect(
        std::vector<std::string>* files,
        const std::vector<std::string>& paths);

void print(
        std::ostream& out,
        const TabContent& c);

// dump decodes every file named by o and prints it to out. A file that fails
// to decode is logged and skipped, and *failed is set.
Error dump(
        const DumpOptions& o,
        std::ostream& out,
        bool* failed);

}
