#include <clocale>
#include <iostream>
#include <string>
#include <vector>

#include "logger.hh"
#include "tabstate/dump.hh"
#include "util/error.hh"

Error main_(const std::vector<std::string>& args, bool* failed) {
    tabstate::DumpOptions options;
    CHECK(tabstate::parse_args(&options, args),
        Error::INVALIDUSAGE) << "\n" << tabstate::DUMP_USAGE;

    Logger::Global().threshold = options.threshold;
    Logger::Global().add_target(&std::wcerr);

    return tabstate::dump(options, std::cout, failed);
}

int main(int argc, char* argv[]) {
    // Wide log and error output carries paths and text beyond ASCII.
    std::setlocale(LC_ALL, "");

    std::vector<std::string> args;
    for (int i = 0; i < argc; ++i) {
        args.push_back(std::string(argv[i]));
    }

    bool failed = false;
    Error e = main_(args, &failed);
    if (e) {
        std::cerr << "error\n";
        e.print(std::wcerr);
        return 1;
    }

    return failed ? 1 : 0;
}
