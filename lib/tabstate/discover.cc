#include "tabstate/discover.hh"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace tabstate {

static bool ends_with(const std::string& s, const char* suffix) {
    size_t n = std::char_traits<char>::length(suffix);
    return s.size() >= n && s.compare(s.size() - n, n, suffix) == 0;
}

bool is_tab_file(const std::string& name) {
    if (!ends_with(name, ".bin"))
        return false;
    if (ends_with(name, ".0.bin") || ends_with(name, ".1.bin"))
        return false;

    return true;
}

Error discover(
        std::vector<std::string>* out,
        const std::string& directory) {
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory)
            return error_new(Error::NOTFOUND)
                << "no such directory: " << directory.c_str();
        return error_new(Error::OPENFAILED)
            << "failed to list " << directory.c_str() << ": " << ec.message().c_str();
    }

    std::vector<std::string> found;
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec))
            continue;
        if (!is_tab_file(it->path().filename().string()))
            continue;

        found.push_back(it->path().string());
    }
    if (ec)
        return error_new(Error::OPENFAILED)
            << "failed to list " << directory.c_str() << ": " << ec.message().c_str();

    std::sort(found.begin(), found.end());
    out->insert(out->end(), found.begin(), found.end());

    return Error();
}

}
