#pragma once

#include <string>
#include <vector>

#include "util/error.hh"

namespace tabstate {

// is_tab_file returns whether name looks like a tab state file: a `.bin` file
// that is not one of the `.0.bin` / `.1.bin` sidecars holding tab settings.
bool is_tab_file(const std::string& name);

// discover appends the tab state files directly inside directory to out, in
// sorted order.
Error discover(
        std::vector<std::string>* out,
        const std::string& directory);

}
