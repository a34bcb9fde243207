#include <catch2/catch.hpp>

#include <filesystem>
#include <string>
#include <vector>

#include "tabbuilder.hh"
#include "tabstate/discover.hh"

using namespace tabstate;

CATCH_TEST_CASE("sidecar files are not tab files", "[discover]") {
    CATCH_CHECK(is_tab_file("0e9b7c29-5a3d-4ad4-9b0a-7f3d2c1e8a11.bin"));
    CATCH_CHECK(is_tab_file("x.bin"));
    CATCH_CHECK_FALSE(is_tab_file("0e9b7c29-5a3d-4ad4-9b0a-7f3d2c1e8a11.0.bin"));
    CATCH_CHECK_FALSE(is_tab_file("0e9b7c29-5a3d-4ad4-9b0a-7f3d2c1e8a11.1.bin"));
    CATCH_CHECK_FALSE(is_tab_file("settings.dat"));
    CATCH_CHECK_FALSE(is_tab_file("bin"));
}

CATCH_TEST_CASE("discover lists tab files in sorted order", "[discover]") {
    TempDir dir;
    dir.write("b.bin", { 'N', 'P' });
    dir.write("a.bin", { 'N', 'P' });
    dir.write("a.0.bin", {});
    dir.write("a.1.bin", {});
    dir.write("notes.txt", {});
    std::filesystem::create_directory(dir.path / "nested.bin");

    std::vector<std::string> files = { "existing" };
    CATCH_REQUIRE_FALSE(discover(&files, dir.path.string()));

    CATCH_REQUIRE(files.size() == 3);
    CATCH_CHECK(files[0] == "existing");
    CATCH_CHECK(files[1] == (dir.path / "a.bin").string());
    CATCH_CHECK(files[2] == (dir.path / "b.bin").string());
}

CATCH_TEST_CASE("discover reports a missing directory", "[discover]") {
    TempDir dir;
    std::vector<std::string> files;
    Error e = discover(&files, (dir.path / "missing").string());
    CATCH_CHECK(e.cause() == Error::NOTFOUND);
    CATCH_CHECK(files.empty());
}
