#include <catch2/catch_test_macros.hpp>
#include "IniConfig.hpp"
#include "TestHelpers.hpp"

#include <filesystem>
#include <string>
#include <vector>

TEST_CASE("IniConfig parses sections, comments and whitespace") {
    TempDir temp_dir;
    const auto file = temp_dir.path() / "config.ini";
    write_file(file,
               "; leading comment\n"
               "[Settings]\n"
               "  Capacity =  12  \n"
               "# another comment\n"
               "not a key value line\n"
               "[ Root_books ]\n"
               "Path=/srv/books\n");

    IniConfig config;
    REQUIRE(config.load(file.string()));
    CHECK(config.getValue("Settings", "Capacity") == "12");
    CHECK(config.getValue("Root_books", "Path") == "/srv/books");
    CHECK(config.getValue("Settings", "Missing", "fallback") == "fallback");
    CHECK_FALSE(config.hasValue("Settings", "not a key value line"));
}

TEST_CASE("IniConfig load reports a missing file") {
    TempDir temp_dir;
    IniConfig config;
    CHECK_FALSE(config.load((temp_dir.path() / "absent.ini").string()));
}

TEST_CASE("IniConfig typed accessors") {
    IniConfig config;
    config.setValue("S", "yes", "Yes");
    config.setValue("S", "zero", "0");
    config.setValue("S", "junk", "maybe");
    config.setValue("S", "number", "42");
    config.setValue("S", "partial", "42x");
    config.setValue("S", "list", " pdf , ,EPUB,");

    CHECK(config.getBool("S", "yes", false));
    CHECK_FALSE(config.getBool("S", "zero", true));
    CHECK(config.getBool("S", "junk", true));
    CHECK(config.getInt("S", "number", 0) == 42);
    CHECK(config.getInt("S", "partial", 7) == 7);
    CHECK(config.getInt("S", "absent", 9) == 9);
    CHECK(config.getList("S", "list") == std::vector<std::string>{"pdf", "EPUB"});
    CHECK(config.getList("S", "absent").empty());
}

TEST_CASE("IniConfig save replaces the file and can be reloaded") {
    TempDir temp_dir;
    const auto file = temp_dir.path() / "config.ini";
    write_file(file, "[Old]\nKey = stale\n");

    IniConfig config;
    config.setInt("Settings", "Capacity", 3);
    config.setBool("Settings", "DebugLogging", true);
    config.setList("Roots", "Ids", {"downloads", "reading"});
    config.setValue("Gone", "Key", "value");
    config.removeSection("Gone");
    REQUIRE(config.save(file.string()));
    CHECK_FALSE(std::filesystem::exists(file.string() + ".tmp"));

    IniConfig reloaded;
    REQUIRE(reloaded.load(file.string()));
    CHECK(reloaded.getInt("Settings", "Capacity", 0) == 3);
    CHECK(reloaded.getBool("Settings", "DebugLogging", false));
    CHECK(reloaded.getList("Roots", "Ids") == std::vector<std::string>{"downloads", "reading"});
    CHECK_FALSE(reloaded.hasValue("Old", "Key"));
    CHECK_FALSE(reloaded.hasValue("Gone", "Key"));
}

TEST_CASE("IniConfig save fails for an unwritable location") {
    TempDir temp_dir;
    IniConfig config;
    config.setValue("S", "K", "V");
    CHECK_FALSE(config.save((temp_dir.path() / "missing-dir" / "config.ini").string()));
}
