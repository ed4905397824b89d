#include <catch2/catch_test_macros.hpp>
#include "Utils.hpp"
#include "TestHelpers.hpp"
#include <optional>
#include <filesystem>
#include <fstream>

TEST_CASE("abbreviate_user_path strips home prefix") {
    TempDir temp_home;
    EnvVarGuard home_guard("HOME", temp_home.path().string());
    const auto file = temp_home.path() / "Documents" / "taxes.pdf";
    write_file(file);

    const std::string abbreviated =
        Utils::abbreviate_user_path(file.string());
    REQUIRE(abbreviated == "Documents/taxes.pdf");
}

TEST_CASE("abbreviate_user_path leaves paths outside home alone") {
    EnvVarGuard home_guard("HOME", std::string("/home/reader"));
    CHECK(Utils::abbreviate_user_path("/home/readers/book.pdf") == "/home/readers/book.pdf");
    CHECK(Utils::abbreviate_user_path("/srv/book.pdf") == "/srv/book.pdf");
}

TEST_CASE("expand_user_path replaces a leading tilde") {
    EnvVarGuard home_guard("HOME", std::string("/home/reader"));
    CHECK(Utils::expand_user_path("~/Downloads") == "/home/reader/Downloads");
    CHECK(Utils::expand_user_path("~") == "/home/reader");
    CHECK(Utils::expand_user_path("~other/Downloads") == "~other/Downloads");
    CHECK(Utils::expand_user_path("/tmp/~/x") == "/tmp/~/x");
}

TEST_CASE("is_within compares whole path components") {
    CHECK(Utils::is_within("/home/me/reading", "/home/me/reading/a.pdf"));
    CHECK(Utils::is_within("/home/me/reading/", "/home/me/reading/sub/a.pdf"));
    CHECK(Utils::is_within("/home/me/reading", "/home/me/reading"));
    CHECK_FALSE(Utils::is_within("/home/me/read", "/home/me/reading/a.pdf"));
    CHECK_FALSE(Utils::is_within("/home/me/reading", "/home/me"));
}

TEST_CASE("read_file_times reports regular files only") {
    TempDir temp_dir;
    const auto file = temp_dir.path() / "paper.pdf";
    write_file(file);
    REQUIRE(set_file_times(file, 3000, 2000));

    const auto times = Utils::read_file_times(file.string());
    REQUIRE(times.has_value());
    CHECK(times->accessed == seconds_since_epoch(3000));
    CHECK(times->modified == seconds_since_epoch(2000));

    CHECK_FALSE(Utils::read_file_times(temp_dir.path().string()).has_value());
    CHECK_FALSE(Utils::read_file_times((temp_dir.path() / "missing.pdf").string()).has_value());
}

TEST_CASE("primary_timestamp prefers a later access time only when asked") {
    const FileTimes times{seconds_since_epoch(100), seconds_since_epoch(200)};
    CHECK(primary_timestamp(times, false) == seconds_since_epoch(100));
    CHECK(primary_timestamp(times, true) == seconds_since_epoch(200));

    const FileTimes stale_access{seconds_since_epoch(300), seconds_since_epoch(200)};
    CHECK(primary_timestamp(stale_access, true) == seconds_since_epoch(300));
}

TEST_CASE("path_exists and is_valid_directory never throw") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "a.pdf");

    CHECK(Utils::path_exists((temp_dir.path() / "a.pdf").string()));
    CHECK_FALSE(Utils::path_exists((temp_dir.path() / "b.pdf").string()));
    CHECK(Utils::is_valid_directory(temp_dir.path().string()));
    CHECK_FALSE(Utils::is_valid_directory((temp_dir.path() / "a.pdf").string()));
    CHECK_FALSE(Utils::is_valid_directory(""));
}

TEST_CASE("trim_copy and to_lower_copy") {
    CHECK(Utils::trim_copy("  pdf \t") == "pdf");
    CHECK(Utils::trim_copy("   ").empty());
    CHECK(Utils::to_lower_copy("EPub") == "epub");
}
