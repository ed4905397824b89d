#include <catch2/catch_test_macros.hpp>
#include "RecentSet.hpp"
#include "ScanCoordinator.hpp"
#include "TestHelpers.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace {
std::vector<std::string> names_of(const std::vector<TrackedItem>& items) {
    std::vector<std::string> names;
    for (const auto& item : items) {
        names.push_back(item.display_name);
    }
    return names;
}
}

TEST_CASE("scan pass skips a missing root and keeps the readable one") {
    TempDir temp_dir;
    const auto good_root = temp_dir.path() / "good";
    write_file(good_root / "one.pdf");
    write_file(good_root / "two.epub");
    REQUIRE(set_file_times(good_root / "one.pdf", 100, 100));
    REQUIRE(set_file_times(good_root / "two.epub", 200, 200));

    FileScanner scanner;
    RecentSet recent_set(15);
    ScanCoordinator coordinator(scanner, recent_set, ExtensionAllowList());

    const ScanReport report = coordinator.run_pass({
        WatchedRoot{(temp_dir.path() / "missing").string()},
        WatchedRoot{good_root.string()}});

    CHECK(report.roots_scanned == 1);
    CHECK(report.roots_skipped == 1);
    CHECK(report.candidates == 2);
    CHECK(report.items_fed == 2);
    CHECK(names_of(recent_set.snapshot()) == std::vector<std::string>{"two.epub", "one.pdf"});
}

TEST_CASE("scan pass feeds only the newest capacity candidates") {
    TempDir temp_dir;
    for (int i = 0; i < 6; ++i) {
        const auto file = temp_dir.path() / ("doc" + std::to_string(i) + ".pdf");
        write_file(file);
        REQUIRE(set_file_times(file, 1000 + i, 1000 + i));
    }

    FileScanner scanner;
    RecentSet recent_set(3);
    ScanCoordinator coordinator(scanner, recent_set, ExtensionAllowList());
    const ScanReport report = coordinator.run_pass({WatchedRoot{temp_dir.path().string()}});

    CHECK(report.candidates == 6);
    CHECK(report.items_fed == 3);
    CHECK(names_of(recent_set.snapshot()) ==
          std::vector<std::string>{"doc5.pdf", "doc4.pdf", "doc3.pdf"});
}

TEST_CASE("scan pass keeps the newest file when names collide across roots") {
    TempDir temp_dir;
    const auto older = temp_dir.path() / "a" / "report.pdf";
    const auto newer = temp_dir.path() / "b" / "report.pdf";
    write_file(older);
    write_file(newer);
    REQUIRE(set_file_times(older, 100, 100));
    REQUIRE(set_file_times(newer, 200, 200));

    FileScanner scanner;
    RecentSet recent_set(15);
    ScanCoordinator coordinator(scanner, recent_set, ExtensionAllowList());

    // Newer root listed first, so the older copy would win a last-upsert race
    coordinator.run_pass({WatchedRoot{newer.parent_path().string()},
                          WatchedRoot{older.parent_path().string()}});

    const auto items = recent_set.snapshot();
    REQUIRE(items.size() == 1);
    CHECK(items.front().path == newer.string());
}

TEST_CASE("scan pass prunes entries whose files disappeared") {
    TempDir temp_dir;
    const auto file = temp_dir.path() / "short-lived.pdf";
    write_file(file);

    FileScanner scanner;
    RecentSet recent_set(15);
    ScanCoordinator coordinator(scanner, recent_set, ExtensionAllowList());
    coordinator.run_pass({WatchedRoot{temp_dir.path().string()}});
    REQUIRE(recent_set.size() == 1);

    std::filesystem::remove(file);
    coordinator.run_pass({WatchedRoot{temp_dir.path().string()}});
    CHECK(recent_set.size() == 0);
}

TEST_CASE("select_top dedupes by name and orders newest first") {
    FileScanner scanner;
    RecentSet recent_set(15, [](const std::string&) { return true; });
    ScanCoordinator coordinator(scanner, recent_set, ExtensionAllowList());

    const auto selected = coordinator.select_top({
        make_item("/a/x.pdf", 10),
        make_item("/b/y.pdf", 30),
        make_item("/c/x.pdf", 20),
        make_item("/d/z.pdf", 5)}, 2);

    REQUIRE(selected.size() == 2);
    CHECK(selected[0].path == "/b/y.pdf");
    CHECK(selected[1].path == "/c/x.pdf");
}
