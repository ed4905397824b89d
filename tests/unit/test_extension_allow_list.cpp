#include <catch2/catch_test_macros.hpp>
#include "ExtensionAllowList.hpp"
#include "TestHelpers.hpp"

#include <string>
#include <vector>

TEST_CASE("default allow-list accepts pdf and epub in any case") {
    ExtensionAllowList allow_list;
    CHECK(allow_list.accepts("/a/paper.pdf"));
    CHECK(allow_list.accepts("/a/Paper.PDF"));
    CHECK(allow_list.accepts("/a/novel.epub"));
    CHECK_FALSE(allow_list.accepts("/a/notes.txt"));
    CHECK_FALSE(allow_list.accepts("/a/pdf"));
    CHECK_FALSE(allow_list.accepts("/a/.pdf"));
    CHECK_FALSE(allow_list.accepts("/a/archive.pdf.gz"));
    CHECK_FALSE(allow_list.accepts("/a/dir/"));
}

TEST_CASE("custom allow-list normalizes its entries") {
    ExtensionAllowList allow_list({".DjVu", " cbz ", ""});
    CHECK(allow_list.extensions() == std::vector<std::string>{"cbz", "djvu"});
    CHECK(allow_list.accepts("/a/scan.djvu"));
    CHECK(allow_list.accepts("/a/comic.CBZ"));
    CHECK_FALSE(allow_list.accepts("/a/paper.pdf"));
}

TEST_CASE("make_tracked_item uses the file name as display name") {
    ExtensionAllowList allow_list;
    const auto item = make_tracked_item("/home/me/Downloads/report.pdf",
                                        seconds_since_epoch(42), allow_list);
    REQUIRE(item.has_value());
    CHECK(item->path == "/home/me/Downloads/report.pdf");
    CHECK(item->display_name == "report.pdf");
    CHECK(item->timestamp == seconds_since_epoch(42));

    CHECK_FALSE(make_tracked_item("/home/me/Downloads/report.docx",
                                  seconds_since_epoch(42), allow_list).has_value());
}
