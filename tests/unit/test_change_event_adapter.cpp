#include <catch2/catch_test_macros.hpp>
#include "ChangeEventAdapter.hpp"
#include "RecentSet.hpp"
#include "TestHelpers.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace {

struct AdapterFixture {
    std::map<std::string, FileTimes> files;
    int notifications{0};
    RecentSet recent_set{15, [](const std::string&) { return true; }};
    ChangeEventAdapter adapter;

    explicit AdapterFixture(std::vector<WatchedRoot> roots = {
                                WatchedRoot{"/home/me/Downloads", false, false},
                                WatchedRoot{"/home/me/reading", true, true}})
        : adapter(recent_set, std::move(roots), ExtensionAllowList(),
                  [this](const std::string& path) -> std::optional<FileTimes> {
                      const auto it = files.find(path);
                      if (it == files.end()) {
                          return std::nullopt;
                      }
                      return it->second;
                  })
    {
        recent_set.set_changed_callback([this]() { ++notifications; });
    }

    void add_file(const std::string& path, std::int64_t modified, std::int64_t accessed) {
        files[path] = FileTimes{seconds_since_epoch(modified), seconds_since_epoch(accessed)};
    }
};

ChangeBatch batch_of(std::vector<FileChange> changes) {
    ChangeBatch batch;
    batch.reported_count = changes.size();
    batch.changes = std::move(changes);
    return batch;
}

} // namespace

TEST_CASE("created files are tracked with their modification time") {
    AdapterFixture fixture;
    fixture.add_file("/home/me/Downloads/paper.pdf", 500, 900);

    REQUIRE(fixture.adapter.handle_batch(batch_of({
        {"/home/me/Downloads/paper.pdf", ChangeKind::Created}})));

    const auto items = fixture.recent_set.snapshot();
    REQUIRE(items.size() == 1);
    CHECK(items.front().display_name == "paper.pdf");
    CHECK(items.front().timestamp == seconds_since_epoch(500));
}

TEST_CASE("access-time roots rank by the later of access and modification") {
    AdapterFixture fixture;
    fixture.add_file("/home/me/reading/novel.epub", 500, 900);
    fixture.add_file("/home/me/reading/stale.pdf", 700, 600);

    fixture.adapter.handle_change({"/home/me/reading/novel.epub", ChangeKind::Modified});
    fixture.adapter.handle_change({"/home/me/reading/stale.pdf", ChangeKind::Modified});

    const auto items = fixture.recent_set.snapshot();
    REQUIRE(items.size() == 2);
    CHECK(items[0].display_name == "novel.epub");
    CHECK(items[0].timestamp == seconds_since_epoch(900));
    CHECK(items[1].timestamp == seconds_since_epoch(700));
}

TEST_CASE("removed events drop the tracked path") {
    AdapterFixture fixture;
    fixture.add_file("/home/me/Downloads/a.pdf", 100, 100);
    fixture.adapter.handle_change({"/home/me/Downloads/a.pdf", ChangeKind::Created});
    REQUIRE(fixture.recent_set.size() == 1);

    fixture.adapter.handle_change({"/home/me/Downloads/a.pdf", ChangeKind::Removed});
    CHECK(fixture.recent_set.size() == 0);
}

TEST_CASE("events for other extensions are ignored") {
    AdapterFixture fixture;
    fixture.add_file("/home/me/Downloads/notes.txt", 100, 100);
    fixture.add_file("/home/me/Downloads/.pdf", 100, 100);

    fixture.adapter.handle_change({"/home/me/Downloads/notes.txt", ChangeKind::Created});
    fixture.adapter.handle_change({"/home/me/Downloads/.pdf", ChangeKind::Created});

    CHECK(fixture.recent_set.size() == 0);
    CHECK(fixture.notifications == 0);
}

TEST_CASE("files that vanish before stat are skipped") {
    AdapterFixture fixture;
    fixture.adapter.handle_change({"/home/me/Downloads/ghost.pdf", ChangeKind::Created});
    CHECK(fixture.recent_set.size() == 0);
}

TEST_CASE("implausible batches cause no recent set changes") {
    AdapterFixture fixture;
    fixture.add_file("/home/me/Downloads/a.pdf", 100, 100);
    const FileChange change{"/home/me/Downloads/a.pdf", ChangeKind::Created};

    SECTION("zero reported events") {
        ChangeBatch batch;
        batch.reported_count = 0;
        batch.changes = {change};
        CHECK_FALSE(fixture.adapter.handle_batch(batch));
    }

    SECTION("a thousand or more reported events") {
        ChangeBatch batch;
        batch.reported_count = ChangeEventAdapter::kMaxBatchEvents;
        batch.changes.assign(ChangeEventAdapter::kMaxBatchEvents, change);
        CHECK_FALSE(fixture.adapter.handle_batch(batch));
    }

    SECTION("reported count disagrees with decoded events") {
        ChangeBatch batch;
        batch.reported_count = 2;
        batch.changes = {change};
        CHECK_FALSE(fixture.adapter.handle_batch(batch));
    }

    CHECK(fixture.recent_set.size() == 0);
    CHECK(fixture.notifications == 0);
}

TEST_CASE("a batch just under the limit is applied") {
    AdapterFixture fixture;
    fixture.add_file("/home/me/Downloads/a.pdf", 100, 100);

    ChangeBatch batch;
    batch.reported_count = ChangeEventAdapter::kMaxBatchEvents - 1;
    batch.changes.assign(batch.reported_count,
                         FileChange{"/home/me/Downloads/a.pdf", ChangeKind::Modified});

    CHECK(fixture.adapter.handle_batch(batch));
    CHECK(fixture.recent_set.size() == 1);
    CHECK(fixture.notifications == 1);
}

TEST_CASE("the longest matching root owns a path") {
    AdapterFixture fixture({
        WatchedRoot{"/home/me", false, true},
        WatchedRoot{"/home/me/reading", true, false},
        WatchedRoot{"/home/me/read", false, false}});

    const WatchedRoot* root = fixture.adapter.find_owning_root("/home/me/reading/book.epub");
    REQUIRE(root != nullptr);
    CHECK(root->path == "/home/me/reading");

    root = fixture.adapter.find_owning_root("/home/me/other/book.epub");
    REQUIRE(root != nullptr);
    CHECK(root->path == "/home/me");

    CHECK(fixture.adapter.find_owning_root("/tmp/book.epub") == nullptr);
}
