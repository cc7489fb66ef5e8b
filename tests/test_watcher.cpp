#include <gtest/gtest.h>
#include <client/watcher.hpp>
#include <set>
#include "test_support.hpp"

namespace {

WatchConfig make_config(int window_secs = 10, int polls = 2) {
    WatchConfig c;
    c.directory = "/watched";
    c.extension = "mrc";
    c.stability_window_secs = window_secs;
    c.stable_polls = polls;
    return c;
}

FileObservation obs(const std::string& path, std::uint64_t size, WatchTime mtime) {
    FileObservation o;
    o.path = path;
    o.size = size;
    o.mtime = mtime;
    return o;
}

const WatchTime T0 = 1700000000000;

} // namespace

TEST(Watcher, NotReadyUntilStablePolls) {
    Watcher w(make_config(10, 2));
    WatchTime old_mtime = T0 - 60000;

    w.observe({obs("/watched/a.mrc", 10, old_mtime)});
    EXPECT_TRUE(w.poll(T0).empty());

    w.observe({obs("/watched/a.mrc", 10, old_mtime)});
    auto ready = w.poll(T0 + 1000);
    ASSERT_EQ(ready.size(), 1u);
    EXPECT_EQ(ready[0], fs::path("/watched/a.mrc"));
    EXPECT_EQ(w.entry("/watched/a.mrc")->phase, WatchPhase::InFlight);

    // Handed out once
    EXPECT_TRUE(w.poll(T0 + 2000).empty());
}

TEST(Watcher, WindowMeasuredFromMtime) {
    Watcher w(make_config(10, 2));
    WatchTime mtime = T0 - 5000;

    w.observe({obs("/watched/a.mrc", 10, mtime)});
    w.observe({obs("/watched/a.mrc", 10, mtime)});
    EXPECT_TRUE(w.poll(T0).empty());
    EXPECT_TRUE(w.poll(T0 + 4999).empty());
    EXPECT_EQ(w.poll(T0 + 5000).size(), 1u);
}

TEST(Watcher, ChangeResetsStability) {
    Watcher w(make_config(0, 3));
    w.observe({obs("/watched/a.mrc", 10, T0)});
    w.observe({obs("/watched/a.mrc", 10, T0)});
    w.observe({obs("/watched/a.mrc", 20, T0 + 1)});
    EXPECT_EQ(w.entry("/watched/a.mrc")->stable_count, 1);
    EXPECT_TRUE(w.poll(T0 + 10).empty());

    w.observe({obs("/watched/a.mrc", 20, T0 + 1)});
    w.observe({obs("/watched/a.mrc", 20, T0 + 1)});
    EXPECT_EQ(w.poll(T0 + 10).size(), 1u);
}

TEST(Watcher, SentStaysQuietUntilModified) {
    Watcher w(make_config(0, 1));
    w.observe({obs("/watched/a.mrc", 10, T0)});
    ASSERT_EQ(w.poll(T0).size(), 1u);
    w.mark_sent("/watched/a.mrc");

    w.observe({obs("/watched/a.mrc", 10, T0)});
    EXPECT_TRUE(w.poll(T0 + 100000).empty());
    EXPECT_EQ(w.entry("/watched/a.mrc")->phase, WatchPhase::Sent);

    // Rewritten in place: a new content, a new send
    w.observe({obs("/watched/a.mrc", 11, T0 + 500)});
    EXPECT_EQ(w.entry("/watched/a.mrc")->phase, WatchPhase::Observing);
    EXPECT_EQ(w.poll(T0 + 1000).size(), 1u);
}

TEST(Watcher, AbandonedStaysQuietUntilModified) {
    Watcher w(make_config(0, 1));
    w.observe({obs("/watched/a.mrc", 10, T0)});
    ASSERT_EQ(w.poll(T0).size(), 1u);
    w.mark_abandoned("/watched/a.mrc");

    w.observe({obs("/watched/a.mrc", 10, T0)});
    EXPECT_TRUE(w.poll(T0 + 100000).empty());

    w.observe({obs("/watched/a.mrc", 10, T0 + 1)});
    EXPECT_EQ(w.poll(T0 + 100000).size(), 1u);
}

TEST(Watcher, RetryWaitFollowsBackoff) {
    Watcher w(make_config(0, 1), 500, 2000);
    w.observe({obs("/watched/a.mrc", 10, T0)});
    ASSERT_EQ(w.poll(T0).size(), 1u);

    w.mark_retry("/watched/a.mrc", T0);
    EXPECT_EQ(w.entry("/watched/a.mrc")->phase, WatchPhase::RetryWait);
    EXPECT_TRUE(w.poll(T0 + 499).empty());
    ASSERT_EQ(w.poll(T0 + 500).size(), 1u);

    w.mark_retry("/watched/a.mrc", T0 + 500);
    EXPECT_TRUE(w.poll(T0 + 1499).empty());
    ASSERT_EQ(w.poll(T0 + 1500).size(), 1u);

    // Capped
    w.mark_retry("/watched/a.mrc", T0);
    w.poll(T0 + 2000);
    w.mark_retry("/watched/a.mrc", T0);
    EXPECT_EQ(w.entry("/watched/a.mrc")->next_retry, T0 + 2000);
}

TEST(Watcher, GivesUpAfterMaxRetryRounds) {
    Watcher w(make_config(0, 1), 10, 10, 3);
    w.observe({obs("/watched/a.mrc", 10, T0)});
    ASSERT_EQ(w.poll(T0).size(), 1u);

    w.mark_retry("/watched/a.mrc", T0);
    ASSERT_EQ(w.poll(T0 + 10).size(), 1u);
    w.mark_retry("/watched/a.mrc", T0 + 10);
    ASSERT_EQ(w.poll(T0 + 20).size(), 1u);

    // Third failed round: no more retries until the file changes
    w.mark_retry("/watched/a.mrc", T0 + 20);
    EXPECT_EQ(w.entry("/watched/a.mrc")->phase, WatchPhase::Abandoned);
    EXPECT_EQ(w.entry("/watched/a.mrc")->attempts, 3);
    w.observe({obs("/watched/a.mrc", 10, T0)});
    EXPECT_TRUE(w.poll(T0 + 1000000).empty());

    w.observe({obs("/watched/a.mrc", 20, T0 + 5)});
    EXPECT_EQ(w.entry("/watched/a.mrc")->phase, WatchPhase::Observing);
    EXPECT_EQ(w.entry("/watched/a.mrc")->attempts, 0);
    EXPECT_EQ(w.poll(T0 + 1000000).size(), 1u);
}

TEST(Watcher, VanishedFilesAreForgottenUnlessInFlight) {
    Watcher w(make_config(0, 1));
    w.observe({obs("/watched/a.mrc", 1, T0), obs("/watched/b.mrc", 1, T0)});
    auto ready = w.poll(T0);
    ASSERT_EQ(ready.size(), 2u);
    w.mark_sent("/watched/b.mrc");

    w.observe({});
    EXPECT_TRUE(w.entry("/watched/a.mrc").has_value());
    EXPECT_FALSE(w.entry("/watched/b.mrc").has_value());
    EXPECT_EQ(w.size(), 1u);
}

TEST(Watcher, InFlightIgnoresChanges) {
    Watcher w(make_config(0, 1));
    w.observe({obs("/watched/a.mrc", 1, T0)});
    ASSERT_EQ(w.poll(T0).size(), 1u);
    w.observe({obs("/watched/a.mrc", 2, T0 + 1)});
    EXPECT_EQ(w.entry("/watched/a.mrc")->phase, WatchPhase::InFlight);

    // The sender noticed the change itself and asked for a retry
    w.mark_retry("/watched/a.mrc", T0);
    w.observe({obs("/watched/a.mrc", 2, T0 + 1)});
    EXPECT_EQ(w.entry("/watched/a.mrc")->phase, WatchPhase::Observing);
}

TEST(Watcher, ScanIsRecursiveAndFiltersExtension) {
    TempDir dir;
    write_file(dir / "top.mrc", "1");
    write_file(dir / "grid1/sub/deep.mrc", "22");
    write_file(dir / "grid1/notes.txt", "x");
    write_file(dir / "grid1/noext", "x");

    WatchConfig c;
    c.directory = dir.path();
    c.extension = "mrc";
    Watcher w(c);

    auto files = w.scan();
    ASSERT_EQ(files.size(), 2u);
    std::set<fs::path> paths;
    for (const auto& f : files) paths.insert(f.path);
    EXPECT_TRUE(paths.count(dir / "top.mrc"));
    EXPECT_TRUE(paths.count(dir / "grid1/sub/deep.mrc"));

    for (const auto& f : files) {
        if (f.path == dir / "grid1/sub/deep.mrc") EXPECT_EQ(f.size, 2u);
        EXPECT_GT(f.mtime, 0);
    }
}

TEST(Watcher, ScanWithoutExtensionTakesEverything) {
    TempDir dir;
    write_file(dir / "a.mrc", "1");
    write_file(dir / "b.tif", "1");

    WatchConfig c;
    c.directory = dir.path();
    Watcher w(c);
    EXPECT_EQ(w.scan().size(), 2u);
}

TEST(Watcher, MissingDirectoryScansEmpty) {
    WatchConfig c;
    c.directory = "/nonexistent/pipeline/watch";
    Watcher w(c);
    EXPECT_TRUE(w.scan().empty());
}
