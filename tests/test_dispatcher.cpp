#include <gtest/gtest.h>
#include <core/hashing.hpp>
#include <server/dispatcher.hpp>
#include <server/mark.hpp>
#include "test_support.hpp"
#include <algorithm>

namespace {

Job admit_bytes(JobStore& store, const std::string& body, const std::string& name) {
    fs::path temp = store.temp_dir() / (hash_bytes(body) + ".part");
    write_file(temp, body);
    Job job;
    job.content_hash = hash_bytes(body);
    job.origin_name = name;
    job.client_name = "scope-1";
    job.relative_dir = "grid1";
    job.size = body.size();
    auto r = store.admit(job, temp, false);
    if (r.is_err()) throw std::runtime_error(r.error);
    return r.value.job;
}

} // namespace

class DispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        StoreOptions so;
        so.state_dir = dir / "state";
        so.incoming_dir = dir / "incoming";
        auto s = JobStore::open(so);
        ASSERT_TRUE(s.is_ok()) << s.error;
        store = std::move(s.value);
    }

    std::unique_ptr<Dispatcher> make(std::vector<std::string> command,
                                     ResolvePolicy policy = ResolvePolicy::AutoResolve,
                                     int concurrency = 2) {
        DispatchOptions o;
        o.command = std::move(command);
        o.policy = policy;
        o.concurrency = concurrency;
        o.poll_interval_ms = 50;
        return std::make_unique<Dispatcher>(*store, o);
    }

    JobState state_of(const std::string& hash) {
        auto job = store->get(hash);
        return job.is_ok() && job.value ? job.value->state : JobState::Discovered;
    }

    bool wait_state(const std::string& hash, JobState want, int timeout_ms = 10000) {
        return wait_until([&] { return state_of(hash) == want; }, timeout_ms);
    }

    TempDir dir;
    std::unique_ptr<JobStore> store;
};

TEST_F(DispatcherTest, PlaceholdersExpand) {
    Job job;
    job.content_hash = "abc123";
    job.stored_path = "/in/ab/c1/abc123.mrc";
    job.origin_name = "foo.mrc";
    job.client_name = "scope-1";
    job.relative_dir = "grid1/sq2";

    auto argv = Dispatcher::build_command(
        {"process", "{server_path}", "--out={client_relative_directory}/{client_file_stem}.star",
         "{hash}", "{origin_name}@{client_name}", "{unknown}"},
        job);
    ASSERT_EQ(argv.size(), 6u);
    EXPECT_EQ(argv[0], "process");
    EXPECT_EQ(argv[1], "/in/ab/c1/abc123.mrc");
    EXPECT_EQ(argv[2], "--out=grid1/sq2/foo.star");
    EXPECT_EQ(argv[3], "abc123");
    EXPECT_EQ(argv[4], "foo.mrc@scope-1");
    EXPECT_EQ(argv[5], "{unknown}");
}

TEST_F(DispatcherTest, SuccessfulCommandMarksDone) {
    Job job = admit_bytes(*store, "ok", "ok.mrc");
    fs::path out = dir / "seen";
    auto d = make({"sh", "-c", "cp \"$0\" \"$1\"", "{server_path}", out.string()});
    d->start();

    ASSERT_TRUE(wait_state(job.content_hash, JobState::Done));
    d->stop();
    EXPECT_EQ(read_file(out), "ok");

    auto stored = store->get(job.content_hash).value;
    EXPECT_EQ(stored->attempt_count, 1);
    EXPECT_FALSE(stored->last_error.has_value());
}

TEST_F(DispatcherTest, FailingCommandRecordsExitAndStderr) {
    Job job = admit_bytes(*store, "bad", "bad.mrc");
    auto d = make({"sh", "-c", "echo 'motion correction blew up' >&2; exit 3"});
    d->start();

    ASSERT_TRUE(wait_state(job.content_hash, JobState::Failed));
    d->stop();

    auto stored = store->get(job.content_hash).value;
    ASSERT_TRUE(stored->last_error.has_value());
    EXPECT_EQ(stored->last_error->rfind("exit code 3", 0), 0u) << *stored->last_error;
    EXPECT_NE(stored->last_error->find("motion correction blew up"), std::string::npos);
    EXPECT_TRUE(fs::exists(store->stderr_log_path(job.content_hash)));
}

TEST_F(DispatcherTest, LaunchFailureFailsJob) {
    Job job = admit_bytes(*store, "nope", "nope.mrc");
    auto d = make({"/nonexistent/pipeline-processor", "{server_path}"});
    d->start();

    ASSERT_TRUE(wait_state(job.content_hash, JobState::Failed));
    d->stop();
    auto stored = store->get(job.content_hash).value;
    ASSERT_TRUE(stored->last_error.has_value());
    EXPECT_NE(stored->last_error->find("exec"), std::string::npos);
}

TEST_F(DispatcherTest, ExternalResolveWaitsForMark) {
    Job job = admit_bytes(*store, "external", "ext.mrc");
    fs::path marker = dir / "launched";
    auto d = make({"sh", "-c", "echo {hash} > " + marker.string()},
                  ResolvePolicy::ExternalResolve);
    d->start();

    ASSERT_TRUE(wait_until([&] { return fs::exists(marker) && !read_file(marker).empty(); }));
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    EXPECT_EQ(state_of(job.content_hash), JobState::Processing);
    d->stop();

    auto marked = mark_job(*store, job.content_hash, MarkOutcome::Done);
    ASSERT_TRUE(marked.is_ok()) << marked.error;
    EXPECT_EQ(state_of(job.content_hash), JobState::Done);
    EXPECT_EQ(read_file(marker), job.content_hash + "\n");
}

TEST_F(DispatcherTest, BackpressureBoundsProcessing) {
    std::vector<std::string> hashes;
    for (int i = 0; i < 6; ++i) {
        hashes.push_back(admit_bytes(*store, "movie " + std::to_string(i),
                                     "m" + std::to_string(i) + ".mrc").content_hash);
    }
    auto d = make({"sh", "-c", "sleep 0.3"}, ResolvePolicy::AutoResolve, 2);
    d->start();

    std::size_t max_processing = 0;
    bool all_done = wait_until([&] {
        auto processing = store->list(JobState::Processing);
        if (processing.is_ok()) max_processing = std::max(max_processing,
                                                          processing.value.size());
        return store->list(JobState::Done).value.size() == hashes.size();
    }, 20000);
    d->stop();

    EXPECT_TRUE(all_done);
    EXPECT_LE(max_processing, 2u);
    EXPECT_LE(d->peak_busy(), 2);
    EXPECT_GE(d->peak_busy(), 1);
    for (const auto& h : hashes) EXPECT_EQ(state_of(h), JobState::Done);
}

TEST_F(DispatcherTest, NotifyWakesIdleWorkers) {
    DispatchOptions o;
    o.command = {"true"};
    o.concurrency = 1;
    o.poll_interval_ms = 60000;
    Dispatcher d(*store, o);
    d.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    Job job = admit_bytes(*store, "late arrival", "late.mrc");
    d.notify();
    EXPECT_TRUE(wait_state(job.content_hash, JobState::Done, 5000));
    d.stop();
}

TEST_F(DispatcherTest, StopLeavesRunningJobProcessing) {
    Job job = admit_bytes(*store, "slow", "slow.mrc");
    auto d = make({"sleep", "30"});
    d->start();
    ASSERT_TRUE(wait_until([&] { return d->busy() == 1; }));

    auto t0 = std::chrono::steady_clock::now();
    d->stop();
    auto elapsed = std::chrono::steady_clock::now() - t0;
    EXPECT_LT(elapsed, std::chrono::seconds(10));
    EXPECT_EQ(state_of(job.content_hash), JobState::Processing);
}
