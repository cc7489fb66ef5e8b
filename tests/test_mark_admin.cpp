#include <gtest/gtest.h>
#include <core/hashing.hpp>
#include <server/admin.hpp>
#include <server/mark.hpp>
#include "test_support.hpp"

class AdminTest : public ::testing::Test {
protected:
    void SetUp() override {
        StoreOptions so;
        so.state_dir = dir / "state";
        so.incoming_dir = dir / "incoming";
        auto s = JobStore::open(so);
        ASSERT_TRUE(s.is_ok()) << s.error;
        store = std::move(s.value);
    }

    // Admit `body` and leave it in `state` (Admitted, Processing, Done or Failed).
    Job job_in(const std::string& body, JobState state) {
        fs::path temp = store->temp_dir() / (hash_bytes(body) + ".part");
        write_file(temp, body);
        Job job;
        job.content_hash = hash_bytes(body);
        job.origin_name = body + ".mrc";
        job.size = body.size();
        auto admitted = store->admit(job, temp, false);
        if (admitted.is_err()) throw std::runtime_error(admitted.error);
        Job out = admitted.value.job;
        if (state == JobState::Admitted) return out;

        auto claimed = store->transition(out.content_hash, JobState::Admitted,
                                         JobState::Processing);
        if (claimed.is_err()) throw std::runtime_error(claimed.error);
        if (state == JobState::Processing) return claimed.value;

        auto resolved = store->transition(out.content_hash, JobState::Processing, state);
        if (resolved.is_err()) throw std::runtime_error(resolved.error);
        return resolved.value;
    }

    TempDir dir;
    std::unique_ptr<JobStore> store;
};

TEST(MarkOutcome, Parse) {
    EXPECT_EQ(parse_mark_outcome("done"), MarkOutcome::Done);
    EXPECT_EQ(parse_mark_outcome("failed"), MarkOutcome::Failed);
    EXPECT_FALSE(parse_mark_outcome("Done").has_value());
    EXPECT_FALSE(parse_mark_outcome("ok").has_value());
}

TEST_F(AdminTest, MarkProcessingDone) {
    Job job = job_in("a", JobState::Processing);
    auto r = mark_job(*store, job.content_hash, MarkOutcome::Done);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.state, JobState::Done);
    EXPECT_EQ(store->get(job.content_hash).value->state, JobState::Done);
}

TEST_F(AdminTest, MarkProcessingFailed) {
    Job job = job_in("a", JobState::Processing);
    auto r = mark_job(*store, job.content_hash, MarkOutcome::Failed);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.state, JobState::Failed);
    EXPECT_EQ(r.value.last_error, std::optional<std::string>("marked failed"));
}

TEST_F(AdminTest, MarkRequiresProcessing) {
    for (JobState s : {JobState::Admitted, JobState::Done, JobState::Failed}) {
        Job job = job_in(std::string("in state ") + job_state_name(s), s);
        for (MarkOutcome o : {MarkOutcome::Done, MarkOutcome::Failed}) {
            auto r = mark_job(*store, job.content_hash, o);
            ASSERT_TRUE(r.is_err()) << job_state_name(s);
            EXPECT_EQ(r.kind, ErrorKind::Precondition);
        }
        EXPECT_EQ(store->get(job.content_hash).value->state, s);
    }
}

TEST_F(AdminTest, MarkUnknownOrInvalidHash) {
    auto unknown = mark_job(*store, hash_bytes("never seen"), MarkOutcome::Done);
    ASSERT_TRUE(unknown.is_err());
    EXPECT_EQ(unknown.kind, ErrorKind::Precondition);

    auto invalid = mark_job(*store, "../../x", MarkOutcome::Done);
    ASSERT_TRUE(invalid.is_err());
    EXPECT_EQ(invalid.kind, ErrorKind::Precondition);
}

TEST_F(AdminTest, StatusCountsStates) {
    job_in("a", JobState::Admitted);
    job_in("b", JobState::Processing);
    job_in("c", JobState::Done);
    job_in("d", JobState::Done);
    job_in("e", JobState::Failed);

    auto status = collect_status(*store);
    ASSERT_TRUE(status.is_ok()) << status.error;
    EXPECT_EQ(status.value.jobs.size(), 5u);
    EXPECT_EQ(status.value.counts[JobState::Admitted], 1u);
    EXPECT_EQ(status.value.counts[JobState::Processing], 1u);
    EXPECT_EQ(status.value.counts[JobState::Done], 2u);
    EXPECT_EQ(status.value.counts[JobState::Failed], 1u);
}

TEST_F(AdminTest, CleanDryRunTouchesNothing) {
    Job done = job_in("finished", JobState::Done);
    auto report = clean_done_jobs(*store, false);
    ASSERT_TRUE(report.is_ok());
    ASSERT_EQ(report.value.removed.size(), 1u);
    EXPECT_EQ(report.value.removed[0].content_hash, done.content_hash);
    EXPECT_TRUE(fs::exists(done.stored_path));
    EXPECT_TRUE(store->get(done.content_hash).value.has_value());
}

TEST_F(AdminTest, CleanRemovesOnlyDone) {
    Job done = job_in("finished", JobState::Done);
    Job failed = job_in("broken", JobState::Failed);
    Job processing = job_in("busy", JobState::Processing);

    auto report = clean_done_jobs(*store, true);
    ASSERT_TRUE(report.is_ok());
    EXPECT_EQ(report.value.removed.size(), 1u);
    EXPECT_TRUE(report.value.errors.empty());

    EXPECT_FALSE(fs::exists(done.stored_path));
    EXPECT_FALSE(store->get(done.content_hash).value.has_value());
    EXPECT_TRUE(fs::exists(failed.stored_path));
    EXPECT_TRUE(fs::exists(processing.stored_path));
    EXPECT_EQ(store->all().value.size(), 2u);
}
