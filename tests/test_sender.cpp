#include <gtest/gtest.h>
#include <client/send_queue.hpp>
#include <client/sender.hpp>
#include <core/hashing.hpp>
#include <server/intake.hpp>
#include <server/listener.hpp>
#include <transport/tcp_transport.hpp>
#include "test_support.hpp"
#include <cstring>
#include <functional>
#include <atomic>
#include <map>
#include <mutex>

namespace {

enum class Fault {
    None,
    DropBeforeAck,   // everything written, then the connection dies
    DropMidBody,     // dies after the body, before End
    AppendAfterHeader,
    GarbledReply,    // every byte read back is zero
};

// Wraps a real connection and breaks it on purpose.
class FaultyTransport : public Transport {
public:
    FaultyTransport(std::unique_ptr<Transport> inner, Fault fault,
                    std::function<void()> on_header = {})
        : inner_(std::move(inner)), fault_(fault), on_header_(std::move(on_header)) {}

    Result<void> connect() override { return inner_->connect(); }
    void close() override { inner_->close(); }
    bool is_open() const override { return inner_->is_open(); }

    Result<void> write_all(const void* data, std::size_t len) override {
        if (fault_ == Fault::DropMidBody && written_ > 200) {
            inner_->close();
            return transport_error("injected: connection reset");
        }
        auto r = inner_->write_all(data, len);
        written_ += len;
        // Header frame is the first prefix + payload pair
        if (++writes_ == 2 && fault_ == Fault::AppendAfterHeader && on_header_) on_header_();
        return r;
    }

    Result<void> read_exact(void* data, std::size_t len, bool* clean_eof) override {
        if (fault_ == Fault::DropBeforeAck) {
            inner_->close();
            return transport_error("injected: connection lost before ack");
        }
        auto r = inner_->read_exact(data, len, clean_eof);
        if (r.is_ok() && fault_ == Fault::GarbledReply) std::memset(data, 0, len);
        return r;
    }

    int wait_readable(int timeout_ms) override { return inner_->wait_readable(timeout_ms); }
    std::string describe() const override { return "faulty " + inner_->describe(); }

private:
    std::unique_ptr<Transport> inner_;
    Fault fault_;
    std::function<void()> on_header_;
    std::size_t written_ = 0;
    int writes_ = 0;
};

// First connection gets the fault, later ones are healthy.
class FaultyFactory : public TransportFactory {
public:
    FaultyFactory(int port, Fault first, std::function<void()> on_header = {})
        : port_(port), first_(first), on_header_(std::move(on_header)) {}

    std::unique_ptr<Transport> create() override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto inner = std::make_unique<TcpTransport>("127.0.0.1", port_, 2, 5);
        Fault fault = created_++ == 0 ? first_ : Fault::None;
        return std::make_unique<FaultyTransport>(std::move(inner), fault, on_header_);
    }

    int created() const { return created_.load(); }

private:
    int port_;
    Fault first_;
    std::function<void()> on_header_;
    std::mutex mutex_;
    std::atomic<int> created_{0};
};

SendConfig fast_retries(int max_attempts = 4) {
    SendConfig s;
    s.max_attempts = max_attempts;
    s.retry_initial_ms = 10;
    s.retry_max_ms = 50;
    s.connect_timeout_secs = 2;
    s.io_timeout_secs = 5;
    return s;
}

} // namespace

class SenderTest : public ::testing::Test {
protected:
    void SetUp() override {
        StoreOptions so;
        so.state_dir = dir / "state";
        so.incoming_dir = dir / "incoming";
        auto s = JobStore::open(so);
        ASSERT_TRUE(s.is_ok()) << s.error;
        store = std::move(s.value);

        IntakeOptions io;
        io.max_file_size = 8192;
        intake = std::make_unique<Intake>(*store, io);
        listener = std::make_unique<Listener>(*intake, "127.0.0.1", 0, 5);
        ASSERT_TRUE(listener->start().is_ok());
        fs::create_directories(dir / "watched");
    }

    void TearDown() override {
        listener->stop();
    }

    fs::path make_file(const std::string& rel, const std::string& body) {
        fs::path p = dir / "watched" / rel;
        write_file(p, body);
        return p;
    }

    std::size_t job_count() { return store->all().value.size(); }

    TempDir dir;
    std::unique_ptr<JobStore> store;
    std::unique_ptr<Intake> intake;
    std::unique_ptr<Listener> listener;
};

TEST_F(SenderTest, DeliversFile) {
    fs::path file = make_file("grid1/foo.mrc", std::string(128, 'm'));
    FaultyFactory factory(listener->port(), Fault::None);
    SendProtocol sender(factory, fast_retries(), "scope-1", dir / "watched");

    SendReport report = sender.send(file);
    EXPECT_EQ(report.outcome, SendOutcome::Sent);
    EXPECT_EQ(report.ack, AckKind::Accepted);
    EXPECT_EQ(report.attempts, 1);
    EXPECT_EQ(report.content_hash, hash_bytes(std::string(128, 'm')));

    auto job = store->get(report.content_hash).value;
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->relative_dir, "grid1");
    EXPECT_EQ(job->client_name, "scope-1");
}

TEST_F(SenderTest, ReusesConnectionAcrossFiles) {
    FaultyFactory factory(listener->port(), Fault::None);
    SendProtocol sender(factory, fast_retries(), "scope-1", dir / "watched");

    EXPECT_EQ(sender.send(make_file("a.mrc", "aaa")).outcome, SendOutcome::Sent);
    EXPECT_EQ(sender.send(make_file("b.mrc", "bbb")).outcome, SendOutcome::Sent);
    EXPECT_EQ(factory.created(), 1);
    EXPECT_EQ(job_count(), 2u);
}

TEST_F(SenderTest, LostAckIsRetriedAndNotDuplicated) {
    fs::path file = make_file("foo.mrc", std::string(4096, 'q'));
    FaultyFactory factory(listener->port(), Fault::DropBeforeAck);
    SendProtocol sender(factory, fast_retries(), "scope-1", dir / "watched");

    SendReport report = sender.send(file);
    EXPECT_EQ(report.outcome, SendOutcome::Sent);
    EXPECT_EQ(report.attempts, 2);
    EXPECT_EQ(factory.created(), 2);
    EXPECT_EQ(job_count(), 1u);
}

TEST_F(SenderTest, DropMidBodyLeavesNoJobThenSucceeds) {
    fs::path file = make_file("foo.mrc", std::string(4096, 'z'));
    FaultyFactory factory(listener->port(), Fault::DropMidBody);
    SendProtocol sender(factory, fast_retries(), "scope-1", dir / "watched");

    SendReport report = sender.send(file);
    EXPECT_EQ(report.outcome, SendOutcome::Sent);
    EXPECT_EQ(report.ack, AckKind::Accepted);
    EXPECT_EQ(report.attempts, 2);
    EXPECT_EQ(job_count(), 1u);
    EXPECT_TRUE(wait_until([&] { return count_files(store->temp_dir()) == 0; }));
}

TEST_F(SenderTest, ChangedWhileSendingIsNotCompleted) {
    fs::path file = make_file("growing.mrc", std::string(1000, 'g'));
    FaultyFactory factory(listener->port(), Fault::AppendAfterHeader, [&] {
        std::ofstream out(file, std::ios::binary | std::ios::app);
        out << "more frames";
    });
    SendProtocol sender(factory, fast_retries(), "scope-1", dir / "watched");

    SendReport report = sender.send(file);
    EXPECT_EQ(report.outcome, SendOutcome::Retry);
    EXPECT_NE(report.detail.find("changed"), std::string::npos);
    sender.close();

    // The server saw a truncated stream and must not have admitted anything
    EXPECT_TRUE(wait_until([&] { return count_files(store->temp_dir()) == 0; }));
    EXPECT_EQ(job_count(), 0u);
}

TEST_F(SenderTest, RejectionIsFinal) {
    fs::path file = make_file("huge.mrc", std::string(10000, 'h'));
    FaultyFactory factory(listener->port(), Fault::None);
    SendProtocol sender(factory, fast_retries(), "scope-1", dir / "watched");

    SendReport report = sender.send(file);
    EXPECT_EQ(report.outcome, SendOutcome::Rejected);
    EXPECT_EQ(report.ack, AckKind::Rejected);
    EXPECT_EQ(report.attempts, 1);
    EXPECT_EQ(job_count(), 0u);
}

TEST_F(SenderTest, ProtocolErrorIsNotRetriedInPlace) {
    fs::path file = make_file("foo.mrc", "payload");
    FaultyFactory factory(listener->port(), Fault::GarbledReply);
    SendProtocol sender(factory, fast_retries(), "scope-1", dir / "watched");

    SendReport report = sender.send(file);
    EXPECT_EQ(report.outcome, SendOutcome::Retry);
    EXPECT_EQ(report.attempts, 1);
    EXPECT_EQ(factory.created(), 1);
    EXPECT_NE(report.detail.find("invalid frame length"), std::string::npos) << report.detail;
}

TEST_F(SenderTest, UnreachableServerGivesUpForNow) {
    fs::path file = make_file("foo.mrc", "x");
    int port = listener->port();
    listener->stop();

    FaultyFactory factory(port, Fault::None);
    SendProtocol sender(factory, fast_retries(3), "scope-1", dir / "watched");
    SendReport report = sender.send(file);
    EXPECT_EQ(report.outcome, SendOutcome::Retry);
    EXPECT_EQ(report.attempts, 3);
}

TEST_F(SenderTest, VanishedFileIsRetryNotRejection) {
    FaultyFactory factory(listener->port(), Fault::None);
    SendProtocol sender(factory, fast_retries(), "scope-1", dir / "watched");
    SendReport report = sender.send(dir / "watched" / "gone.mrc");
    EXPECT_EQ(report.outcome, SendOutcome::Retry);
    EXPECT_EQ(factory.created(), 0);
}

TEST_F(SenderTest, StopAborts) {
    std::atomic<bool> stop{true};
    FaultyFactory factory(listener->port(), Fault::None);
    SendProtocol sender(factory, fast_retries(), "scope-1", dir / "watched", &stop);
    EXPECT_EQ(sender.send(make_file("foo.mrc", "x")).outcome, SendOutcome::Aborted);
    EXPECT_EQ(job_count(), 0u);
}

TEST_F(SenderTest, QueueReportsEveryFile) {
    FaultyFactory factory(listener->port(), Fault::None);
    SendConfig s = fast_retries();
    s.max_in_flight = 3;

    std::mutex m;
    std::map<fs::path, SendOutcome> outcomes;
    SendQueue queue(factory, s, "scope-1", dir / "watched",
                    [&](const fs::path& p, const SendReport& r) {
                        std::lock_guard<std::mutex> lock(m);
                        outcomes[p] = r.outcome;
                    });
    queue.start();
    for (int i = 0; i < 10; ++i) {
        queue.push(make_file("f" + std::to_string(i) + ".mrc", "body " + std::to_string(i)));
    }

    EXPECT_TRUE(wait_until([&] {
        std::lock_guard<std::mutex> lock(m);
        return outcomes.size() == 10;
    }));
    queue.stop();

    for (const auto& kv : outcomes) EXPECT_EQ(kv.second, SendOutcome::Sent) << kv.first;
    EXPECT_EQ(job_count(), 10u);
    EXPECT_LE(factory.created(), 3);
}
