#include <gtest/gtest.h>
#include <client/client_daemon.hpp>
#include <core/hashing.hpp>
#include <platform/socket_util.hpp>
#include <server/mark.hpp>
#include <server/server_daemon.hpp>
#include "test_support.hpp"

namespace {

int free_port() {
    auto sock = platform::listen_tcp("127.0.0.1", 0);
    if (sock.is_err()) throw std::runtime_error(sock.error);
    int port = platform::local_port(sock.value);
    platform::close_socket(sock.value);
    return port;
}

std::string mrc_bytes(std::size_t n) {
    std::string s(n, '\0');
    for (std::size_t i = 0; i < n; ++i) s[i] = static_cast<char>(i * 7 + 3);
    return s;
}

} // namespace

class EndToEndTest : public ::testing::Test {
protected:
    void start_server(std::vector<std::string> processing, bool auto_status) {
        server_cfg.address = "127.0.0.1:" + std::to_string(free_port());
        server_cfg.incoming_directory = dir / "incoming";
        server_cfg.state_directory = dir / "state";
        server_cfg.processing = std::move(processing);
        server_cfg.auto_status_update = auto_status;
        server_cfg.poll_interval_ms = 100;
        server_cfg.io_timeout_secs = 5;

        server = std::make_unique<ServerDaemon>(server_cfg);
        auto started = server->start();
        ASSERT_TRUE(started.is_ok()) << started.error;
    }

    void start_client(bool remove_after_send = false) {
        fs::create_directories(dir / "watched");
        ClientConfig c;
        c.name = "scope-1";
        c.server.host = "127.0.0.1";
        c.server.port = server->port();
        c.watching.directory = dir / "watched";
        c.watching.extension = "mrc";
        c.watching.stability_window_secs = 0;
        c.watching.stable_polls = 2;
        c.watching.refresh_every_secs = 1;
        c.sending.retry_initial_ms = 100;
        c.sending.retry_max_ms = 500;
        c.sending.connect_timeout_secs = 2;
        c.sending.io_timeout_secs = 5;
        c.sending.remove_after_send = remove_after_send;

        client = std::make_unique<ClientDaemon>(c);
        client_thread = std::thread([this] {
            auto r = client->run(client_stop);
            EXPECT_TRUE(r.is_ok()) << r.error;
        });
    }

    void TearDown() override {
        client_stop = true;
        if (client_thread.joinable()) client_thread.join();
        if (server) server->stop();
    }

    JobState state_of(const std::string& hash) {
        auto job = server->store()->get(hash);
        return job.is_ok() && job.value ? job.value->state : JobState::Discovered;
    }

    TempDir dir;
    ServerConfig server_cfg;
    std::unique_ptr<ServerDaemon> server;
    std::unique_ptr<ClientDaemon> client;
    std::atomic<bool> client_stop{false};
    std::thread client_thread;
};

TEST_F(EndToEndTest, FileIsDeliveredAndProcessed) {
    fs::path copy = dir / "processed.mrc";
    start_server({"sh", "-c", "cp \"$0\" \"$1\"", "{server_path}", copy.string()}, true);
    start_client();

    std::string body = mrc_bytes(128);
    std::string hash = hash_bytes(body);
    write_file(dir / "watched" / "foo.mrc", body);
    write_file(dir / "watched" / "notes.txt", "ignored");

    ASSERT_TRUE(wait_until([&] { return state_of(hash) == JobState::Done; }, 20000));

    auto job = server->store()->get(hash).value;
    EXPECT_EQ(job->origin_name, "foo.mrc");
    EXPECT_EQ(job->client_name, "scope-1");
    EXPECT_EQ(job->relative_dir, "");
    EXPECT_EQ(job->attempt_count, 1);
    EXPECT_EQ(read_file(job->stored_path), body);
    EXPECT_EQ(read_file(copy), body);
    EXPECT_EQ(server->store()->all().value.size(), 1u);

    auto entry = client->watcher().entry(fs::canonical(dir / "watched") / "foo.mrc");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->phase, WatchPhase::Sent);
}

TEST_F(EndToEndTest, ExternalResolutionThroughMark) {
    start_server({"true"}, false);
    start_client();

    std::string body = mrc_bytes(128);
    std::string hash = hash_bytes(body);
    write_file(dir / "watched" / "grid1" / "foo.mrc", body);

    ASSERT_TRUE(wait_until([&] { return state_of(hash) == JobState::Processing; }, 20000));
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    EXPECT_EQ(state_of(hash), JobState::Processing);
    EXPECT_EQ(server->store()->get(hash).value->relative_dir, "grid1");

    // As `pipeline mark` does it: a separate handle on the same state directory
    auto admin = JobStore::open(store_options(server_cfg, false));
    ASSERT_TRUE(admin.is_ok()) << admin.error;
    auto marked = mark_job(*admin.value, hash, MarkOutcome::Done);
    ASSERT_TRUE(marked.is_ok()) << marked.error;

    EXPECT_EQ(state_of(hash), JobState::Done);
    auto again = mark_job(*admin.value, hash, MarkOutcome::Failed);
    EXPECT_EQ(again.kind, ErrorKind::Precondition);
}

TEST_F(EndToEndTest, IdenticalContentIsOneJob) {
    start_server({"true"}, true);
    start_client();

    std::string body = mrc_bytes(256);
    write_file(dir / "watched" / "a.mrc", body);
    write_file(dir / "watched" / "copy" / "b.mrc", body);

    fs::path root = fs::canonical(dir / "watched");
    ASSERT_TRUE(wait_until([&] {
        auto a = client->watcher().entry(root / "a.mrc");
        auto b = client->watcher().entry(root / "copy" / "b.mrc");
        return a && b && a->phase == WatchPhase::Sent && b->phase == WatchPhase::Sent;
    }, 20000));

    auto jobs = server->store()->all();
    ASSERT_TRUE(jobs.is_ok());
    EXPECT_EQ(jobs.value.size(), 1u);
}

TEST_F(EndToEndTest, RemoveAfterSend) {
    start_server({"true"}, true);
    start_client(true);

    std::string body = mrc_bytes(64);
    fs::path file = dir / "watched" / "foo.mrc";
    write_file(file, body);

    ASSERT_TRUE(wait_until([&] { return !fs::exists(file); }, 20000));
    EXPECT_TRUE(wait_until([&] { return state_of(hash_bytes(body)) == JobState::Done; }));
}

TEST_F(EndToEndTest, ServerRestartRequeuesInterruptedJob) {
    start_server({"sleep", "30"}, true);
    start_client();

    std::string body = mrc_bytes(100);
    std::string hash = hash_bytes(body);
    write_file(dir / "watched" / "slow.mrc", body);
    ASSERT_TRUE(wait_until([&] { return state_of(hash) == JobState::Processing; }, 20000));

    client_stop = true;
    client_thread.join();
    server->stop();
    server.reset();

    server_cfg.processing = {"true"};
    server = std::make_unique<ServerDaemon>(server_cfg);
    ASSERT_TRUE(server->start().is_ok());
    ASSERT_TRUE(wait_until([&] { return state_of(hash) == JobState::Done; }, 10000));
    EXPECT_EQ(server->store()->get(hash).value->attempt_count, 2);
}
