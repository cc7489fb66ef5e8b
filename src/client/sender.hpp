#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <core/config.hpp>
#include <transport/frame.hpp>
#include <transport/transport.hpp>

enum class SendOutcome {
    Sent,       // Accepted or Duplicate received
    Rejected,   // server refused the file for good
    Retry,      // gave up for now; the watcher re-yields the path later
    Aborted,    // stop requested
};

const char* send_outcome_name(SendOutcome outcome);

struct SendReport {
    SendOutcome outcome = SendOutcome::Retry;
    AckKind ack = AckKind::Rejected;     // meaningful for Sent / Rejected
    std::string content_hash;
    std::string detail;                  // reject reason or last error
    int attempts = 0;
};

// Delivers one file per send() call over a connection it keeps open between
// files. Each call re-hashes the file, streams Header, Chunks and End, then
// waits for the Ack. A transport failure before the Ack closes the connection
// and retries with exponential backoff, up to sending.max_attempts.
class SendProtocol {
public:
    SendProtocol(TransportFactory& factory, SendConfig sending, std::string client_name,
                 fs::path watch_root, const std::atomic<bool>* stop = nullptr);
    ~SendProtocol();

    SendReport send(const fs::path& path);

    void close();

private:
    // One attempt: connect if needed, transfer, read the Ack.
    Result<Ack> attempt(const fs::path& path, std::string& hash_out);
    Result<void> stream_body(FrameStream& frames, const fs::path& path,
                             const std::string& expected_hash, std::uint64_t size);
    bool stopped() const { return stop_ && stop_->load(); }
    void backoff(int attempt);

    TransportFactory& factory_;
    SendConfig sending_;
    std::string client_name_;
    fs::path watch_root_;
    const std::atomic<bool>* stop_;
    std::unique_ptr<Transport> transport_;
};
