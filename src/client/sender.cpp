#include "sender.hpp"
#include <core/hashing.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <algorithm>
#include <fstream>
#include <vector>

static const char* HASH_MISMATCH = "hash-mismatch";

const char* send_outcome_name(SendOutcome outcome) {
    switch (outcome) {
    case SendOutcome::Sent:     return "sent";
    case SendOutcome::Rejected: return "rejected";
    case SendOutcome::Retry:    return "retry";
    case SendOutcome::Aborted:  return "aborted";
    }
    return "unknown";
}

SendProtocol::SendProtocol(TransportFactory& factory, SendConfig sending,
                           std::string client_name, fs::path watch_root,
                           const std::atomic<bool>* stop)
    : factory_(factory), sending_(std::move(sending)), client_name_(std::move(client_name)),
      watch_root_(std::move(watch_root)), stop_(stop) {}

SendProtocol::~SendProtocol() {
    close();
}

void SendProtocol::close() {
    if (transport_) {
        transport_->close();
        transport_.reset();
    }
}

void SendProtocol::backoff(int attempt) {
    auto delay = backoff_delay_ms(attempt, sending_.retry_initial_ms, sending_.retry_max_ms);
    // Sleep in slices so shutdown is not held up by a long backoff
    while (delay > 0 && !stopped()) {
        int slice = delay > 100 ? 100 : static_cast<int>(delay);
        platform::sleep_ms(slice);
        delay -= slice;
    }
}

// A server that refuses a header closes the connection, so a later write
// can fail while its verdict is already waiting to be read.
static Result<Ack> pending_rejection_or(FrameStream& frames, const Result<void>& err) {
    if (frames.transport().wait_readable(0) > 0) {
        auto f = frames.read_frame();
        if (f.is_ok() && f.value.type == FrameType::Ack) {
            auto ack = decode_ack(f.value.payload);
            if (ack.is_ok() && ack.value.kind == AckKind::Rejected) return ack;
        }
    }
    return Result<Ack>::Err(err);
}

SendReport SendProtocol::send(const fs::path& path) {
    SendReport report;
    int max_attempts = sending_.max_attempts > 0 ? sending_.max_attempts : 1;

    for (int i = 1; i <= max_attempts; ++i) {
        if (stopped()) {
            report.outcome = SendOutcome::Aborted;
            return report;
        }
        report.attempts = i;
        log_debug("sending {} (attempt {}/{})", path.string(), i, max_attempts);

        auto r = attempt(path, report.content_hash);
        if (r.is_ok()) {
            report.ack = r.value.kind;
            report.detail = r.value.reason;
            if (r.value.kind != AckKind::Rejected) {
                report.outcome = SendOutcome::Sent;
                log_info("{} {} as {}", path.string(), ack_kind_name(r.value.kind),
                         report.content_hash);
                return report;
            }
            // The server may have dropped the connection after rejecting
            close();
            if (r.value.reason == HASH_MISMATCH) {
                log_warn("{} arrived corrupted, will resend", path.string());
                report.outcome = SendOutcome::Retry;
            } else {
                log_warn("{} rejected: {}", path.string(), r.value.reason);
                report.outcome = SendOutcome::Rejected;
            }
            return report;
        }

        close();
        report.detail = r.error;
        if (r.kind != ErrorKind::Transport && r.kind != ErrorKind::Protocol) {
            // Local trouble with the file itself (vanished, changed, unreadable)
            log_warn("cannot send {}: {}", path.string(), r.error);
            report.outcome = SendOutcome::Retry;
            return report;
        }
        if (r.kind == ErrorKind::Transport && !r.retryable) {
            log_error("cannot reach server: {}", r.error);
            report.outcome = SendOutcome::Retry;
            return report;
        }
        if (r.kind == ErrorKind::Protocol) {
            // Resending on the spot would meet the same peer; leave it to the next round
            log_error("protocol error sending {}: {}", path.string(), r.error);
            report.outcome = SendOutcome::Retry;
            return report;
        }

        log_warn("send of {} failed (attempt {}/{}): {}", path.string(), i, max_attempts,
                 r.error);
        if (i < max_attempts) backoff(i);
    }

    if (stopped()) {
        report.outcome = SendOutcome::Aborted;
        return report;
    }
    log_error("giving up on {} for now after {} attempts", path.string(), max_attempts);
    report.outcome = SendOutcome::Retry;
    return report;
}

Result<Ack> SendProtocol::attempt(const fs::path& path, std::string& hash_out) {
    auto digest = hash_file(path);
    if (digest.is_err()) return Result<Ack>::Err(digest);
    hash_out = digest.value.hash;

    FileHeader header;
    header.content_hash = digest.value.hash;
    header.origin_name = path.filename().string();
    header.client_name = client_name_;
    fs::path rel = path.parent_path().lexically_relative(watch_root_);
    if (!rel.empty() && rel != ".") header.relative_dir = rel.generic_string();
    header.size = digest.value.size;

    // No server would take it either
    auto encoded = encode_header(header);
    if (encoded.is_err()) return Result<Ack>::Ok(Ack{AckKind::Rejected, encoded.error});

    if (!transport_ || !transport_->is_open()) {
        transport_ = factory_.create();
        auto c = transport_->connect();
        if (c.is_err()) return Result<Ack>::Err(c);
        log_info("connected: {}", transport_->describe());
    }

    FrameStream frames(*transport_);
    auto w = frames.write_frame(FrameType::Header, encoded.value);
    if (w.is_err()) return Result<Ack>::Err(w);

    w = stream_body(frames, path, header.content_hash, header.size);
    if (w.is_err()) {
        if (w.kind == ErrorKind::Transport) return pending_rejection_or(frames, w);
        return Result<Ack>::Err(w);
    }

    w = frames.write_frame(FrameType::End, nullptr, 0);
    if (w.is_err()) return pending_rejection_or(frames, w);

    auto f = frames.read_frame();
    if (f.is_err()) return Result<Ack>::Err(f);
    if (f.value.type != FrameType::Ack) {
        return Result<Ack>::Err(std::string("expected ack, got ") +
                                frame_type_name(f.value.type), ErrorKind::Protocol);
    }
    return decode_ack(f.value.payload);
}

Result<void> SendProtocol::stream_body(FrameStream& frames, const fs::path& path,
                                       const std::string& expected_hash, std::uint64_t size) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return Result<void>::Err("cannot open " + path.string(), ErrorKind::Storage);

    ContentHasher hasher;
    std::vector<char> buf(CHUNK_SIZE);
    std::uint64_t sent = 0;
    while (sent < size) {
        std::size_t want = static_cast<std::size_t>(
            std::min<std::uint64_t>(CHUNK_SIZE, size - sent));
        in.read(buf.data(), static_cast<std::streamsize>(want));
        std::size_t got = static_cast<std::size_t>(in.gcount());
        if (got != want) break;
        hasher.update(buf.data(), got);
        auto w = frames.write_frame(FrameType::Chunk, buf.data(), got);
        if (w.is_err()) return w;
        sent += got;
    }

    // A file that changed under us must not be completed with End: the
    // connection is dropped instead and the server discards the partial body.
    bool grew = in.peek() != std::char_traits<char>::eof();
    if (sent != size || grew || hasher.finalize() != expected_hash) {
        return Result<void>::Err(path.string() + " changed while sending", ErrorKind::Storage);
    }
    return Result<void>::Ok();
}
