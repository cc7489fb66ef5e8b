#include "intake.hpp"
#include <core/constants.hpp>
#include <core/hashing.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <unistd.h>
#include <fstream>

static const char* HASH_MISMATCH = "hash-mismatch";

namespace {

// Removes the partial upload unless admission moved it away.
class TempUpload {
public:
    explicit TempUpload(fs::path path) : path_(std::move(path)) {}
    ~TempUpload() {
        std::error_code ec;
        fs::remove(path_, ec);
    }
    TempUpload(const TempUpload&) = delete;
    TempUpload& operator=(const TempUpload&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

bool is_path_like(const std::string& name) {
    return name.empty() || name == "." || name == ".." ||
           name.find('/') != std::string::npos || name.find('\\') != std::string::npos ||
           name.find('\0') != std::string::npos;
}

bool escapes_root(const std::string& rel) {
    if (rel.empty()) return false;
    fs::path p(rel);
    if (p.is_absolute()) return true;
    for (const auto& part : p) {
        if (part == "..") return true;
    }
    return rel.find('\0') != std::string::npos;
}

} // namespace

Intake::Intake(JobStore& store, IntakeOptions options, AdmitCallback on_admit)
    : store_(store), options_(options), on_admit_(std::move(on_admit)) {}

std::string Intake::validate_header(const FileHeader& header) const {
    if (!is_valid_content_hash(header.content_hash)) return "invalid content hash";
    if (is_path_like(header.origin_name)) return "invalid origin name";
    if (escapes_root(header.relative_dir)) return "invalid relative directory";
    // Job records are YAML text and cannot hold arbitrary bytes
    if (!is_valid_utf8(header.origin_name) || !is_valid_utf8(header.relative_dir) ||
        !is_valid_utf8(header.client_name)) {
        return "names must be valid UTF-8";
    }
    if (options_.max_file_size > 0 && header.size > options_.max_file_size) {
        return fmt::format("file too large ({} > {} bytes)", header.size,
                           options_.max_file_size);
    }
    return "";
}

void Intake::send_ack(FrameStream& frames, const Ack& ack) {
    auto w = frames.write_frame(FrameType::Ack, encode_ack(ack));
    if (w.is_err()) {
        log_warn("cannot deliver {} ack to {}: {}", ack_kind_name(ack.kind),
                 frames.transport().describe(), w.error);
    }
}

void Intake::serve(Transport& conn, const std::atomic<bool>& stop) {
    FrameStream frames(conn);
    const std::string peer = conn.describe();
    log_debug("connection from {}", peer);

    while (true) {
        // Idle between files: give up the connection once shutdown starts
        int ready = 0;
        while (!stop && (ready = conn.wait_readable(ACCEPT_POLL_MS)) == 0) {}
        if (stop && ready <= 0) {
            log_debug("closing idle connection {}", peer);
            break;
        }

        bool eof = false;
        auto f = frames.read_frame(&eof);
        if (f.is_err()) {
            if (eof) {
                log_debug("{} disconnected", peer);
            } else if (f.kind == ErrorKind::Protocol) {
                log_warn("protocol error from {}: {}", peer, f.error);
                send_ack(frames, Ack{AckKind::Rejected, f.error});
            } else {
                log_warn("connection {} lost: {}", peer, f.error);
            }
            break;
        }

        if (f.value.type != FrameType::Header) {
            std::string reason = std::string("expected header, got ") +
                                 frame_type_name(f.value.type);
            log_warn("protocol error from {}: {}", peer, reason);
            send_ack(frames, Ack{AckKind::Rejected, reason});
            break;
        }

        auto header = decode_header(f.value.payload);
        if (header.is_err()) {
            log_warn("protocol error from {}: {}", peer, header.error);
            send_ack(frames, Ack{AckKind::Rejected, header.error});
            break;
        }

        std::string refusal = validate_header(header.value);
        if (!refusal.empty()) {
            log_warn("rejecting {} from {}: {}", header.value.origin_name, peer, refusal);
            send_ack(frames, Ack{AckKind::Rejected, refusal});
            break;
        }

        auto ack = receive_file(frames, header.value);
        if (ack.is_err()) {
            if (ack.kind == ErrorKind::Protocol) {
                log_warn("protocol error from {}: {}", peer, ack.error);
                send_ack(frames, Ack{AckKind::Rejected, ack.error});
            } else {
                log_error("transfer of {} from {} aborted: {}", header.value.origin_name, peer,
                          ack.error);
            }
            break;
        }
        send_ack(frames, ack.value);
    }
    conn.close();
}

Result<Ack> Intake::receive_file(FrameStream& frames, const FileHeader& header) {
    using R = Result<Ack>;

    TempUpload temp(store_.temp_dir() /
                    fmt::format("{}.{}.{}.part", header.content_hash, ::getpid(),
                                temp_counter_++));
    std::ofstream out(temp.path(), std::ios::binary | std::ios::trunc);
    if (!out) return R::Err("cannot create " + temp.path().string(), ErrorKind::Storage);

    ContentHasher hasher;
    std::uint64_t received = 0;
    while (true) {
        auto f = frames.read_frame();
        if (f.is_err()) return R::Err(f);

        if (f.value.type == FrameType::Chunk) {
            const std::string& data = f.value.payload;
            if (received + data.size() > header.size) {
                return R::Err(fmt::format("body longer than declared {} bytes", header.size),
                              ErrorKind::Protocol);
            }
            out.write(data.data(), static_cast<std::streamsize>(data.size()));
            if (!out) return R::Err("cannot write " + temp.path().string(), ErrorKind::Storage);
            hasher.update(data.data(), data.size());
            received += data.size();
        } else if (f.value.type == FrameType::End) {
            if (received != header.size) {
                return R::Err(fmt::format("body of {} bytes, {} declared", received,
                                          header.size), ErrorKind::Protocol);
            }
            break;
        } else {
            return R::Err(std::string("unexpected ") + frame_type_name(f.value.type) +
                          " frame in body", ErrorKind::Protocol);
        }
    }

    out.close();
    if (!out) return R::Err("cannot write " + temp.path().string(), ErrorKind::Storage);

    if (hasher.finalize() != header.content_hash) {
        log_warn("hash mismatch for {} from {}", header.origin_name, header.client_name);
        return R::Ok(Ack{AckKind::Rejected, HASH_MISMATCH});
    }

    Job job;
    job.content_hash = header.content_hash;
    job.origin_name = header.origin_name;
    job.client_name = header.client_name;
    job.relative_dir = header.relative_dir;
    job.size = header.size;

    auto admitted = store_.admit(job, temp.path(), options_.readmit_failed);
    if (admitted.is_err()) return R::Err(admitted);

    const Job& stored = admitted.value.job;
    switch (admitted.value.outcome) {
    case AdmitOutcome::Duplicate:
        log_info("duplicate {} from {} (job {} is {})", header.origin_name, header.client_name,
                 stored.content_hash, job_state_name(stored.state));
        return R::Ok(Ack{AckKind::Duplicate, ""});
    case AdmitOutcome::Readmitted:
        log_info("re-admitted failed job {} ({})", stored.content_hash, stored.origin_name);
        break;
    case AdmitOutcome::Admitted:
        log_info("admitted {} from {} as {} ({} bytes)", header.origin_name,
                 header.client_name, stored.content_hash, stored.size);
        break;
    }
    if (on_admit_) on_admit_(stored);
    return R::Ok(Ack{AckKind::Accepted, ""});
}
