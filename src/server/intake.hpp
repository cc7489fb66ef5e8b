#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <core/types.hpp>
#include <transport/frame.hpp>
#include <transport/transport.hpp>
#include "job_store.hpp"

struct IntakeOptions {
    std::uint64_t max_file_size = 0;
    bool readmit_failed = false;
};

// Server side of a transfer connection. Reads files one after another:
// Header, Chunks, End, then answers with one Ack.
//
//   bad header or framing   Rejected{reason}, connection closed
//   hash mismatch           Rejected{hash-mismatch}, connection kept
//   known hash              Duplicate
//   new hash                stored, recorded Admitted, Accepted
class Intake {
public:
    using AdmitCallback = std::function<void(const Job&)>;

    Intake(JobStore& store, IntakeOptions options, AdmitCallback on_admit = {});

    // Serve until the peer closes, a protocol error occurs, or `stop` is set
    // while the connection is idle between files.
    void serve(Transport& conn, const std::atomic<bool>& stop);

    // Why a header is refused, empty when acceptable.
    std::string validate_header(const FileHeader& header) const;

private:
    // Receive one body and decide the Ack. An error means no Ack can be
    // given and the connection must be dropped.
    Result<Ack> receive_file(FrameStream& frames, const FileHeader& header);

    void send_ack(FrameStream& frames, const Ack& ack);

    JobStore& store_;
    IntakeOptions options_;
    AdmitCallback on_admit_;
    std::atomic<unsigned> temp_counter_{0};
};
