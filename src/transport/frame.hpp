#pragma once

#include <cstdint>
#include <string>
#include <core/types.hpp>
#include "transport.hpp"

// Wire format:  u32 BE length | u8 type | payload
// length counts the type byte plus the payload.

enum class FrameType : std::uint8_t {
    Header = 1,
    Chunk  = 2,
    End    = 3,
    Ack    = 4,
};

const char* frame_type_name(FrameType type);

struct Frame {
    FrameType type = FrameType::End;
    std::string payload;
};

// Announces one file. Strings are u16-length prefixed, size is u64 BE.
struct FileHeader {
    std::string content_hash;
    std::string origin_name;     // file name, no directories
    std::string client_name;
    std::string relative_dir;    // directory below the watch root, "" at top level
    std::uint64_t size = 0;
};

enum class AckKind : std::uint8_t {
    Accepted  = 0,
    Duplicate = 1,
    Rejected  = 2,
};

const char* ack_kind_name(AckKind kind);

struct Ack {
    AckKind kind = AckKind::Accepted;
    std::string reason;
};

// Fails with ErrorKind::Protocol when a string field exceeds MAX_NAME_LEN.
Result<std::string> encode_header(const FileHeader& header);
Result<FileHeader> decode_header(const std::string& payload);

std::string encode_ack(const Ack& ack);
Result<Ack> decode_ack(const std::string& payload);

// Frames on top of a Transport. Does not own the transport.
class FrameStream {
public:
    explicit FrameStream(Transport& transport) : transport_(transport) {}

    Result<void> write_frame(FrameType type, const void* data, std::size_t len);
    Result<void> write_frame(FrameType type, const std::string& payload) {
        return write_frame(type, payload.data(), payload.size());
    }

    // A peer that closes between frames yields an error with *clean_eof set.
    Result<Frame> read_frame(bool* clean_eof = nullptr);

    Transport& transport() { return transport_; }

private:
    Transport& transport_;
};
