#include "frame.hpp"
#include <core/constants.hpp>
#include <fmt/format.h>

const char* frame_type_name(FrameType type) {
    switch (type) {
    case FrameType::Header: return "header";
    case FrameType::Chunk:  return "chunk";
    case FrameType::End:    return "end";
    case FrameType::Ack:    return "ack";
    }
    return "unknown";
}

const char* ack_kind_name(AckKind kind) {
    switch (kind) {
    case AckKind::Accepted:  return "accepted";
    case AckKind::Duplicate: return "duplicate";
    case AckKind::Rejected:  return "rejected";
    }
    return "unknown";
}

// ── Big-endian helpers ──────────────────────────────────────

static void put_u16(std::string& out, std::uint16_t v) {
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
    out.push_back(static_cast<char>(v & 0xFF));
}

static void put_u32(unsigned char* out, std::uint32_t v) {
    out[0] = static_cast<unsigned char>((v >> 24) & 0xFF);
    out[1] = static_cast<unsigned char>((v >> 16) & 0xFF);
    out[2] = static_cast<unsigned char>((v >> 8) & 0xFF);
    out[3] = static_cast<unsigned char>(v & 0xFF);
}

static void put_u64(std::string& out, std::uint64_t v) {
    for (int shift = 56; shift >= 0; shift -= 8)
        out.push_back(static_cast<char>((v >> shift) & 0xFF));
}

static void put_str(std::string& out, const std::string& s) {
    put_u16(out, static_cast<std::uint16_t>(s.size()));
    out += s;
}

namespace {

// Bounds-checked cursor over a payload.
class Reader {
public:
    explicit Reader(const std::string& data) : data_(data) {}

    bool u8(std::uint8_t& v) {
        if (pos_ + 1 > data_.size()) return false;
        v = static_cast<std::uint8_t>(data_[pos_++]);
        return true;
    }

    bool u16(std::uint16_t& v) {
        if (pos_ + 2 > data_.size()) return false;
        v = static_cast<std::uint16_t>((byte(pos_) << 8) | byte(pos_ + 1));
        pos_ += 2;
        return true;
    }

    bool u64(std::uint64_t& v) {
        if (pos_ + 8 > data_.size()) return false;
        v = 0;
        for (int i = 0; i < 8; ++i) v = (v << 8) | byte(pos_ + i);
        pos_ += 8;
        return true;
    }

    bool str(std::string& s) {
        std::uint16_t len = 0;
        if (!u16(len) || pos_ + len > data_.size()) return false;
        s.assign(data_, pos_, len);
        pos_ += len;
        return true;
    }

    bool done() const { return pos_ == data_.size(); }

private:
    std::uint64_t byte(std::size_t i) const {
        return static_cast<unsigned char>(data_[i]);
    }

    const std::string& data_;
    std::size_t pos_ = 0;
};

} // namespace

// ── Header / Ack ───────────────────────────────────────────

Result<std::string> encode_header(const FileHeader& header) {
    for (const std::string* field : {&header.content_hash, &header.origin_name,
                                     &header.client_name, &header.relative_dir}) {
        if (field->size() > MAX_NAME_LEN) {
            return Result<std::string>::Err(
                fmt::format("header field of {} bytes exceeds {}", field->size(), MAX_NAME_LEN),
                ErrorKind::Protocol);
        }
    }
    std::string out;
    out.reserve(header.content_hash.size() + header.origin_name.size() +
                header.client_name.size() + header.relative_dir.size() + 16);
    put_str(out, header.content_hash);
    put_str(out, header.origin_name);
    put_str(out, header.client_name);
    put_str(out, header.relative_dir);
    put_u64(out, header.size);
    return Result<std::string>::Ok(std::move(out));
}

Result<FileHeader> decode_header(const std::string& payload) {
    FileHeader h;
    Reader r(payload);
    if (!r.str(h.content_hash) || !r.str(h.origin_name) || !r.str(h.client_name) ||
        !r.str(h.relative_dir) || !r.u64(h.size) || !r.done()) {
        return Result<FileHeader>::Err("malformed header frame", ErrorKind::Protocol);
    }
    return Result<FileHeader>::Ok(std::move(h));
}

std::string encode_ack(const Ack& ack) {
    std::string out;
    out.push_back(static_cast<char>(ack.kind));
    put_str(out, ack.reason.size() > MAX_NAME_LEN ? ack.reason.substr(0, MAX_NAME_LEN)
                                                  : ack.reason);
    return out;
}

Result<Ack> decode_ack(const std::string& payload) {
    Ack ack;
    Reader r(payload);
    std::uint8_t tag = 0;
    if (!r.u8(tag) || !r.str(ack.reason) || !r.done()) {
        return Result<Ack>::Err("malformed ack frame", ErrorKind::Protocol);
    }
    if (tag > static_cast<std::uint8_t>(AckKind::Rejected)) {
        return Result<Ack>::Err(fmt::format("unknown ack tag {}", tag), ErrorKind::Protocol);
    }
    ack.kind = static_cast<AckKind>(tag);
    return Result<Ack>::Ok(std::move(ack));
}

// ── FrameStream ────────────────────────────────────────────

Result<void> FrameStream::write_frame(FrameType type, const void* data, std::size_t len) {
    if (len + 1 > MAX_FRAME_SIZE) {
        return protocol_error(fmt::format("{} frame of {} bytes exceeds limit",
                                          frame_type_name(type), len));
    }
    unsigned char prefix[5];
    put_u32(prefix, static_cast<std::uint32_t>(len + 1));
    prefix[4] = static_cast<unsigned char>(type);

    auto r = transport_.write_all(prefix, sizeof(prefix));
    if (r.is_err()) return r;
    if (len == 0) return Result<void>::Ok();
    return transport_.write_all(data, len);
}

Result<Frame> FrameStream::read_frame(bool* clean_eof) {
    unsigned char prefix[5];
    auto r = transport_.read_exact(prefix, 4, clean_eof);
    if (r.is_err()) return Result<Frame>::Err(r);

    std::uint32_t length = (static_cast<std::uint32_t>(prefix[0]) << 24) |
                           (static_cast<std::uint32_t>(prefix[1]) << 16) |
                           (static_cast<std::uint32_t>(prefix[2]) << 8) |
                           static_cast<std::uint32_t>(prefix[3]);
    if (length == 0 || length > MAX_FRAME_SIZE) {
        return Result<Frame>::Err(fmt::format("invalid frame length {}", length),
                                  ErrorKind::Protocol);
    }

    r = transport_.read_exact(prefix + 4, 1);
    if (r.is_err()) return Result<Frame>::Err(r);
    std::uint8_t type = prefix[4];
    if (type < static_cast<std::uint8_t>(FrameType::Header) ||
        type > static_cast<std::uint8_t>(FrameType::Ack)) {
        return Result<Frame>::Err(fmt::format("unknown frame type {}", type),
                                  ErrorKind::Protocol);
    }

    Frame frame;
    frame.type = static_cast<FrameType>(type);
    frame.payload.resize(length - 1);
    if (!frame.payload.empty()) {
        r = transport_.read_exact(&frame.payload[0], frame.payload.size());
        if (r.is_err()) return Result<Frame>::Err(r);
    }
    return Result<Frame>::Ok(std::move(frame));
}
