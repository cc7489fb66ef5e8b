#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <core/types.hpp>

// Ordered, reliable byte stream. Concrete strategies (direct TCP, SSH tunnel)
// are interchangeable; framing and protocols sit on top and never know which
// one they drive.
//
// Every failure is reported as ErrorKind::Transport with a retryable flag.
class Transport {
public:
    virtual ~Transport() = default;

    virtual Result<void> connect() = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;

    virtual Result<void> write_all(const void* data, std::size_t len) = 0;

    // Read exactly len bytes. If the peer closed the stream before the first
    // byte, *clean_eof is set (when given) and an error is still returned.
    virtual Result<void> read_exact(void* data, std::size_t len, bool* clean_eof = nullptr) = 0;

    // Wait until data can be read: 1 ready (or EOF pending), 0 timeout, -1 error.
    virtual int wait_readable(int timeout_ms) = 0;

    // "tcp 10.0.0.2:12345", "ssh gw:22 -> 127.0.0.1:12345", used in logs.
    virtual std::string describe() const = 0;
};

// Builds a fresh, unconnected Transport per call.
class TransportFactory {
public:
    virtual ~TransportFactory() = default;
    virtual std::unique_ptr<Transport> create() = 0;
};
