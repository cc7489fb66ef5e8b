#pragma once

#include <cstdint>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include "types.hpp"

typedef struct evp_md_ctx_st EVP_MD_CTX;

// Content identity of a file: lowercase hex SHA-256 over all of its bytes.
struct FileDigest {
    std::string hash;
    std::uint64_t size = 0;
};

// Incremental SHA-256. Used by the client over a file on disk and by the
// server over a body as it streams in.
class ContentHasher {
public:
    ContentHasher();
    ~ContentHasher();

    ContentHasher(const ContentHasher&) = delete;
    ContentHasher& operator=(const ContentHasher&) = delete;

    void update(const void* data, std::size_t len);

    // Finish and return the hex digest. The hasher must not be reused.
    std::string finalize();

    std::uint64_t bytes() const { return bytes_; }

private:
    struct CtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const;
    };
    std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
    std::uint64_t bytes_ = 0;
    bool ok_ = true;
};

// Hash a file's current bytes (re-read every call).
Result<FileDigest> hash_file(const std::filesystem::path& path);

// Hash an in-memory buffer.
std::string hash_bytes(const std::string& data);

// True for a 64-char lowercase hex string.
bool is_valid_content_hash(const std::string& hash);

std::string hex_encode(const unsigned char* data, std::size_t len);
