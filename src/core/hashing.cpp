#include "hashing.hpp"
#include "constants.hpp"
#include "log.hpp"
#include <openssl/evp.h>
#include <fstream>
#include <vector>
#include <cstring>
#include <cerrno>

void ContentHasher::CtxDeleter::operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
}

ContentHasher::ContentHasher() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        ok_ = false;
    }
}

ContentHasher::~ContentHasher() = default;

void ContentHasher::update(const void* data, std::size_t len) {
    if (!ok_ || len == 0) return;
    if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
        ok_ = false;
        return;
    }
    bytes_ += len;
}

std::string ContentHasher::finalize() {
    if (!ok_) return "";
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), out, &out_len) != 1) {
        ok_ = false;
        return "";
    }
    ok_ = false;
    return hex_encode(out, out_len);
}

std::string hex_encode(const unsigned char* data, std::size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (std::size_t i = 0; i < len; i++) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0F];
    }
    return out;
}

Result<FileDigest> hash_file(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        return Result<FileDigest>::Err(
            "open failed: " + path.string() + ": " + std::strerror(errno), ErrorKind::Storage);
    }

    log_debug("computing hash for {}", path.string());

    ContentHasher hasher;
    std::vector<char> buf(CHUNK_SIZE);
    while (f) {
        f.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize n = f.gcount();
        if (n > 0) hasher.update(buf.data(), static_cast<std::size_t>(n));
    }
    if (f.bad()) {
        return Result<FileDigest>::Err("read failed: " + path.string(), ErrorKind::Storage);
    }

    FileDigest digest;
    digest.size = hasher.bytes();
    digest.hash = hasher.finalize();
    if (digest.hash.empty()) {
        return Result<FileDigest>::Err("sha256 failed for " + path.string(), ErrorKind::Storage);
    }
    return Result<FileDigest>::Ok(digest);
}

std::string hash_bytes(const std::string& data) {
    ContentHasher hasher;
    hasher.update(data.data(), data.size());
    return hasher.finalize();
}

bool is_valid_content_hash(const std::string& hash) {
    if (hash.size() != HASH_HEX_LEN) return false;
    for (char c : hash) {
        bool digit = c >= '0' && c <= '9';
        bool lower = c >= 'a' && c <= 'f';
        if (!digit && !lower) return false;
    }
    return true;
}
