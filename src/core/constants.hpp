#pragma once

#include <cstdint>
#include <cstddef>

// ── Wire format ─────────────────────────────────────────────
constexpr std::size_t CHUNK_SIZE          = 1024 * 1024;         // body chunk payload
constexpr std::size_t MAX_FRAME_SIZE      = CHUNK_SIZE + 64;     // type byte + slack
constexpr std::size_t HASH_HEX_LEN        = 64;                  // sha256, hex
constexpr std::size_t MAX_NAME_LEN        = 4096;

// ── Timeouts ────────────────────────────────────────────────
constexpr int CONNECT_TIMEOUT_SECS        = 10;
constexpr int IO_TIMEOUT_SECS             = 60;    // max silence on an open stream
constexpr int SSH_KEEPALIVE_SECS          = 30;
constexpr int DISPATCH_POLL_MS            = 1000;  // idle worker re-check of the store
constexpr int ACCEPT_POLL_MS              = 250;   // listener stop-flag check

// ── Retry counts ────────────────────────────────────────────
constexpr int SEND_MAX_ATTEMPTS           = 8;
constexpr int SEND_RETRY_INITIAL_MS       = 500;
constexpr int SEND_RETRY_MAX_MS           = 60 * 1000;
constexpr int SEND_MAX_RETRY_ROUNDS       = 10;    // watcher rounds before a file is abandoned
constexpr int PROCESS_MAX_ATTEMPTS        = 3;     // recovery re-queues per job

// ── Watching ────────────────────────────────────────────────
constexpr int WATCH_REFRESH_SECS          = 5;
constexpr int WATCH_STABILITY_SECS        = 10;
constexpr int WATCH_STABLE_POLLS          = 2;

// ── Server defaults ─────────────────────────────────────────
constexpr std::uint64_t DEFAULT_MAX_FILE_SIZE = 16ULL * 1024 * 1024 * 1024;  // 16 GB
constexpr int DEFAULT_CONCURRENCY         = 2;
constexpr std::size_t STDERR_EXCERPT_BYTES = 512;

// ── Paths ───────────────────────────────────────────────────
constexpr const char* DEFAULT_SERVER_CONFIG = "server.yaml";
constexpr const char* DEFAULT_STATE_DIR     = ".pipeline_state";
constexpr const char* TMP_SUBDIR            = ".tmp";
