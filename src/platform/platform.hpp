#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME, falling back to the temp dir).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Expand a leading "~/" to the home directory.
std::filesystem::path expand_user(const std::filesystem::path& p);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// Flush a file's data to disk. Returns false on error (errno is set).
bool fsync_path(const std::filesystem::path& path);

// Flush a directory entry table, making a rename inside it durable.
bool fsync_dir(const std::filesystem::path& dir);

// Write content to path atomically: temp file in the same directory, fsync,
// rename over path, fsync the directory.
bool write_file_atomic(const std::filesystem::path& path, const std::string& content,
                       std::string* error = nullptr);

} // namespace platform
