#pragma once

#include <filesystem>

namespace lfscache {

// All log output goes to stderr: stdout carries the transfer protocol.
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

void set_log_verbose(bool verbose);
bool log_verbose();

/// Point stderr at the given file (appending). Returns false if it cannot be opened.
bool redirect_log(const std::filesystem::path& path);

}  // namespace lfscache
