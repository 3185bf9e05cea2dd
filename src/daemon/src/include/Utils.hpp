/*
 * CurveFan — Utility helpers (header)
 * (c) 2025 CurveFan contributors
 */
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace curvefan { namespace util {

/* ----------------------------------------------------------------------------
 * Environment helpers
 * ----------------------------------------------------------------------------*/

std::optional<std::string> getenv_str(const char* key);
int  getenv_int(const char* key, int def);
bool getenv_bool(const char* key, bool def);

/* ----------------------------------------------------------------------------
 * String helpers
 * ----------------------------------------------------------------------------*/

std::string trim(std::string_view sv);
std::string to_lower(std::string_view sv);

/** Strict integer parse of a whole (trimmed) string. Rejects trailing garbage. */
std::optional<long long> parse_ll(std::string_view sv);

/* ----------------------------------------------------------------------------
 * Filesystem helpers
 * ----------------------------------------------------------------------------*/

bool read_text_file(const std::filesystem::path& p, std::string& out);

/** First line of the file parsed with parse_ll; nullopt on I/O or parse error. */
std::optional<long long> read_first_line_ll(const std::filesystem::path& p);

bool write_int_file(const std::filesystem::path& p, int value);

/**
 * Write `content` to `<p>.tmp` and rename it over `p`, so readers only ever
 * see a complete document. Sets *err on failure.
 */
bool write_text_file_atomic(const std::filesystem::path& p,
                            const std::string& content,
                            std::string* err = nullptr);

/** Ensure parent directory of path exists (no-op if already exists). */
void ensure_parent_dirs(const std::filesystem::path& p, std::error_code* ec = nullptr);

/* Expand a user/home/environment path:
 *  - Leading '~' -> $HOME
 *  - ${VAR} or $VAR -> environment variable
 * Returns the expanded string (no filesystem checks). */
std::string expandUserPath(const std::string& path);

}} // namespace curvefan::util
