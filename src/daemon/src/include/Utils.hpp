/*
 * Valheim Server Manager — Utility helpers (header)
 * (c) 2025 ValheimServerManager contributors
 */
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace vsm { namespace util {

/* ----------------------------------------------------------------------------
 * Environment helpers
 * ----------------------------------------------------------------------------*/

std::optional<std::string> getenv_str(const char* key);

/* ----------------------------------------------------------------------------
 * String helpers
 * ----------------------------------------------------------------------------*/

std::string trim(std::string_view sv);
std::string to_lower(std::string_view sv);
bool contains(std::string_view hay, std::string_view needle);

/** Split on '\n', trim every line, drop blank lines. */
std::vector<std::string> nonEmptyLines(std::string_view text);

/* ----------------------------------------------------------------------------
 * Time helpers
 * ----------------------------------------------------------------------------*/

std::string utc_iso8601();
long long now_ms();

/** Filesystem-safe UTC stamp with milliseconds, e.g. 2025-03-01T10-22-03-123Z */
std::string file_stamp_ms();

/* ----------------------------------------------------------------------------
 * Filesystem helpers
 * ----------------------------------------------------------------------------*/

bool readFile(const std::filesystem::path& path, std::string& out);

/** Ensure parent directory of path exists (no-op if already exists). */
void ensure_parent_dirs(const std::filesystem::path& p, std::error_code* ec = nullptr);

/* Expand a user/home/environment path:
 *  - Leading '~' -> $HOME
 *  - ${VAR} or $VAR -> environment variable
 * Returns the expanded string (no filesystem checks). */
std::string expandUserPath(const std::string& path);

}} // namespace vsm::util
