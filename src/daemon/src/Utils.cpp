/*
 * Valheim Server Manager — Utility helpers (implementation; Linux-only)
 * (c) 2025 ValheimServerManager contributors
 */

#include "include/Utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace vsm { namespace util {

namespace {

bool isSpace(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

bool isEnvNameChar(char c) {
    return c == '_' || std::isalnum(static_cast<unsigned char>(c)) != 0;
}

std::string formatUtc(std::time_t secs, const char* fmt) {
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[40];
    const size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, n);
}

} // namespace

/* ----------------------------------------------------------------------------
 * Environment
 * ----------------------------------------------------------------------------*/

std::optional<std::string> getenv_str(const char* key) {
    if (key == nullptr || *key == '\0') return std::nullopt;
    if (const char* v = std::getenv(key)) return std::string(v);
    return std::nullopt;
}

/* ----------------------------------------------------------------------------
 * Strings
 * ----------------------------------------------------------------------------*/

std::string trim(std::string_view sv) {
    while (!sv.empty() && isSpace(sv.front())) sv.remove_prefix(1);
    while (!sv.empty() && isSpace(sv.back())) sv.remove_suffix(1);
    return std::string(sv);
}

std::string to_lower(std::string_view sv) {
    std::string out;
    out.reserve(sv.size());
    std::transform(sv.begin(), sv.end(), std::back_inserter(out),
                   [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
    return out;
}

bool contains(std::string_view hay, std::string_view needle) {
    return hay.find(needle) != std::string_view::npos;
}

std::vector<std::string> nonEmptyLines(std::string_view text) {
    std::vector<std::string> lines;
    while (!text.empty()) {
        const size_t nl = text.find('\n');
        const std::string_view raw = text.substr(0, nl);
        std::string line = trim(raw);
        if (!line.empty()) lines.push_back(std::move(line));
        if (nl == std::string_view::npos) break;
        text.remove_prefix(nl + 1);
    }
    return lines;
}

/* ----------------------------------------------------------------------------
 * Time
 * ----------------------------------------------------------------------------*/

std::string utc_iso8601() {
    return formatUtc(std::time(nullptr), "%Y-%m-%dT%H:%M:%SZ");
}

long long now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string file_stamp_ms() {
    const long long ms = now_ms();
    const std::string secs = formatUtc(static_cast<std::time_t>(ms / 1000), "%Y-%m-%dT%H-%M-%S");
    if (secs.empty()) return std::to_string(ms);
    char frac[8];
    std::snprintf(frac, sizeof(frac), "-%03dZ", static_cast<int>(ms % 1000));
    return secs + frac;
}

/* ----------------------------------------------------------------------------
 * Files
 * ----------------------------------------------------------------------------*/

bool readFile(const fs::path& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return !in.bad();
}

void ensure_parent_dirs(const fs::path& p, std::error_code* ec) {
    std::error_code local;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), local);
    if (ec) *ec = local;
}

std::string expandUserPath(const std::string& in) {
    std::string src = in;
    if (!src.empty() && src[0] == '~' && (src.size() == 1 || src[1] == '/')) {
        const auto home = getenv_str("HOME");
        if (home && !home->empty()) src.replace(0, 1, *home);
    }

    // $VAR and ${VAR}; unset variables expand to nothing, an unclosed "${" is kept verbatim
    std::string out;
    out.reserve(src.size());
    size_t i = 0;
    while (i < src.size()) {
        if (src[i] != '$' || i + 1 >= src.size()) {
            out.push_back(src[i++]);
            continue;
        }
        std::string name;
        size_t next = i;
        if (src[i + 1] == '{') {
            const size_t close = src.find('}', i + 2);
            if (close != std::string::npos) {
                name = src.substr(i + 2, close - i - 2);
                next = close + 1;
            }
        } else {
            size_t j = i + 1;
            while (j < src.size() && isEnvNameChar(src[j])) ++j;
            if (j > i + 1) {
                name = src.substr(i + 1, j - i - 1);
                next = j;
            }
        }
        if (next == i) {
            out.push_back(src[i++]);
            continue;
        }
        if (const auto v = getenv_str(name.c_str())) out += *v;
        i = next;
    }
    return out;
}

}} // namespace vsm::util
