/*
 * CurveFan — Utility helpers (implementation; Linux-only)
 * (c) 2025 CurveFan contributors
 */

#include "include/Utils.hpp"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace curvefan { namespace util {

/* ----------------------------------------------------------------------------
 * Environment helpers
 * ----------------------------------------------------------------------------*/

std::optional<std::string> getenv_str(const char* key) {
    if (!key || !*key) return std::nullopt;
    const char* v = std::getenv(key);
    if (!v) return std::nullopt;
    return std::string(v);
}

int getenv_int(const char* key, int def) {
    auto v = getenv_str(key);
    if (!v || v->empty()) return def;
    auto n = parse_ll(*v);
    if (!n || *n < INT_MIN || *n > INT_MAX) return def;
    return static_cast<int>(*n);
}

bool getenv_bool(const char* key, bool def) {
    auto c = getenv_str(key);
    if (!c || c->empty()) return def;
    const std::string v = to_lower(trim(*c));
    if (v=="1"||v=="true"||v=="yes"||v=="on")  return true;
    if (v=="0"||v=="false"||v=="no" ||v=="off") return false;
    return def;
}

/* ----------------------------------------------------------------------------
 * String helpers
 * ----------------------------------------------------------------------------*/

std::string trim(std::string_view sv) {
    size_t i = 0, j = sv.size();
    while (i < j && std::isspace(static_cast<unsigned char>(sv[i]))) ++i;
    while (j > i && std::isspace(static_cast<unsigned char>(sv[j-1]))) --j;
    return std::string(sv.substr(i, j - i));
}

std::string to_lower(std::string_view sv) {
    std::string s(sv);
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

std::optional<long long> parse_ll(std::string_view sv) {
    const std::string s = trim(sv);
    if (s.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    const long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno == ERANGE || end == s.c_str() || *end != '\0') return std::nullopt;
    return v;
}

/* ----------------------------------------------------------------------------
 * Filesystem helpers
 * ----------------------------------------------------------------------------*/

bool read_text_file(const fs::path& p, std::string& out) {
    std::ifstream ifs(p, std::ios::binary);
    if (!ifs) return false;
    std::ostringstream ss;
    ss << ifs.rdbuf();
    if (ifs.bad()) return false;
    out = ss.str();
    return true;
}

std::optional<long long> read_first_line_ll(const fs::path& p) {
    std::ifstream f(p);
    if (!f) return std::nullopt;
    std::string s;
    if (!std::getline(f, s)) return std::nullopt;
    return parse_ll(s);
}

bool write_int_file(const fs::path& p, int value) {
    std::ofstream f(p);
    if (!f) return false;
    f << value;
    f.flush();
    return f.good();
}

bool write_text_file_atomic(const fs::path& p, const std::string& content, std::string* err) {
    if (err) err->clear();
    const std::string tmp = p.string() + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            if (err) *err = "open " + tmp + " failed: " + std::strerror(errno);
            return false;
        }
        ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
        ofs.flush();
        if (!ofs) {
            if (err) *err = "write " + tmp + " failed";
            return false;
        }
    }
    if (std::rename(tmp.c_str(), p.c_str()) != 0) {
        if (err) *err = "rename to " + p.string() + " failed: " + std::strerror(errno);
        std::error_code ec;
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

void ensure_parent_dirs(const fs::path& p, std::error_code* ec) {
    fs::path dir = p.parent_path();
    if (dir.empty()) return;
    std::error_code tmp;
    fs::create_directories(dir, tmp);
    if (ec) *ec = tmp;
}

/* ----------------------------------------------------------------------------
 * Path expansion
 * ----------------------------------------------------------------------------*/

static inline bool isIdentChar_(char c) {
    return (c == '_') ||
           (c >= 'A' && c <= 'Z') ||
           (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9');
}

std::string expandUserPath(const std::string& in) {
    if (in.empty()) return in;

    std::string out = in;

    // "~" -> $HOME
    if (out.front() == '~') {
        auto home = getenv_str("HOME");
        if (home && !home->empty()) {
            if (out.size() == 1) return *home;
            if (out[1] == '/') out = *home + out.substr(1);
        }
    }

    // $VAR and ${VAR}
    std::string result;
    result.reserve(out.size());
    for (size_t i = 0; i < out.size(); ++i) {
        const char c = out[i];
        if (c == '$') {
            if (i + 1 < out.size() && out[i + 1] == '{') {
                size_t j = i + 2;
                while (j < out.size() && out[j] != '}') ++j;
                if (j < out.size()) {
                    auto v = getenv_str(out.substr(i + 2, j - (i + 2)).c_str());
                    if (v) result += *v;
                    i = j;
                    continue;
                }
            } else {
                size_t j = i + 1;
                while (j < out.size() && isIdentChar_(out[j])) ++j;
                if (j > i + 1) {
                    auto v = getenv_str(out.substr(i + 1, j - (i + 1)).c_str());
                    if (v) result += *v;
                    i = j - 1;
                    continue;
                }
            }
        }
        result.push_back(c);
    }
    return result;
}

}} // namespace curvefan::util
