#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace driverfetch {

inline std::string ToLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

inline std::string ToUpper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return out;
}

inline std::string Trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(first, last - first + 1));
}

inline bool EndsWithIgnoreCase(std::string_view s, std::string_view suffix) {
    if (s.size() < suffix.size()) return false;
    return ToLower(s.substr(s.size() - suffix.size())) == ToLower(suffix);
}

inline bool ContainsIgnoreCase(std::string_view haystack, std::string_view needle) {
    return ToLower(haystack).find(ToLower(needle)) != std::string::npos;
}

// URL without its query string and fragment.
inline std::string_view StripUrlQuery(std::string_view url) {
    const auto pos = url.find_first_of("?#");
    return pos == std::string_view::npos ? url : url.substr(0, pos);
}

// Decodes %XX escapes. Malformed escapes are kept verbatim; '+' is not a space.
inline std::string PercentDecode(std::string_view s) {
    auto hex = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            const int hi = hex(s[i + 1]);
            const int lo = hex(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

// Local filename for a download: the percent-decoded last path segment of
// the URL. Returns empty when the URL has no usable segment.
inline std::string FilenameFromUrl(std::string_view url) {
    const std::string_view path = StripUrlQuery(url);
    const auto slash = path.rfind('/');
    const std::string_view segment = (slash == std::string_view::npos) ? path : path.substr(slash + 1);

    std::string name = PercentDecode(segment);
    std::replace(name.begin(), name.end(), '/', '_');
    std::replace(name.begin(), name.end(), '\\', '_');
    if (name == "." || name == "..") return {};
    return name;
}

// Category label as a single directory component.
inline std::string SanitizeCategory(std::string_view category) {
    std::string out(category);
    std::replace(out.begin(), out.end(), '/', '-');
    std::replace(out.begin(), out.end(), '\\', '-');
    if (out.empty() || out == "." || out == "..") return "Other";
    return out;
}

// Normalize archive entry path to a clean relative form:
// - strip leading "./"
// - strip leading "/" (avoid absolute)
// - collapse duplicate slashes
inline std::string NormalizeArchivePath(std::string s) {
    while (s.rfind("./", 0) == 0) s.erase(0, 2);
    while (!s.empty() && s.front() == '/') s.erase(0, 1);

    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    return out;
}

} // namespace driverfetch
