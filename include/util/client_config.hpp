#pragma once

#include <string>
#include <vector>

namespace driverfetch {

inline constexpr const char kDefaultUserAgent[] =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
    "(KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36";

struct HttpHeader {
    std::string name;
    std::string value;
};

// Immutable per-run client settings handed to the resolver and the HTTP
// client. Built once in main; never modified afterwards.
struct ClientConfig {
    std::string api_base_url = "https://pcsupport.lenovo.com/us/en/api";
    std::string site_base_url = "https://pcsupport.lenovo.com/us/en";
    std::vector<HttpHeader> headers = BrowserHeaders(kDefaultUserAgent);

    long request_timeout_seconds = 30;
    long connect_timeout_seconds = 60;
    // A download stalled below 1 byte/s for this long is aborted.
    long stall_timeout_seconds = 60;
    long receive_buffer_bytes = 8192;

    static std::vector<HttpHeader> BrowserHeaders(const std::string& user_agent) {
        return {
            {"User-Agent", user_agent},
            {"Accept", "application/json, text/plain, */*"},
            {"Accept-Language", "en-US,en;q=0.9"},
            {"Referer", "https://pcsupport.lenovo.com/"},
            {"Origin", "https://pcsupport.lenovo.com"},
        };
    }
};

} // namespace driverfetch
