#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace driverfetch {

struct HttpResponse {
    long status = 0;
    std::string body;
};

struct DownloadCallbacks {
    // (bytes received, declared total or 0). Returning false aborts the transfer.
    std::function<bool(std::uint64_t, std::uint64_t)> on_progress;
};

inline bool IsSuccessStatus(long status) { return status >= 200 && status < 300; }

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // Buffered GET. Only transport errors fail; the status is reported as-is.
    virtual Result Get(const std::string& url, HttpResponse& out) const = 0;

    // Streams the response body into sink. Non-2xx statuses and transport
    // errors fail; nothing from a non-2xx body reaches the sink.
    virtual Result Download(const std::string& url,
                            IWriter& sink,
                            const DownloadCallbacks& callbacks) const = 0;
};

} // namespace driverfetch
