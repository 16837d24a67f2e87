#pragma once

#include "net/http_client.hpp"
#include "util/client_config.hpp"

namespace driverfetch {

// curl_global_init/cleanup for the lifetime of main().
class CurlGlobal {
public:
    CurlGlobal();
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
    ~CurlGlobal();

    bool ok() const { return ok_; }

private:
    bool ok_ = false;
};

// One easy handle per call, so a single instance is safe to share between
// transfer workers.
class CurlHttpClient final : public IHttpClient {
public:
    explicit CurlHttpClient(ClientConfig cfg);

    Result Get(const std::string& url, HttpResponse& out) const override;
    Result Download(const std::string& url,
                    IWriter& sink,
                    const DownloadCallbacks& callbacks) const override;

private:
    const ClientConfig cfg_;
};

} // namespace driverfetch
