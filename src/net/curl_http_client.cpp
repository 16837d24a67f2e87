#include "net/curl_http_client.hpp"

#include "system/signals.hpp"
#include "util/logger.hpp"

#include <curl/curl.h>

#include <memory>
#include <span>

namespace driverfetch {

namespace {

struct CurlEasyDeleter {
    void operator()(CURL* c) const {
        if (c) curl_easy_cleanup(c);
    }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* l) const {
        if (l) curl_slist_free_all(l);
    }
};

using CurlEasy = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlHeaders = std::unique_ptr<curl_slist, CurlSlistDeleter>;

struct DownloadContext {
    CURL* curl = nullptr;
    IWriter* sink = nullptr;
    const DownloadCallbacks* callbacks = nullptr;
    Result write_result = Result::Ok();
    long rejected_status = 0;
    bool callback_abort = false;
};

size_t StringWriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

size_t SinkWriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<DownloadContext*>(userdata);
    const size_t total = size * nmemb;

    long status = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
    if (!IsSuccessStatus(status)) {
        ctx->rejected_status = status;
        return 0;
    }

    auto r = ctx->sink->WriteAll(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(ptr), total));
    if (!r.is_ok()) {
        ctx->write_result = r;
        return 0;
    }
    return total;
}

int CancelOnlyXferInfo(void*, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    return CancelRequested() ? 1 : 0;
}

int DownloadXferInfo(void* userdata, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<DownloadContext*>(userdata);
    if (CancelRequested()) return 1;
    if (ctx->callbacks && ctx->callbacks->on_progress) {
        const auto total = dltotal > 0 ? static_cast<std::uint64_t>(dltotal) : 0ULL;
        const auto now = dlnow > 0 ? static_cast<std::uint64_t>(dlnow) : 0ULL;
        if (!ctx->callbacks->on_progress(now, total)) {
            ctx->callback_abort = true;
            return 1;
        }
    }
    return 0;
}

Result ApplyCommonOptions(CURL* c,
                          const ClientConfig& cfg,
                          const std::string& url,
                          curl_slist* headers,
                          char* errbuf) {
    if (curl_easy_setopt(c, CURLOPT_URL, url.c_str()) != CURLE_OK) {
        return Result::Fail(kErrGeneric, "invalid URL: " + url);
    }
    curl_easy_setopt(c, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(c, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT, cfg.connect_timeout_seconds);
    curl_easy_setopt(c, CURLOPT_ERRORBUFFER, errbuf);
    return Result::Ok();
}

Result HeadersFromConfig(const ClientConfig& cfg, CurlHeaders& out) {
    curl_slist* list = nullptr;
    for (const auto& h : cfg.headers) {
        const std::string line = h.name + ": " + h.value;
        curl_slist* next = curl_slist_append(list, line.c_str());
        if (!next) {
            if (list) curl_slist_free_all(list);
            return Result::Fail(kErrGeneric, "curl_slist_append failed");
        }
        list = next;
    }
    out.reset(list);
    return Result::Ok();
}

std::string CurlError(CURLcode code, const char* errbuf) {
    if (errbuf && errbuf[0] != '\0') return errbuf;
    return curl_easy_strerror(code);
}

} // namespace

CurlGlobal::CurlGlobal() : ok_(curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK) {}

CurlGlobal::~CurlGlobal() {
    if (ok_) curl_global_cleanup();
}

CurlHttpClient::CurlHttpClient(ClientConfig cfg) : cfg_(std::move(cfg)) {}

Result CurlHttpClient::Get(const std::string& url, HttpResponse& out) const {
    out = HttpResponse{};

    CurlEasy curl(curl_easy_init());
    if (!curl) return Result::Fail(kErrGeneric, "curl_easy_init failed");

    CurlHeaders headers;
    auto hr = HeadersFromConfig(cfg_, headers);
    if (!hr.is_ok()) return hr;

    char errbuf[CURL_ERROR_SIZE] = {};
    auto sr = ApplyCommonOptions(curl.get(), cfg_, url, headers.get(), errbuf);
    if (!sr.is_ok()) return sr;

    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, cfg_.request_timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, StringWriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &out.body);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, CancelOnlyXferInfo);

    LogDebug("GET %s", url.c_str());
    const CURLcode rc = curl_easy_perform(curl.get());
    if (rc == CURLE_ABORTED_BY_CALLBACK) {
        return Result::Fail(kErrCancelled, "interrupted");
    }
    if (rc != CURLE_OK) {
        return Result::Fail(kErrGeneric, "GET " + url + ": " + CurlError(rc, errbuf));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &out.status);
    LogDebug("GET %s -> %ld (%zu bytes)", url.c_str(), out.status, out.body.size());
    return Result::Ok();
}

Result CurlHttpClient::Download(const std::string& url,
                                IWriter& sink,
                                const DownloadCallbacks& callbacks) const {
    CurlEasy curl(curl_easy_init());
    if (!curl) return Result::Fail(kErrTransferFailed, "curl_easy_init failed");

    CurlHeaders headers;
    auto hr = HeadersFromConfig(cfg_, headers);
    if (!hr.is_ok()) return hr;

    char errbuf[CURL_ERROR_SIZE] = {};
    auto sr = ApplyCommonOptions(curl.get(), cfg_, url, headers.get(), errbuf);
    if (!sr.is_ok()) return Result::Fail(kErrTransferFailed, sr.msg);

    DownloadContext ctx;
    ctx.curl = curl.get();
    ctx.sink = &sink;
    ctx.callbacks = &callbacks;

    curl_easy_setopt(curl.get(), CURLOPT_BUFFERSIZE, cfg_.receive_buffer_bytes);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, cfg_.stall_timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, SinkWriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, DownloadXferInfo);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);

    const CURLcode rc = curl_easy_perform(curl.get());

    if (!ctx.write_result.is_ok()) {
        return Result::Fail(kErrTransferFailed, ctx.write_result.msg);
    }
    if (ctx.rejected_status != 0) {
        return Result::Fail(kErrTransferFailed, "HTTP " + std::to_string(ctx.rejected_status));
    }
    if (rc == CURLE_ABORTED_BY_CALLBACK) {
        if (ctx.callback_abort) return Result::Fail(kErrTransferFailed, "aborted");
        return Result::Fail(kErrCancelled, "interrupted");
    }
    if (rc != CURLE_OK) {
        return Result::Fail(kErrTransferFailed, CurlError(rc, errbuf));
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (!IsSuccessStatus(status)) {
        // Empty non-2xx bodies never reach the write callback.
        return Result::Fail(kErrTransferFailed, "HTTP " + std::to_string(status));
    }

    return Result::Ok();
}

} // namespace driverfetch
