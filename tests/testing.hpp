#pragma once

#include "net/http_client.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace testutil {

class TemporaryDirectory {
  public:
    TemporaryDirectory() {
        char tpl[] = "/tmp/driverfetch_tests_XXXXXX";
        char* p = ::mkdtemp(tpl);
        if (!p) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::string& Path() const { return path_; }
    std::string Join(const std::string& rel) const { return (std::filesystem::path(path_) / rel).string(); }

  private:
    std::string path_;
};

inline void WriteFile(const std::string& path, const std::string& contents) {
    std::filesystem::create_directories(std::filesystem::path(path).parent_path());
    std::ofstream os(path, std::ios::binary | std::ios::trunc);
    os << contents;
}

inline std::string ReadFile(const std::string& path) {
    std::ifstream is(path, std::ios::binary);
    std::stringstream ss;
    ss << is.rdbuf();
    return ss.str();
}

inline bool Exists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

// Regular files below `dir`, relative paths, sorted.
inline std::vector<std::string> ListFiles(const std::string& dir) {
    std::vector<std::string> out;
    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) return out;
    for (const auto& e : std::filesystem::recursive_directory_iterator(dir)) {
        if (e.is_regular_file()) {
            out.push_back(std::filesystem::relative(e.path(), dir).string());
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

// Scripted HTTP responses keyed by exact URL. Unknown URLs answer 404.
class FakeHttpClient final : public driverfetch::IHttpClient {
  public:
    struct Reply {
        long status = 200;
        std::string body;
        bool transport_error = false;
        // Download(): bytes delivered before a simulated connection drop.
        std::size_t fail_after = std::string::npos;
    };

    void Set(const std::string& url, Reply reply) {
        std::lock_guard<std::mutex> lock(mu_);
        replies_[url] = std::move(reply);
    }

    void SetJson(const std::string& url, const std::string& body) { Set(url, Reply{.status = 200, .body = body}); }

    int Calls(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = calls_.find(url);
        return it == calls_.end() ? 0 : it->second;
    }

    int TotalCalls() const {
        std::lock_guard<std::mutex> lock(mu_);
        int n = 0;
        for (const auto& [url, c] : calls_) n += c;
        return n;
    }

    driverfetch::Result Get(const std::string& url, driverfetch::HttpResponse& out) const override {
        const Reply r = Lookup(url);
        out = driverfetch::HttpResponse{};
        if (r.transport_error) return driverfetch::Result::Fail(driverfetch::kErrGeneric, "connection refused");
        out.status = r.status;
        out.body = r.body;
        return driverfetch::Result::Ok();
    }

    driverfetch::Result Download(const std::string& url,
                                 driverfetch::IWriter& sink,
                                 const driverfetch::DownloadCallbacks& callbacks) const override {
        const Reply r = Lookup(url);
        if (r.transport_error) {
            return driverfetch::Result::Fail(driverfetch::kErrTransferFailed, "connection refused");
        }
        if (!driverfetch::IsSuccessStatus(r.status)) {
            return driverfetch::Result::Fail(driverfetch::kErrTransferFailed, "HTTP " + std::to_string(r.status));
        }

        const std::size_t limit = std::min(r.fail_after, r.body.size());
        const std::size_t chunk = 8192;
        std::size_t done = 0;
        while (done < limit) {
            const std::size_t n = std::min(chunk, limit - done);
            auto w = sink.WriteAll(std::span<const std::uint8_t>(
                reinterpret_cast<const std::uint8_t*>(r.body.data() + done), n));
            if (!w.is_ok()) return driverfetch::Result::Fail(driverfetch::kErrTransferFailed, w.msg);
            done += n;
            if (callbacks.on_progress && !callbacks.on_progress(done, r.body.size())) {
                return driverfetch::Result::Fail(driverfetch::kErrTransferFailed, "aborted");
            }
        }
        if (r.fail_after != std::string::npos) {
            return driverfetch::Result::Fail(driverfetch::kErrTransferFailed, "connection reset");
        }
        return driverfetch::Result::Ok();
    }

  private:
    Reply Lookup(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mu_);
        ++calls_[url];
        auto it = replies_.find(url);
        if (it == replies_.end()) return Reply{.status = 404, .body = "not found"};
        return it->second;
    }

    mutable std::mutex mu_;
    std::map<std::string, Reply> replies_;
    mutable std::map<std::string, int> calls_;
};

struct TarEntry {
    std::string path;
    std::string contents;
    mode_t file_type = AE_IFREG;
};

inline std::vector<std::uint8_t> BuildTar(const std::vector<TarEntry>& entries) {
    std::vector<std::uint8_t> out(1024 * 1024);
    size_t used = 0;

    archive* a = archive_write_new();
    if (!a)
        throw std::runtime_error("archive_write_new failed");
    if (archive_write_set_format_pax_restricted(a) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_set_format_pax_restricted failed");
    }
    if (archive_write_open_memory(a, out.data(), out.size(), &used) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_open_memory failed");
    }

    for (const auto& entry : entries) {
        archive_entry* hdr = archive_entry_new();
        if (!hdr) {
            (void)archive_write_free(a);
            throw std::runtime_error("archive_entry_new failed");
        }
        archive_entry_set_pathname(hdr, entry.path.c_str());
        archive_entry_set_filetype(hdr, entry.file_type);
        archive_entry_set_perm(hdr, entry.file_type == AE_IFDIR ? 0755 : 0644);
        archive_entry_set_size(hdr, static_cast<la_int64_t>(entry.contents.size()));
        if (archive_write_header(a, hdr) != ARCHIVE_OK) {
            archive_entry_free(hdr);
            (void)archive_write_free(a);
            throw std::runtime_error("archive_write_header failed");
        }
        if (!entry.contents.empty()) {
            if (archive_write_data(a, entry.contents.data(), entry.contents.size()) < 0) {
                archive_entry_free(hdr);
                (void)archive_write_free(a);
                throw std::runtime_error("archive_write_data failed");
            }
        }
        archive_entry_free(hdr);
    }

    if (archive_write_close(a) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_close failed");
    }
    if (archive_write_free(a) != ARCHIVE_OK) {
        throw std::runtime_error("archive_write_free failed");
    }
    out.resize(used);
    return out;
}

inline void WriteTarFile(const std::string& path, const std::vector<TarEntry>& entries) {
    const auto bytes = BuildTar(entries);
    WriteFile(path, std::string(bytes.begin(), bytes.end()));
}

} // namespace testutil
