#include "extract/extraction_pipeline.hpp"

#include "extract/archive_extractor.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace driverfetch {

namespace {

constexpr const char* kPayloadName = "[0]";
constexpr const char* kArtifacts[] = {"[0]", "[1]", "[2]", "CERTIFICATE"};

// Removes everything below dir, keeping dir itself.
void ClearDirectory(const std::string& dir) {
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code rm_ec;
        fs::remove_all(it->path(), rm_ec);
        if (rm_ec) LogWarn("cannot remove %s: %s", it->path().c_str(), rm_ec.message().c_str());
    }
}

} // namespace

bool ParseExtractMode(const std::string& text, ExtractMode& out) {
    const std::string s = ToLower(Trim(text));
    if (s == "auto") {
        out = ExtractMode::Auto;
    } else if (s == "native") {
        out = ExtractMode::Native;
    } else if (s == "tools") {
        out = ExtractMode::Tools;
    } else {
        return false;
    }
    return true;
}

HostEnvironment ResolveEnvironment(ExtractMode mode) {
    switch (mode) {
    case ExtractMode::Native:
        return HostEnvironment::Native;
    case ExtractMode::Tools:
        return HostEnvironment::Tools;
    case ExtractMode::Auto:
        break;
    }
    return HostEnvironment::Tools;
}

ExtractionPipeline::ExtractionPipeline(Options opt,
                                       std::shared_ptr<const IProcessRunner> runner,
                                       std::shared_ptr<const IToolLocator> locator)
    : opt_(opt), runner_(runner ? std::move(runner) : PosixProcessRunner::Default()),
      locator_(locator ? std::move(locator) : std::make_shared<PathToolLocator>()) {}

std::size_t ExtractionPipeline::CountDriverDescriptions(const std::string& dir) {
    std::size_t count = 0;
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) return 0;
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) break;
        if (it->is_regular_file(ec) && EndsWithIgnoreCase(it->path().filename().string(), ".inf")) {
            ++count;
        }
    }
    return count;
}

bool ExtractionPipeline::IsPopulatedDirectory(const std::string& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return false;
    fs::directory_iterator it(dir, ec);
    return !ec && it != fs::directory_iterator();
}

void ExtractionPipeline::RemoveArtifacts(const std::string& dir) {
    for (const char* name : kArtifacts) {
        std::error_code ec;
        fs::remove(fs::path(dir) / name, ec);
        if (ec) LogDebug("cannot remove %s/%s: %s", dir.c_str(), name, ec.message().c_str());
    }
}

Result ExtractionPipeline::RunTool(const std::vector<std::string>& argv, std::chrono::seconds timeout) const {
    int exit_code = -1;
    auto r = runner_->Run(argv, timeout, exit_code);
    if (!r.is_ok()) return r;
    if (exit_code != 0) {
        return Result::Fail(kErrExtractionFailed,
                            fs::path(argv[0]).filename().string() + " exited with status " +
                                std::to_string(exit_code));
    }
    return Result::Ok();
}

Result ExtractionPipeline::Extract(const std::string& archive, const std::string& target) const {
    const std::string name = fs::path(target).filename().string();
    if (IsPopulatedDirectory(target)) {
        LogInfo("%s/ already extracted, skipping", name.c_str());
        return Result::Ok();
    }

    std::error_code ec;
    const bool created = !fs::exists(target, ec);
    fs::create_directories(target, ec);
    if (ec) {
        return Result::Fail(kErrExtractionFailed, "cannot create " + target + ": " + ec.message());
    }

    LogInfo("Extracting %s...", fs::path(archive).filename().c_str());
    auto r = (opt_.environment == HostEnvironment::Native) ? ExtractNative(archive, target)
                                                          : ExtractWithTools(archive, target);
    // A populated target returned above, so this one was absent or empty.
    if (!r.is_ok()) {
        if (created) {
            fs::remove_all(target, ec);
        } else {
            ClearDirectory(target);
        }
    }
    return r;
}

Result ExtractionPipeline::ExtractNative(const std::string& archive, const std::string& target) const {
    const std::vector<std::vector<std::string>> attempts = {
        {archive, "/VERYSILENT", "/DIR=" + target},
        {archive, "/extract:" + target},
    };

    Result last = Result::Ok();
    for (const auto& argv : attempts) {
        last = RunTool(argv, opt_.native_timeout);
        if (last.err == kErrCancelled) return last;

        // Some self-extractors report failure after unpacking everything, so
        // a populated target also counts. This can accept a partial unpack.
        if (last.is_ok() || IsPopulatedDirectory(target)) {
            LogInfo("Extracted to %s/", fs::path(target).filename().c_str());
            return Result::Ok();
        }
        LogDebug("self-extractor attempt failed: %s", last.msg.c_str());
    }

    LogWarn("Self-extraction failed: %s", last.msg.c_str());
    return Result::Fail(kErrExtractionFailed, "self-extraction failed for " + archive + ": " + last.msg);
}

Result ExtractionPipeline::ExtractWithTools(const std::string& archive, const std::string& target) const {
    const Toolset tools = DiscoverToolset(*locator_);
    if (tools.seven_zip.empty()) {
        LogError("7-Zip not found. Install it: apt install 7zip (or p7zip-full), brew install sevenzip");
        return Result::Fail(kErrExtractionFailed, "7-Zip (7z, 7zz or 7za) not found on PATH");
    }

    LogInfo("Extracting outer layer...");
    auto r = RunTool({tools.seven_zip, "x", "-y", "-o" + target, archive}, opt_.outer_timeout);
    if (!r.is_ok()) {
        if (r.err == kErrCancelled) return r;
        LogWarn("Outer extraction failed: %s", r.msg.c_str());
        return Result::Fail(kErrExtractionFailed, "outer extraction failed: " + r.msg);
    }

    const std::string payload = (fs::path(target) / kPayloadName).string();
    const std::size_t infs = CountDriverDescriptions(target);
    std::error_code ec;
    if (infs > 0 || !fs::exists(payload, ec)) {
        LogInfo("Extracted %zu driver files to %s/", infs, fs::path(target).filename().c_str());
        return Result::Ok();
    }

    LogInfo("Extracting inner payload...");
    r = ExtractInnerPayload(tools, payload, target);
    if (!r.is_ok()) {
        if (r.err == kErrCancelled) return r;
        LogWarn("Could not extract inner payload automatically. The package may need Windows to extract properly.");
        LogWarn("  Option 1: run on Windows: %s /VERYSILENT /DIR=C:\\Drivers",
                fs::path(archive).filename().c_str());
        LogWarn("  Option 2: install more tools: cabextract, innoextract");
        return r;
    }

    RemoveArtifacts(target);
    LogInfo("Extracted drivers to %s/", fs::path(target).filename().c_str());
    return Result::Ok();
}

Result ExtractionPipeline::ExtractInnerPayload(const Toolset& tools,
                                               const std::string& payload,
                                               const std::string& target) const {
    std::vector<std::vector<std::string>> attempts;
    if (!tools.cabextract.empty()) attempts.push_back({tools.cabextract, "-d", target, payload});
    if (!tools.innoextract.empty()) attempts.push_back({tools.innoextract, "-d", target, payload});
    attempts.push_back({tools.seven_zip, "x", "-y", "-o" + target, "-t*", payload});

    for (const auto& argv : attempts) {
        auto r = RunTool(argv, opt_.inner_timeout);
        if (r.is_ok()) return r;
        if (r.err == kErrCancelled) return r;
        LogDebug("inner payload: %s", r.msg.c_str());
    }

    if (opt_.in_process_fallback) {
        ArchiveExtractor extractor;
        auto r = extractor.ExtractFileToDir(payload, target);
        if (r.is_ok()) return r;
        if (r.err == kErrCancelled) return r;
        LogDebug("inner payload (libarchive): %s", r.msg.c_str());
    }

    return Result::Fail(kErrExtractionFailed, "no extractor could unpack " + payload);
}

} // namespace driverfetch
