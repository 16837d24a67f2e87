#include "app/driver_downloader.hpp"
#include "catalog/catalog_resolver.hpp"
#include "extract/extraction_pipeline.hpp"
#include "net/curl_http_client.hpp"
#include "select/selection.hpp"
#include "system/signals.hpp"
#include "transfer/progress_sinks.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

enum LongOnly : int {
    kOptList = 1000,
    kOptInfo,
    kOptSccm,
    kOptSccmPackages,
    kOptNoExtract,
    kOptExtractMode,
    kOptVerifySha256,
    kOptConfig,
};

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s <serial> [options]\n"
        "\n"
        "Download drivers for a device by its serial number.\n"
        "\n"
        "Options:\n"
        "  -o, --output DIR          Output directory (default drivers_<SERIAL>)\n"
        "  -c, --categories CAT...   Only these categories (repeatable, e.g. -c BIOS Audio)\n"
        "  -w, --workers N           Parallel downloads (default 4)\n"
        "      --list                List categories and file counts, download nothing\n"
        "      --info                Print the product information only\n"
        "      --sccm                Download SCCM deployment packages (interactive selection)\n"
        "      --sccm-packages N...  SCCM packages to download, 1-based (e.g. --sccm-packages 1 3)\n"
        "      --no-extract          Do not extract downloaded SCCM packages\n"
        "      --extract-mode MODE   auto or tools: 7-Zip and helpers (default)\n"
        "                            native: run the .exe itself (needs Wine/binfmt on Linux)\n"
        "      --verify-sha256       Check declared SHA-256 digests of downloads\n"
        "      --config FILE         JSON config file (default %s)\n"
        "  -v, --verbose             Debug logging\n"
        "  -q, --quiet               Warnings and errors only\n"
        "  -h, --help                Show this help\n"
        "\n"
        "Examples:\n"
        "   %s PF1234AB\n"
        "   %s PF1234AB -c BIOS Audio -w 8\n"
        "   %s PF1234AB --sccm --sccm-packages 1 3\n",
        argv, driverfetch::config::kDefaultConfigPath, argv, argv, argv);
}

bool ParsePositive(const char *text, std::size_t &out) {
    if (!text || *text == '\0' || *text == '-') return false;
    char *end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(text, &end, 10);
    if (errno != 0 || !end || *end != '\0' || v == 0) return false;
    out = static_cast<std::size_t>(v);
    return true;
}

// Values following a multi-value option up to the next option.
void CollectTrailingValues(int argc, char **argv, std::vector<std::string> &out) {
    while (optind < argc && argv[optind][0] != '-') {
        out.emplace_back(argv[optind++]);
    }
}

} // namespace

int main(int argc, char **argv) {
    using namespace driverfetch;

    InstallSignalHandlers();

    std::string output_dir;
    std::vector<std::string> categories;
    std::vector<std::string> package_args;
    std::string config_path = config::kDefaultConfigPath;
    bool config_explicit = false;
    std::size_t workers_cli = 0;
    bool list = false;
    bool info = false;
    bool sccm = false;
    bool no_extract = false;
    bool verify_cli = false;
    ExtractMode extract_mode = ExtractMode::Auto;
    int verbosity = 0;

    static option long_opts[] = {
        {"output", required_argument, nullptr, 'o'},
        {"categories", required_argument, nullptr, 'c'},
        {"workers", required_argument, nullptr, 'w'},
        {"list", no_argument, nullptr, kOptList},
        {"info", no_argument, nullptr, kOptInfo},
        {"sccm", no_argument, nullptr, kOptSccm},
        {"sccm-packages", required_argument, nullptr, kOptSccmPackages},
        {"no-extract", no_argument, nullptr, kOptNoExtract},
        {"extract-mode", required_argument, nullptr, kOptExtractMode},
        {"verify-sha256", no_argument, nullptr, kOptVerifySha256},
        {"config", required_argument, nullptr, kOptConfig},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "ho:c:w:vq", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'o':
                output_dir = optarg;
                break;

            case 'c':
                categories.emplace_back(optarg);
                CollectTrailingValues(argc, argv, categories);
                break;

            case 'w':
                if (!ParsePositive(optarg, workers_cli)) {
                    std::fprintf(stderr, "Invalid --workers: %s (must be >= 1)\n", optarg);
                    return 2;
                }
                break;

            case kOptList:
                list = true;
                break;

            case kOptInfo:
                info = true;
                break;

            case kOptSccm:
                sccm = true;
                break;

            case kOptSccmPackages:
                package_args.emplace_back(optarg);
                CollectTrailingValues(argc, argv, package_args);
                break;

            case kOptNoExtract:
                no_extract = true;
                break;

            case kOptExtractMode:
                if (!ParseExtractMode(optarg, extract_mode)) {
                    std::fprintf(stderr, "Invalid --extract-mode: %s (auto, native or tools)\n", optarg);
                    return 2;
                }
                break;

            case kOptVerifySha256:
                verify_cli = true;
                break;

            case kOptConfig:
                config_path = optarg;
                config_explicit = true;
                break;

            case 'v':
                verbosity = 1;
                break;

            case 'q':
                verbosity = -1;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (optind + 1 != argc) {
        PrintUsage(argv[0]);
        return 2;
    }
    const std::string serial = argv[optind];

    std::vector<std::size_t> package_numbers;
    for (const auto &p : package_args) {
        std::size_t n = 0;
        if (!ParsePositive(p.c_str(), n)) {
            std::fprintf(stderr, "Invalid --sccm-packages value: %s (must be >= 1)\n", p.c_str());
            return 2;
        }
        package_numbers.push_back(n);
    }

    config::DriverfetchConfigFromFile file_cfg;
    std::error_code ec;
    if (config_explicit || std::filesystem::exists(config_path, ec)) {
        auto r = file_cfg.LoadFile(config_path);
        if (!r.is_ok()) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return 2;
        }
    }

    LogLevel level = LogLevel::Info;
    if (file_cfg.log_level) (void)ParseLogLevel(*file_cfg.log_level, level);
    if (verbosity > 0) level = LogLevel::Debug;
    if (verbosity < 0) level = LogLevel::Warn;
    Logger::Instance().SetLevel(level);

    const ClientConfig client_cfg = file_cfg.ApplyTo(ClientConfig{});

    DriverDownloader::Options opt;
    opt.serial = serial;
    opt.categories = categories;
    opt.workers = workers_cli ? workers_cli
                              : (file_cfg.workers ? static_cast<std::size_t>(*file_cfg.workers) : 4);
    opt.verify_sha256 = verify_cli || file_cfg.verify_sha256.value_or(false);
    opt.extract = !no_extract;
    opt.extraction.environment = ResolveEnvironment(extract_mode);
    if (file_cfg.tool_timeout_seconds && *file_cfg.tool_timeout_seconds > 0) {
        const std::chrono::seconds t(static_cast<long long>(*file_cfg.tool_timeout_seconds));
        opt.extraction.native_timeout = t;
        opt.extraction.outer_timeout = t;
        opt.extraction.inner_timeout = t;
    }

    CurlGlobal curl_global;
    if (!curl_global.ok()) {
        std::fprintf(stderr, "ERROR: curl_global_init failed\n");
        return 1;
    }

    DriverDownloader::Collaborators deps;
    deps.http = std::make_shared<CurlHttpClient>(client_cfg);

    opt.output_dir = output_dir.empty() ? "drivers_" + CatalogResolver::NormalizeSerial(serial) : output_dir;
    DriverDownloader app(client_cfg, opt, deps, std::cout);

    TaskCountProgressSink task_progress;
    ByteProgressSink byte_progress;
    app.SetTaskProgressSink(&task_progress);
    app.SetByteProgressSink(&byte_progress);

    Result res;
    if (info) {
        res = app.ShowInfo();
    } else if (list) {
        res = app.ListCategories();
    } else if (sccm) {
        DeploymentReport report;
        if (package_numbers.empty()) {
            InteractiveSelectionProvider selector(std::cin, std::cout);
            res = app.DownloadDeploymentPackages(selector, report);
        } else {
            FixedSelectionProvider selector(package_numbers);
            res = app.DownloadDeploymentPackages(selector, report);
        }
    } else {
        TransferSummary summary;
        res = app.DownloadAll(summary);
    }

    if (!res.is_ok()) {
        ClearProgressLine();
        if (res.err == kErrCancelled) {
            std::fprintf(stderr, "\nInterrupted by user\n");
            return 1;
        }
        std::fprintf(stderr, "ERROR: %s\n", res.msg.c_str());
        return res.err == kErrInvalidConfig ? 2 : 1;
    }

    return 0;
}
