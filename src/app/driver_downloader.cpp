#include "app/driver_downloader.hpp"

#include "catalog/run_manifest.hpp"
#include "system/signals.hpp"
#include "transfer/transfer_engine.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <ctime>
#include <filesystem>
#include <ostream>

namespace fs = std::filesystem;

namespace driverfetch {

namespace {

constexpr const char* kDeploymentDirName = "SCCM";

std::string AbsoluteString(const std::string& p) {
    std::error_code ec;
    auto abs = fs::absolute(p, ec);
    return ec ? p : abs.string();
}

std::string JoinNames(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& n : names) {
        if (!out.empty()) out += ", ";
        out += n;
    }
    return out;
}

} // namespace

DriverDownloader::DriverDownloader(ClientConfig cfg, Options opt, Collaborators deps, std::ostream& out)
    : opt_(std::move(opt)), deps_(std::move(deps)), resolver_(std::move(cfg), deps_.http), out_(out),
      serial_(CatalogResolver::NormalizeSerial(opt_.serial)) {}

Result DriverDownloader::ResolveProduct() {
    if (resolved_) return Result::Ok();
    auto r = resolver_.Resolve(serial_, product_);
    if (!r.is_ok()) return r;
    resolved_ = true;
    return Result::Ok();
}

Result DriverDownloader::FetchDrivers(std::vector<DriverRecord>& drivers) {
    auto r = ResolveProduct();
    if (!r.is_ok()) return r;

    DriverListing listing;
    r = resolver_.ListDrivers(product_, listing);
    if (!r.is_ok()) return r;

    catalog_status_ = Result::Ok();
    if (listing.degraded) {
        const std::string detail = listing.drivers.empty()
                                       ? "no driver list could be fetched"
                                       : "driver list came from the fallback catalog (" + listing.source + ")";
        catalog_status_ = Result::Fail(kErrCatalogFetchDegraded, detail);
        out_ << "Note: " << detail << "; results may be incomplete\n";
    } else {
        LogDebug("Driver list source: %s", listing.source.c_str());
    }

    drivers = std::move(listing.drivers);
    return Result::Ok();
}

Result DriverDownloader::PrepareOutput(const std::string& dir,
                                       const std::vector<DriverRecord>& manifest_drivers) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Result::Fail(ec.value(), "cannot create " + dir + ": " + ec.message());
    }

    const auto manifest = BuildRunManifest(serial_, product_, manifest_drivers, std::time(nullptr));
    return WriteRunManifest(opt_.output_dir, manifest);
}

void DriverDownloader::PrintSummary(const TransferSummary& s) {
    out_ << "\nDownload complete!\n"
         << "  Downloaded: " << s.completed << "\n"
         << "  Skipped (existing): " << s.skipped << "\n"
         << "  Failed: " << s.failed << "\n"
         << "  Location: " << AbsoluteString(s.dest_root) << "\n";
    out_.flush();
}

Result DriverDownloader::ShowInfo() {
    auto r = ResolveProduct();
    if (!r.is_ok()) return r;

    out_ << "\nProduct Information:\n" << product_.raw.dump(2) << "\n";
    out_.flush();
    return Result::Ok();
}

Result DriverDownloader::ListCategories(std::map<std::string, std::size_t>* files_per_category) {
    std::vector<DriverRecord> drivers;
    auto r = FetchDrivers(drivers);
    if (!r.is_ok()) return r;

    std::map<std::string, std::size_t> counts;
    for (const auto& d : drivers) counts[d.category] += d.files.size();

    out_ << "\nAvailable categories:\n";
    for (const auto& [cat, n] : counts) {
        out_ << "  - " << cat << ": " << n << " files\n";
    }
    out_.flush();

    if (files_per_category) *files_per_category = std::move(counts);
    return Result::Ok();
}

Result DriverDownloader::DownloadAll(TransferSummary& summary) {
    summary = TransferSummary{};
    summary.dest_root = opt_.output_dir;

    std::vector<DriverRecord> all;
    auto r = FetchDrivers(all);
    if (!r.is_ok()) return r;

    if (all.empty()) {
        out_ << "No drivers found to download\n";
        return Result::Ok();
    }

    auto drivers = FilterByCategories(all, opt_.categories);
    if (!opt_.categories.empty()) {
        out_ << "Filtered to " << drivers.size() << " drivers in categories: "
             << JoinNames(opt_.categories) << "\n";
    }

    out_ << "\nSaving drivers to: " << AbsoluteString(opt_.output_dir) << "\n";
    r = PrepareOutput(opt_.output_dir, all);
    if (!r.is_ok()) return r;

    std::vector<DownloadTask> tasks;
    for (const auto& d : drivers) {
        const std::string dir = (fs::path(opt_.output_dir) / SanitizeCategory(d.category)).string();
        for (const auto& f : d.files) {
            tasks.push_back(DownloadTask{.entry = f, .dest_dir = dir, .owner_title = d.title});
        }
    }

    out_ << "\nStarting download of " << tasks.size() << " files...\n";
    out_.flush();

    TransferEngine engine(deps_.http);
    TransferEngine::Options topt;
    topt.concurrency = opt_.workers;
    topt.verify_digest = opt_.verify_sha256;
    topt.progress_sink = task_sink_;

    std::vector<TransferOutcome> outcomes;
    auto run = engine.Run(tasks, topt, outcomes);
    if (!run.is_ok() && run.err == kErrInvalidConfig) return run;

    summary = TransferEngine::Summarize(outcomes, opt_.output_dir);
    PrintSummary(summary);
    return run;
}

Result DriverDownloader::DownloadDeploymentPackages(ISelectionProvider& selector, DeploymentReport& report) {
    report = DeploymentReport{};

    std::vector<DriverRecord> all;
    auto r = FetchDrivers(all);
    if (!r.is_ok()) return r;

    const auto packages = FilterDeploymentPackages(all);
    if (packages.empty()) {
        out_ << "No SCCM packages found for this device\n"
             << "  SCCM packages are typically available for ThinkPad/ThinkCentre business models\n";
        return Result::Ok();
    }

    out_ << "\nFound " << packages.size() << " SCCM package(s):\n";
    PrintPackageList(out_, packages);

    Selection selection;
    r = selector.Select(packages, selection);
    if (!r.is_ok()) return r;

    if (selection.cancelled) {
        out_ << "Download cancelled\n";
        report.cancelled = true;
        if (CancelRequested()) return Result::Fail(kErrCancelled, "interrupted");
        return Result::Ok();
    }
    if (selection.indices.empty()) {
        out_ << "No packages selected\n";
        return Result::Ok();
    }
    report.selected = selection.indices;

    out_ << "\nSelected " << selection.indices.size() << " package(s) to download:\n";
    for (std::size_t idx : selection.indices) out_ << "  - " << packages[idx].title << "\n";

    const std::string deploy_dir = (fs::path(opt_.output_dir) / kDeploymentDirName).string();
    r = PrepareOutput(deploy_dir, all);
    if (!r.is_ok()) return r;
    out_ << "\nSaving to: " << AbsoluteString(deploy_dir) << "\n";
    out_.flush();

    TransferEngine engine(deps_.http);
    TransferEngine::Options topt;
    topt.verify_digest = opt_.verify_sha256;
    topt.progress_sink = byte_sink_;

    std::vector<TransferOutcome> outcomes;
    std::vector<std::string> downloaded;
    bool interrupted = false;
    std::size_t task_index = 0;

    for (std::size_t idx : selection.indices) {
        for (const auto& f : packages[idx].files) {
            if (CancelRequested()) {
                interrupted = true;
                break;
            }
            DownloadTask task{.entry = f, .dest_dir = deploy_dir, .owner_title = packages[idx].title};
            auto outcome = engine.DownloadOne(task, task_index++, topt);
            if (outcome.status == TransferStatus::Skipped) {
                LogInfo("%s already exists, skipping download", FilenameFromUrl(f.url).c_str());
            }
            if (outcome.status != TransferStatus::Failed) downloaded.push_back(outcome.path);
            outcomes.push_back(std::move(outcome));
        }
        if (interrupted) break;
    }
    report.transfers = TransferEngine::Summarize(outcomes, deploy_dir);

    if (interrupted || CancelRequested()) {
        PrintSummary(report.transfers);
        return Result::Fail(kErrCancelled, "interrupted");
    }

    if (opt_.extract && !downloaded.empty()) {
        out_ << "\nExtracting SCCM packages...\n";
        out_.flush();

        ExtractionPipeline pipeline(opt_.extraction, deps_.runner, deps_.locator);
        for (const auto& path : downloaded) {
            if (!EndsWithIgnoreCase(path, ".exe")) continue;
            const std::string target = (fs::path(path).parent_path() / fs::path(path).stem()).string();

            auto er = pipeline.Extract(path, target);
            if (!er.is_ok()) {
                if (er.err == kErrCancelled) {
                    PrintSummary(report.transfers);
                    return er;
                }
                LogError("Extraction of %s failed: %s", path.c_str(), er.msg.c_str());
                ++report.extraction_failures;
                continue;
            }
            report.extracted_dirs.push_back(target);
        }
    }

    out_ << "\nSCCM package download complete!\n"
         << "  Downloaded: " << report.transfers.completed
         << ", skipped (existing): " << report.transfers.skipped
         << ", failed: " << report.transfers.failed << "\n"
         << "  Location: " << AbsoluteString(deploy_dir) << "\n";

    if (opt_.extract) {
        out_ << "\nExtracted driver folders:\n";
        for (const auto& dir : report.extracted_dirs) {
            out_ << "  - " << fs::path(dir).filename().string() << "/  ("
                 << ExtractionPipeline::CountDriverDescriptions(dir) << " .inf driver files)\n";
        }
    }

    out_ << "\nUsage for OOBE/Deployment:\n"
         << "  - USB Install: pnputil /add-driver <path>\\*.inf /subdirs\n"
         << "  - DISM Inject: DISM /Image:C:\\Mount /Add-Driver /Driver:<path> /Recurse\n";
    out_.flush();
    return Result::Ok();
}

} // namespace driverfetch
