#pragma once

#include "catalog/catalog_resolver.hpp"
#include "catalog/model.hpp"
#include "extract/extraction_pipeline.hpp"
#include "net/http_client.hpp"
#include "select/selection.hpp"
#include "transfer/download_task.hpp"
#include "transfer/progress.hpp"
#include "util/client_config.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <iosfwd>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace driverfetch {

struct DeploymentReport {
    bool cancelled = false;
    std::vector<std::size_t> selected;  // zero-based package indices
    TransferSummary transfers;
    std::vector<std::string> extracted_dirs;
    std::size_t extraction_failures = 0;
};

// The four user-facing workflows. Listings go to the output stream,
// diagnostics to the logger.
class DriverDownloader {
public:
    struct Options {
        std::string serial;
        std::string output_dir;
        std::vector<std::string> categories;
        std::size_t workers = 4;
        bool verify_sha256 = false;
        bool extract = true;
        ExtractionPipeline::Options extraction{};
    };

    struct Collaborators {
        std::shared_ptr<const IHttpClient> http;
        std::shared_ptr<const IProcessRunner> runner;    // null => fork/exec
        std::shared_ptr<const IToolLocator> locator;     // null => $PATH
    };

    DriverDownloader(ClientConfig cfg, Options opt, Collaborators deps, std::ostream& out);

    void SetTaskProgressSink(IProgress* sink) { task_sink_ = sink; }
    void SetByteProgressSink(IProgress* sink) { byte_sink_ = sink; }

    Result ShowInfo();
    Result ListCategories(std::map<std::string, std::size_t>* files_per_category = nullptr);
    Result DownloadAll(TransferSummary& summary);
    Result DownloadDeploymentPackages(ISelectionProvider& selector, DeploymentReport& report);

    const std::string& Serial() const { return serial_; }

    // kErrCatalogFetchDegraded after a listing that fell back or came back
    // empty; Ok otherwise.
    const Result& CatalogStatus() const { return catalog_status_; }

private:
    Result ResolveProduct();
    Result FetchDrivers(std::vector<DriverRecord>& drivers);
    Result PrepareOutput(const std::string& dir, const std::vector<DriverRecord>& manifest_drivers);
    void PrintSummary(const TransferSummary& s);

    Options opt_;
    Collaborators deps_;
    CatalogResolver resolver_;
    std::ostream& out_;
    std::string serial_;

    bool resolved_ = false;
    ProductDescriptor product_;
    Result catalog_status_;

    IProgress* task_sink_ = nullptr;
    IProgress* byte_sink_ = nullptr;
};

} // namespace driverfetch
