#include <gtest/gtest.h>

#include "app/driver_downloader.hpp"
#include "catalog/run_manifest.hpp"
#include "system/signals.hpp"
#include "testing.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace driverfetch {
namespace {

using Argv = std::vector<std::string>;

constexpr const char* kLookup = "https://api.test/api/v4/mse/getproducts?productId=PF1234AB";
constexpr const char* kDrivers = "https://api.test/api/v4/downloads/drivers?productId=LAPTOPS/T14/PF1234AB";

// Stands in for 7z: "x -y -o<dir> <archive>" drops one .inf into <dir>.
class SevenZipStub final : public IProcessRunner {
  public:
    Result Run(const Argv& argv, std::chrono::seconds, int& exit_code) const override {
        calls.push_back(argv);
        for (const auto& a : argv) {
            if (a.rfind("-o", 0) == 0) testutil::WriteFile(a.substr(2) + "/Audio/audio.inf", "[Version]");
        }
        exit_code = 0;
        return Result::Ok();
    }

    mutable std::vector<Argv> calls;
};

class OnlySevenZip final : public IToolLocator {
  public:
    std::optional<std::string> Find(const std::string& name) const override {
        if (name == "7z") return std::string("/usr/bin/7z");
        return std::nullopt;
    }
};

ClientConfig TestConfig() {
    ClientConfig cfg;
    cfg.api_base_url = "https://api.test/api";
    cfg.site_base_url = "https://site.test";
    return cfg;
}

class DriverDownloaderTest : public ::testing::Test {
  protected:
    void SetUp() override {
        g_cancel.store(false);
        http->SetJson(kLookup, R"([{"Id": "LAPTOPS/T14/PF1234AB", "Name": "ThinkPad T14"}])");
    }

    void SetCatalog(const std::string& items) {
        http->SetJson(kDrivers, R"({"body": {"DownloadItems": [)" + items + "]}}");
    }

    DriverDownloader Make(std::vector<std::string> categories = {}) {
        DriverDownloader::Options opt;
        opt.serial = "pf1234ab";
        opt.output_dir = out_dir;
        opt.categories = std::move(categories);
        opt.workers = 2;
        opt.extraction.environment = HostEnvironment::Tools;
        return DriverDownloader(TestConfig(), opt, {http, runner, std::make_shared<OnlySevenZip>()}, console);
    }

    testutil::TemporaryDirectory tmp;
    const std::string out_dir = tmp.Join("drivers_PF1234AB");
    std::shared_ptr<testutil::FakeHttpClient> http = std::make_shared<testutil::FakeHttpClient>();
    std::shared_ptr<SevenZipStub> runner = std::make_shared<SevenZipStub>();
    std::ostringstream console;
};

constexpr const char* kBiosItem =
    R"({"Title": "BIOS Update", "Category": {"Name": "BIOS"}, "Version": "1.2",
        "Files": [{"URL": "https://host/path/bios_1.2.exe?sig=abc", "Name": "BIOS"}]})";

constexpr const char* kAudioItem =
    R"({"Title": "Realtek Audio Driver", "Category": {"Name": "Audio"},
        "Files": [{"URL": "https://host/audio/rtk.exe"}, {"URL": "https://host/audio/readme.txt"}]})";

constexpr const char* kSccmItem =
    R"json({"Title": "SCCM Package for Windows 11 (T14)", "Category": {"Name": "Enterprise Management"},
        "Files": [{"URL": "https://host/sccm/tp_t14_w11.exe", "Size": "1.5 MB"},
                  {"URL": "https://host/sccm/tp_t14_w11.txt"}]})json";

TEST_F(DriverDownloaderTest, BulkDownloadWritesFileAndManifest) {
    SetCatalog(kBiosItem);
    http->SetJson("https://host/path/bios_1.2.exe?sig=abc", "bios-image");

    auto dl = Make();
    TransferSummary summary;
    auto r = dl.DownloadAll(summary);
    ASSERT_TRUE(r.is_ok()) << r.msg;

    EXPECT_EQ(summary.completed, 1u);
    EXPECT_EQ(summary.failed, 0u);
    EXPECT_EQ(testutil::ReadFile(out_dir + "/BIOS/bios_1.2.exe"), "bios-image");
    EXPECT_EQ(testutil::ListFiles(out_dir),
              (std::vector<std::string>{"BIOS/bios_1.2.exe", kManifestFileName}));

    const auto manifest = nlohmann::json::parse(testutil::ReadFile(out_dir + "/" + kManifestFileName));
    EXPECT_EQ(manifest["serial_number"], "PF1234AB");
    EXPECT_EQ(manifest["product"]["Name"], "ThinkPad T14");
    ASSERT_EQ(manifest["drivers"].size(), 1u);
    EXPECT_EQ(manifest["drivers"][0]["title"], "BIOS Update");
    EXPECT_EQ(manifest["drivers"][0]["category"], "BIOS");

    EXPECT_NE(console.str().find("Downloaded: 1"), std::string::npos);
}

TEST_F(DriverDownloaderTest, SecondBulkRunSkipsExistingFiles) {
    SetCatalog(kBiosItem);
    http->SetJson("https://host/path/bios_1.2.exe?sig=abc", "bios-image");

    TransferSummary first;
    ASSERT_TRUE(Make().DownloadAll(first).is_ok());

    TransferSummary second;
    ASSERT_TRUE(Make().DownloadAll(second).is_ok());
    EXPECT_EQ(second.completed, 0u);
    EXPECT_EQ(second.skipped, 1u);
    EXPECT_EQ(http->Calls("https://host/path/bios_1.2.exe?sig=abc"), 1);
}

TEST_F(DriverDownloaderTest, CategoryFilterIsCaseInsensitive) {
    SetCatalog(std::string(kBiosItem) + "," + kAudioItem);
    http->SetJson("https://host/audio/rtk.exe", "rtk");
    http->SetJson("https://host/audio/readme.txt", "read me");

    auto dl = Make({"audio"});
    TransferSummary summary;
    ASSERT_TRUE(dl.DownloadAll(summary).is_ok());
    EXPECT_EQ(summary.completed, 2u);
    EXPECT_TRUE(testutil::Exists(out_dir + "/Audio/rtk.exe"));
    EXPECT_FALSE(testutil::Exists(out_dir + "/BIOS"));

    const auto manifest = nlohmann::json::parse(testutil::ReadFile(out_dir + "/" + kManifestFileName));
    EXPECT_EQ(manifest["drivers"].size(), 2u);
}

TEST_F(DriverDownloaderTest, FailedTransferIsReportedNotFatal) {
    SetCatalog(kAudioItem);
    http->SetJson("https://host/audio/rtk.exe", "rtk");
    http->Set("https://host/audio/readme.txt", {.status = 500});

    auto dl = Make();
    TransferSummary summary;
    auto r = dl.DownloadAll(summary);
    EXPECT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(summary.completed, 1u);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_FALSE(testutil::Exists(out_dir + "/Audio/readme.txt"));
}

TEST_F(DriverDownloaderTest, FallbackCatalogIsReportedAsDegraded) {
    http->Set(kDrivers, {.status = 503});
    http->SetJson("https://api.test/api/v2/products/LAPTOPS/T14/PF1234AB/downloads",
                  R"({"Downloads": [{"Name": "Chipset", "Category": "Chipset", "DownloadUrl": "https://h/c.exe"}]})");
    http->SetJson("https://h/c.exe", "chipset");

    auto dl = Make();
    TransferSummary summary;
    ASSERT_TRUE(dl.DownloadAll(summary).is_ok());
    EXPECT_EQ(summary.completed, 1u);
    EXPECT_EQ(dl.CatalogStatus().err, kErrCatalogFetchDegraded);
    EXPECT_NE(console.str().find("fallback catalog (v2 Downloads)"), std::string::npos);
    EXPECT_TRUE(testutil::Exists(out_dir + "/Chipset/c.exe"));
}

TEST_F(DriverDownloaderTest, PrimaryCatalogIsNotDegraded) {
    SetCatalog(kBiosItem);

    auto dl = Make();
    ASSERT_TRUE(dl.ListCategories().is_ok());
    EXPECT_TRUE(dl.CatalogStatus().is_ok());
    EXPECT_EQ(console.str().find("Note:"), std::string::npos);
}

TEST_F(DriverDownloaderTest, UnknownSerialFailsWithoutOutput) {
    http->SetJson(kLookup, "[]");

    auto dl = Make();
    TransferSummary summary;
    auto r = dl.DownloadAll(summary);
    EXPECT_EQ(r.err, kErrProductNotFound);
    EXPECT_FALSE(testutil::Exists(out_dir));
}

TEST_F(DriverDownloaderTest, ListCategoriesCountsFiles) {
    SetCatalog(std::string(kBiosItem) + "," + kAudioItem);

    auto dl = Make();
    std::map<std::string, std::size_t> counts;
    ASSERT_TRUE(dl.ListCategories(&counts).is_ok());
    EXPECT_EQ(counts, (std::map<std::string, std::size_t>{{"Audio", 2}, {"BIOS", 1}}));
    EXPECT_NE(console.str().find("  - Audio: 2 files"), std::string::npos);
    EXPECT_FALSE(testutil::Exists(out_dir));
}

TEST_F(DriverDownloaderTest, ShowInfoPrintsProductObject) {
    auto dl = Make();
    ASSERT_TRUE(dl.ShowInfo().is_ok());
    EXPECT_NE(console.str().find("\"Name\": \"ThinkPad T14\""), std::string::npos);
    EXPECT_EQ(http->Calls(kDrivers), 0);
}

TEST_F(DriverDownloaderTest, DeploymentPackageDownloadedAndExtracted) {
    SetCatalog(std::string(kBiosItem) + "," + kSccmItem);
    http->SetJson("https://host/sccm/tp_t14_w11.exe", "MZ-sfx");

    auto dl = Make();
    FixedSelectionProvider selector({1});
    DeploymentReport report;
    auto r = dl.DownloadDeploymentPackages(selector, report);
    ASSERT_TRUE(r.is_ok()) << r.msg;

    EXPECT_FALSE(report.cancelled);
    EXPECT_EQ(report.selected, (std::vector<std::size_t>{0}));
    EXPECT_EQ(report.transfers.completed, 1u);
    EXPECT_EQ(report.extraction_failures, 0u);
    ASSERT_EQ(report.extracted_dirs.size(), 1u);

    EXPECT_EQ(testutil::ReadFile(out_dir + "/SCCM/tp_t14_w11.exe"), "MZ-sfx");
    EXPECT_TRUE(testutil::Exists(out_dir + "/SCCM/tp_t14_w11/Audio/audio.inf"));
    EXPECT_FALSE(testutil::Exists(out_dir + "/SCCM/tp_t14_w11.txt"));
    EXPECT_TRUE(testutil::Exists(out_dir + "/" + kManifestFileName));
    EXPECT_EQ(http->Calls("https://host/path/bios_1.2.exe?sig=abc"), 0);

    ASSERT_EQ(runner->calls.size(), 1u);
    EXPECT_EQ(runner->calls[0][0], "/usr/bin/7z");

    const std::string text = console.str();
    EXPECT_NE(text.find("[1] SCCM Package for Windows 11 (T14)"), std::string::npos);
    EXPECT_NE(text.find("(1 .inf driver files)"), std::string::npos);
    EXPECT_NE(text.find("pnputil /add-driver"), std::string::npos);
}

TEST_F(DriverDownloaderTest, DeploymentExtractionCanBeDisabled) {
    SetCatalog(kSccmItem);
    http->SetJson("https://host/sccm/tp_t14_w11.exe", "MZ-sfx");

    DriverDownloader::Options opt;
    opt.serial = "PF1234AB";
    opt.output_dir = out_dir;
    opt.extract = false;
    DriverDownloader dl(TestConfig(), opt, {http, runner, std::make_shared<OnlySevenZip>()}, console);

    FixedSelectionProvider selector({1});
    DeploymentReport report;
    ASSERT_TRUE(dl.DownloadDeploymentPackages(selector, report).is_ok());
    EXPECT_TRUE(testutil::Exists(out_dir + "/SCCM/tp_t14_w11.exe"));
    EXPECT_TRUE(report.extracted_dirs.empty());
    EXPECT_TRUE(runner->calls.empty());
}

TEST_F(DriverDownloaderTest, NoneSelectionHasNoSideEffects) {
    SetCatalog(kSccmItem);

    std::istringstream in("none\n");
    std::ostringstream prompt;
    InteractiveSelectionProvider selector(in, prompt);

    auto dl = Make();
    DeploymentReport report;
    ASSERT_TRUE(dl.DownloadDeploymentPackages(selector, report).is_ok());
    EXPECT_TRUE(report.cancelled);
    EXPECT_NE(console.str().find("Download cancelled"), std::string::npos);
    EXPECT_FALSE(testutil::Exists(out_dir));
    EXPECT_EQ(http->Calls("https://host/sccm/tp_t14_w11.exe"), 0);
}

TEST_F(DriverDownloaderTest, OutOfRangeFixedSelectionIsRejected) {
    SetCatalog(kSccmItem);

    auto dl = Make();
    FixedSelectionProvider selector({2});
    DeploymentReport report;
    auto r = dl.DownloadDeploymentPackages(selector, report);
    EXPECT_EQ(r.err, kErrInvalidSelection);
    EXPECT_FALSE(testutil::Exists(out_dir));
}

TEST_F(DriverDownloaderTest, NoDeploymentPackages) {
    SetCatalog(kBiosItem);

    auto dl = Make();
    FixedSelectionProvider selector({1});
    DeploymentReport report;
    ASSERT_TRUE(dl.DownloadDeploymentPackages(selector, report).is_ok());
    EXPECT_NE(console.str().find("No SCCM packages found"), std::string::npos);
    EXPECT_FALSE(testutil::Exists(out_dir));
}

} // namespace
} // namespace driverfetch
