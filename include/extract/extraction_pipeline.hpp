#pragma once

#include "extract/process_runner.hpp"
#include "extract/tool_locator.hpp"
#include "util/result.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace driverfetch {

// How self-extracting packages are unpacked.
enum class HostEnvironment {
    Native,  // execv the package's own extractor; a PE .exe needs a binfmt handler (Wine)
    Tools,   // 7-Zip, then cabextract / innoextract / libarchive for the payload
};

enum class ExtractMode { Auto, Native, Tools };

// "auto", "native" or "tools".
bool ParseExtractMode(const std::string& text, ExtractMode& out);

// Auto resolves to Tools.
HostEnvironment ResolveEnvironment(ExtractMode mode);

class ExtractionPipeline {
  public:
    struct Options {
        HostEnvironment environment = HostEnvironment::Tools;
        std::chrono::seconds native_timeout{600};
        std::chrono::seconds outer_timeout{300};
        std::chrono::seconds inner_timeout{600};
        bool in_process_fallback = true;
    };

    ExtractionPipeline(Options opt,
                       std::shared_ptr<const IProcessRunner> runner,
                       std::shared_ptr<const IToolLocator> locator);

    // Unpacks `archive` into `target`. A populated target is left alone and
    // counts as success. On failure a target created here is removed again.
    Result Extract(const std::string& archive, const std::string& target) const;

    // Recursive count of *.inf files (case-insensitive).
    static std::size_t CountDriverDescriptions(const std::string& dir);

    static bool IsPopulatedDirectory(const std::string& dir);

    // Files the outer 7-Zip pass leaves next to the payload.
    static void RemoveArtifacts(const std::string& dir);

  private:
    Result ExtractNative(const std::string& archive, const std::string& target) const;
    Result ExtractWithTools(const std::string& archive, const std::string& target) const;
    Result ExtractInnerPayload(const Toolset& tools,
                               const std::string& payload,
                               const std::string& target) const;

    // Ok() only for a zero exit status. Cancellation passes through.
    Result RunTool(const std::vector<std::string>& argv, std::chrono::seconds timeout) const;

    Options opt_;
    std::shared_ptr<const IProcessRunner> runner_;
    std::shared_ptr<const IToolLocator> locator_;
};

} // namespace driverfetch
