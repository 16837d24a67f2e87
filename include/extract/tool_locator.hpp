#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace driverfetch {

class IToolLocator {
  public:
    virtual ~IToolLocator() = default;

    // Absolute path of an executable, or nullopt when it is not installed.
    virtual std::optional<std::string> Find(const std::string& name) const = 0;
};

// Searches the directories of a PATH-style list. Lookups are cached.
class PathToolLocator final : public IToolLocator {
  public:
    // Uses $PATH.
    PathToolLocator();
    explicit PathToolLocator(std::string search_path) : search_path_(std::move(search_path)) {}

    std::optional<std::string> Find(const std::string& name) const override;

  private:
    std::string search_path_;
    mutable std::mutex mu_;
    mutable std::map<std::string, std::optional<std::string>> cache_;
};

// External unpackers; empty when absent.
struct Toolset {
    std::string seven_zip;  // first of 7z, 7zz, 7za
    std::string cabextract;
    std::string innoextract;
};

Toolset DiscoverToolset(const IToolLocator& locator);

} // namespace driverfetch
