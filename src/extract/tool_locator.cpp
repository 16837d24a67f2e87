#include "extract/tool_locator.hpp"

#include "util/logger.hpp"

#include <cstdlib>
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>

namespace driverfetch {

namespace {

bool IsExecutableFile(const std::string& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) return false;
    return ::access(path.c_str(), X_OK) == 0;
}

std::optional<std::string> Search(const std::string& search_path, const std::string& name) {
    if (name.empty()) return std::nullopt;
    if (name.find('/') != std::string::npos) {
        if (IsExecutableFile(name)) return name;
        return std::nullopt;
    }

    std::size_t start = 0;
    while (start <= search_path.size()) {
        const auto colon = search_path.find(':', start);
        const auto end = (colon == std::string::npos) ? search_path.size() : colon;
        std::string dir = search_path.substr(start, end - start);
        start = end + 1;

        if (dir.empty()) dir = ".";
        const std::string candidate = (std::filesystem::path(dir) / name).string();
        if (IsExecutableFile(candidate)) return candidate;
    }
    return std::nullopt;
}

} // namespace

PathToolLocator::PathToolLocator() {
    const char* p = std::getenv("PATH");
    search_path_ = p ? p : "/usr/local/bin:/usr/bin:/bin";
}

std::optional<std::string> PathToolLocator::Find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = cache_.find(name);
    if (it != cache_.end()) return it->second;

    auto found = Search(search_path_, name);
    LogDebug("tool %s: %s", name.c_str(), found ? found->c_str() : "not found");
    cache_.emplace(name, found);
    return found;
}

Toolset DiscoverToolset(const IToolLocator& locator) {
    Toolset t;
    for (const char* name : {"7z", "7zz", "7za"}) {
        if (auto p = locator.Find(name)) {
            t.seven_zip = *p;
            break;
        }
    }
    if (auto p = locator.Find("cabextract")) t.cabextract = *p;
    if (auto p = locator.Find("innoextract")) t.innoextract = *p;
    return t;
}

} // namespace driverfetch
