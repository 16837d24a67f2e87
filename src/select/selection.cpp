#include "select/selection.hpp"

#include "system/signals.hpp"
#include "transfer/progress_sinks.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <charconv>
#include <istream>
#include <ostream>

namespace driverfetch {

namespace {

void SortUnique(std::vector<std::size_t>& v) {
    std::sort(v.begin(), v.end());
    v.erase(std::unique(v.begin(), v.end()), v.end());
}

bool ParseIndexToken(const std::string& token, std::size_t& out) {
    if (token.empty()) return false;
    const char* first = token.data();
    const char* last = token.data() + token.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

} // namespace

std::vector<DriverRecord> FilterByCategories(const std::vector<DriverRecord>& drivers,
                                             const std::vector<std::string>& categories) {
    if (categories.empty()) return drivers;

    std::vector<std::string> wanted;
    wanted.reserve(categories.size());
    for (const auto& c : categories) wanted.push_back(ToLower(c));

    std::vector<DriverRecord> out;
    for (const auto& d : drivers) {
        const std::string cat = ToLower(d.category);
        if (std::find(wanted.begin(), wanted.end(), cat) != wanted.end()) {
            out.push_back(d);
        }
    }
    return out;
}

std::vector<DriverRecord> FilterDeploymentPackages(const std::vector<DriverRecord>& drivers) {
    std::vector<DriverRecord> out;
    for (const auto& d : drivers) {
        if (!ContainsIgnoreCase(d.title, "sccm")) continue;

        DriverRecord pkg = d;
        pkg.files.clear();
        for (const auto& f : d.files) {
            if (EndsWithIgnoreCase(StripUrlQuery(f.url), ".exe")) {
                pkg.files.push_back(f);
            }
        }
        if (!pkg.files.empty()) out.push_back(std::move(pkg));
    }
    return out;
}

void PrintPackageList(std::ostream& os, const std::vector<DriverRecord>& packages) {
    for (std::size_t i = 0; i < packages.size(); ++i) {
        os << "  [" << (i + 1) << "] " << packages[i].title << "\n";
        for (const auto& f : packages[i].files) {
            os << "      - " << FilenameFromUrl(f.url) << " ("
               << (f.size ? FormatBytes(f.size) : std::string("Unknown size")) << ")\n";
        }
    }
    os.flush();
}

SelectionParse ParseSelection(const std::string& text, std::size_t count) {
    SelectionParse res;
    const std::string s = ToLower(Trim(text));

    if (s == "none") {
        res.kind = SelectionParse::Kind::None;
        return res;
    }
    if (s.empty() || s == "all") {
        res.kind = SelectionParse::Kind::All;
        for (std::size_t i = 0; i < count; ++i) res.indices.push_back(i);
        return res;
    }

    std::size_t start = 0;
    while (start <= s.size()) {
        const auto comma = s.find(',', start);
        const auto end = (comma == std::string::npos) ? s.size() : comma;
        const std::string token = Trim(std::string_view(s).substr(start, end - start));
        start = end + 1;

        if (token.empty()) continue;

        std::size_t n = 0;
        if (!ParseIndexToken(token, n)) {
            res.error = "Invalid input '" + token + "'. Enter numbers separated by commas, 'all', or 'none'.";
            res.indices.clear();
            return res;
        }
        if (n < 1 || n > count) {
            res.error = "Invalid number: " + token + ". Must be between 1 and " + std::to_string(count) + ".";
            res.indices.clear();
            return res;
        }
        res.indices.push_back(n - 1);
    }

    if (res.indices.empty()) {
        res.error = "No valid packages selected.";
        return res;
    }

    SortUnique(res.indices);
    res.kind = SelectionParse::Kind::Indices;
    return res;
}

Result InteractiveSelectionProvider::Select(const std::vector<DriverRecord>& packages, Selection& out) {
    out = Selection{};

    out_ << "\nSelect packages to download:\n"
         << "  - Enter package numbers separated by commas (e.g., 1,3,5)\n"
         << "  - Enter 'all' (or nothing) to download all packages\n"
         << "  - Enter 'none' to cancel\n";

    while (true) {
        if (CancelRequested()) {
            out.cancelled = true;
            return Result::Ok();
        }

        out_ << "\nYour selection: " << std::flush;

        std::string line;
        if (!std::getline(in_, line) || CancelRequested()) {
            out_ << "\n";
            out.cancelled = true;
            return Result::Ok();
        }

        auto parsed = ParseSelection(line, packages.size());
        switch (parsed.kind) {
        case SelectionParse::Kind::None:
            out.cancelled = true;
            return Result::Ok();
        case SelectionParse::Kind::All:
        case SelectionParse::Kind::Indices:
            out.indices = std::move(parsed.indices);
            return Result::Ok();
        case SelectionParse::Kind::Invalid:
            out_ << "  " << parsed.error << "\n";
            break;
        }
    }
}

Result FixedSelectionProvider::Select(const std::vector<DriverRecord>& packages, Selection& out) {
    out = Selection{};

    for (std::size_t n : one_based_) {
        if (n < 1 || n > packages.size()) {
            return Result::Fail(kErrInvalidSelection,
                                "Invalid package number: " + std::to_string(n) + ". Must be between 1 and " +
                                    std::to_string(packages.size()));
        }
        out.indices.push_back(n - 1);
    }

    SortUnique(out.indices);
    LogDebug("Fixed selection: %zu package(s)", out.indices.size());
    return Result::Ok();
}

} // namespace driverfetch
