#include "catalog/catalog_parser.hpp"

#include "util/path_utils.hpp"

#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <regex>

namespace driverfetch {

using json = nlohmann::json;

namespace {

// 2^63 and 2^64 are exact doubles; anything at or above them does not fit.
constexpr double kInt64Limit = 9223372036854775808.0;
constexpr double kUint64Limit = 18446744073709551616.0;

// String field, tolerating numbers; anything else maps to def.
std::string StringOr(const json& j, const char* key, const std::string& def) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return def;
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number()) return it->dump();
    return def;
}

// Out-of-range values map to def.
std::int64_t EpochOr(const json& j, std::int64_t def) {
    if (j.is_number_unsigned()) {
        const auto v = j.get<std::uint64_t>();
        if (v > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) return def;
        return static_cast<std::int64_t>(v);
    }
    if (j.is_number_integer()) return j.get<std::int64_t>();
    if (j.is_number_float()) {
        const double v = j.get<double>();
        if (!std::isfinite(v) || v >= kInt64Limit || v < -kInt64Limit) return def;
        return static_cast<std::int64_t>(v);
    }
    if (j.is_string()) {
        const std::string s = j.get<std::string>();
        char* end = nullptr;
        errno = 0;
        const long long v = std::strtoll(s.c_str(), &end, 10);
        if (errno == ERANGE) return def;
        if (end && end != s.c_str() && *end == '\0') return static_cast<std::int64_t>(v);
    }
    return def;
}

// "Category" is {"Name": "..."} in v4 responses, a plain string in older ones.
std::string CategoryOf(const json& item) {
    auto it = item.find("Category");
    if (it == item.end() || it->is_null()) return "Other";
    if (it->is_object()) return StringOr(*it, "Name", "Other");
    if (it->is_string()) {
        const std::string s = it->get<std::string>();
        return s.empty() ? "Other" : s;
    }
    return "Other";
}

std::expected<std::vector<CatalogItem>, std::string> ParseItemsArray(const json& arr) {
    if (!arr.is_array()) {
        return std::unexpected("'DownloadItems' must be an array");
    }

    std::vector<CatalogItem> out;
    out.reserve(arr.size());
    for (const auto& item : arr) {
        if (!item.is_object()) continue;

        CatalogItem ci;
        ci.title = StringOr(item, "Title", "Unknown");
        ci.category = CategoryOf(item);
        ci.version = StringOr(item, "Version", "Unknown");
        if (auto d = item.find("Date"); d != item.end() && d->is_object()) {
            if (auto u = d->find("Unix"); u != d->end()) ci.date_unix = EpochOr(*u, 0);
        }

        if (auto files = item.find("Files"); files != item.end() && files->is_array()) {
            for (const auto& f : *files) {
                if (!f.is_object()) continue;
                CatalogFile cf;
                cf.name = StringOr(f, "Name", "");
                cf.url = Trim(StringOr(f, "URL", ""));
                cf.size = f.contains("Size") ? CatalogParser::ParseDeclaredSize(f["Size"]) : 0;
                cf.sha256 = StringOr(f, "SHA256", "");
                ci.files.push_back(std::move(cf));
            }
        }
        out.push_back(std::move(ci));
    }
    return out;
}

json ParseDocument(const std::string& body, std::string& err) {
    if (body.find_first_not_of(" \t\n\r") == std::string::npos) {
        err = "Empty input";
        return json();
    }
    try {
        return json::parse(body);
    } catch (const json::parse_error& e) {
        err = std::string("Syntax Error: ") + e.what();
        return json();
    }
}

struct NormalizeVisitor {
    std::vector<DriverRecord> operator()(const WrappedListing& l) const { return FromV4(l.items); }
    std::vector<DriverRecord> operator()(const FlatListing& l) const { return FromV4(l.items); }

    std::vector<DriverRecord> operator()(const LegacyListing& l) const {
        std::vector<DriverRecord> out;
        for (const auto& item : l.items) {
            if (item.download_url.empty()) continue;
            DriverRecord rec;
            rec.title = item.name;
            rec.category = item.category;
            rec.version = item.version;
            FileEntry fe;
            fe.url = item.download_url;
            fe.name = item.file_name.empty() ? FilenameFromUrl(item.download_url) : item.file_name;
            fe.size = item.size;
            rec.files.push_back(std::move(fe));
            out.push_back(std::move(rec));
        }
        return out;
    }

    static std::vector<DriverRecord> FromV4(const std::vector<CatalogItem>& items) {
        std::vector<DriverRecord> out;
        for (const auto& item : items) {
            DriverRecord rec;
            rec.title = item.title;
            rec.category = item.category;
            rec.version = item.version;
            rec.release_date = item.date_unix;
            for (const auto& f : item.files) {
                if (f.url.empty()) continue;
                rec.files.push_back(FileEntry{.url = f.url, .size = f.size, .name = f.name, .sha256 = f.sha256});
            }
            if (!rec.files.empty()) out.push_back(std::move(rec));
        }
        return out;
    }
};

} // namespace

std::expected<ProductDescriptor, std::string> CatalogParser::ParseProductLookup(
    const std::string& body, const std::string& fallback_id) {
    std::string err;
    const json j = ParseDocument(body, err);
    if (!err.empty()) return std::unexpected(err);

    if (!j.is_array()) return std::unexpected("product lookup must return an array");
    if (j.empty()) return std::unexpected("product lookup returned no products");
    const json& first = j.front();
    if (!first.is_object()) return std::unexpected("product entry must be an object");

    ProductDescriptor product;
    product.raw = first;
    product.id = StringOr(first, "Id", "");
    if (product.id.empty()) product.id = fallback_id;
    product.name = StringOr(first, "Name", "Unknown");
    return product;
}

std::optional<std::string> CatalogParser::ScrapeProductId(const std::string& html) {
    static const std::regex kPattern(R"re("productId":\s*"([^"]+)")re");
    std::smatch m;
    if (!std::regex_search(html, m, kPattern)) return std::nullopt;
    return m[1].str();
}

std::expected<ListingResponse, std::string> CatalogParser::ParsePrimaryListing(const std::string& body) {
    std::string err;
    const json j = ParseDocument(body, err);
    if (!err.empty()) return std::unexpected(err);
    if (!j.is_object()) return std::unexpected("JSON root must be an object");

    try {
        if (auto b = j.find("body"); b != j.end() && b->is_object()) {
            if (auto items = b->find("DownloadItems"); items != b->end()) {
                auto parsed = ParseItemsArray(*items);
                if (!parsed) return std::unexpected(parsed.error());
                if (!parsed->empty()) return WrappedListing{std::move(*parsed)};
            }
        }

        FlatListing flat;
        if (auto items = j.find("DownloadItems"); items != j.end()) {
            auto parsed = ParseItemsArray(*items);
            if (!parsed) return std::unexpected(parsed.error());
            flat.items = std::move(*parsed);
        }
        return flat;
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Internal Error: ") + e.what());
    }
}

std::expected<ListingResponse, std::string> CatalogParser::ParseLegacyListing(const std::string& body) {
    std::string err;
    const json j = ParseDocument(body, err);
    if (!err.empty()) return std::unexpected(err);
    if (!j.is_object()) return std::unexpected("JSON root must be an object");

    LegacyListing listing;
    auto downloads = j.find("Downloads");
    if (downloads == j.end()) return listing;
    if (!downloads->is_array()) return std::unexpected("'Downloads' must be an array");

    for (const auto& item : *downloads) {
        if (!item.is_object()) continue;
        LegacyItem li;
        li.name = StringOr(item, "Name", "Unknown");
        li.category = CategoryOf(item);
        li.version = StringOr(item, "Version", "");
        li.download_url = Trim(StringOr(item, "DownloadUrl", ""));
        li.file_name = StringOr(item, "FileName", "");
        li.size = item.contains("Size") ? ParseDeclaredSize(item["Size"]) : 0;
        listing.items.push_back(std::move(li));
    }
    return listing;
}

std::vector<DriverRecord> CatalogParser::Normalize(const ListingResponse& response) {
    return std::visit(NormalizeVisitor{}, response);
}

std::size_t CatalogParser::ItemCount(const ListingResponse& response) {
    return std::visit([](const auto& l) { return l.items.size(); }, response);
}

const char* CatalogParser::ShapeName(const ListingResponse& response) {
    switch (response.index()) {
        case 0: return "v4 body.DownloadItems";
        case 1: return "v4 DownloadItems";
        default: return "v2 Downloads";
    }
}

std::uint64_t CatalogParser::ParseDeclaredSize(const json& value) {
    if (value.is_number_unsigned()) return value.get<std::uint64_t>();
    if (value.is_number_integer()) {
        const auto v = value.get<std::int64_t>();
        return v > 0 ? static_cast<std::uint64_t>(v) : 0;
    }
    if (value.is_number_float()) {
        const double v = value.get<double>();
        if (!std::isfinite(v) || v <= 0 || v >= kUint64Limit) return 0;
        return static_cast<std::uint64_t>(v);
    }
    if (!value.is_string()) return 0;

    const std::string s = Trim(value.get<std::string>());
    char* end = nullptr;
    const double number = std::strtod(s.c_str(), &end);
    if (!end || end == s.c_str() || !std::isfinite(number) || number < 0) return 0;

    const std::string unit = ToLower(Trim(end));
    double mult = 1.0;
    if (unit.empty() || unit == "b" || unit == "bytes") mult = 1.0;
    else if (unit == "k" || unit == "kb" || unit == "kib") mult = 1024.0;
    else if (unit == "m" || unit == "mb" || unit == "mib") mult = 1024.0 * 1024.0;
    else if (unit == "g" || unit == "gb" || unit == "gib") mult = 1024.0 * 1024.0 * 1024.0;
    else return 0;
    const double bytes = std::round(number * mult);
    if (!std::isfinite(bytes) || bytes >= kUint64Limit) return 0;
    return static_cast<std::uint64_t>(bytes);
}

} // namespace driverfetch
