#pragma once

#include "catalog/model.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace driverfetch {

// v4 "downloads/drivers" item.
struct CatalogFile {
    std::string name;
    std::string url;
    std::uint64_t size = 0;
    std::string sha256;
};

struct CatalogItem {
    std::string title;
    std::string category;
    std::string version;
    std::int64_t date_unix = 0;
    std::vector<CatalogFile> files;
};

// {"body": {"DownloadItems": [...]}}
struct WrappedListing {
    std::vector<CatalogItem> items;
};

// {"DownloadItems": [...]}
struct FlatListing {
    std::vector<CatalogItem> items;
};

// v2 "products/<id>/downloads": one file per item.
struct LegacyItem {
    std::string name;
    std::string category;
    std::string version;
    std::string download_url;
    std::string file_name;
    std::uint64_t size = 0;
};

struct LegacyListing {
    std::vector<LegacyItem> items;
};

using ListingResponse = std::variant<WrappedListing, FlatListing, LegacyListing>;

class CatalogParser {
public:
    // First element of the "getproducts" array. An empty array is an error.
    static std::expected<ProductDescriptor, std::string> ParseProductLookup(
        const std::string& body, const std::string& fallback_id);

    // "productId": "<id>" embedded in a rendered product page.
    static std::optional<std::string> ScrapeProductId(const std::string& html);

    // Prefers body.DownloadItems; falls back to top-level DownloadItems
    // (possibly empty) in the same document.
    static std::expected<ListingResponse, std::string> ParsePrimaryListing(const std::string& body);
    static std::expected<ListingResponse, std::string> ParseLegacyListing(const std::string& body);

    static std::vector<DriverRecord> Normalize(const ListingResponse& response);
    static std::size_t ItemCount(const ListingResponse& response);
    static const char* ShapeName(const ListingResponse& response);

    // Accepts numbers and strings such as "12.5 MB"; unparseable => 0.
    static std::uint64_t ParseDeclaredSize(const nlohmann::json& value);
};

} // namespace driverfetch
