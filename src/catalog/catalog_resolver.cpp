#include "catalog/catalog_resolver.hpp"

#include "catalog/catalog_parser.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <cctype>
#include <cstdio>
#include <utility>

namespace driverfetch {

namespace {

// Percent-encodes everything except RFC 3986 unreserved characters and '/',
// which product ids use as a hierarchy separator.
std::string UrlEncode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

Result FetchOk(const IHttpClient& http, const std::string& url, HttpResponse& resp) {
    auto r = http.Get(url, resp);
    if (!r.is_ok()) return r;
    if (!IsSuccessStatus(resp.status)) {
        return Result::Fail(kErrGeneric, "HTTP " + std::to_string(resp.status) + " from " + url);
    }
    return Result::Ok();
}

} // namespace

CatalogResolver::CatalogResolver(ClientConfig cfg, std::shared_ptr<const IHttpClient> http)
    : cfg_(std::move(cfg)), http_(std::move(http)) {}

std::string CatalogResolver::NormalizeSerial(const std::string& identifier) {
    return ToUpper(Trim(identifier));
}

std::string CatalogResolver::ProductLookupUrl(const std::string& product_id) const {
    return cfg_.api_base_url + "/v4/mse/getproducts?productId=" + UrlEncode(product_id);
}

std::string CatalogResolver::ProductPageUrl(const std::string& serial) const {
    return cfg_.site_base_url + "/products/" + UrlEncode(ToLower(serial));
}

std::string CatalogResolver::DriverListUrl(const std::string& product_id) const {
    return cfg_.api_base_url + "/v4/downloads/drivers?productId=" + UrlEncode(product_id);
}

std::string CatalogResolver::LegacyDriverListUrl(const std::string& product_id) const {
    return cfg_.api_base_url + "/v2/products/" + UrlEncode(product_id) + "/downloads";
}

Result CatalogResolver::LookupProduct(const std::string& query_id,
                                      const std::string& fallback_id,
                                      ProductDescriptor& out) const {
    HttpResponse resp;
    auto fr = FetchOk(*http_, ProductLookupUrl(query_id), resp);
    if (!fr.is_ok()) return fr;

    auto parsed = CatalogParser::ParseProductLookup(resp.body, fallback_id);
    if (!parsed) return Result::Fail(kErrGeneric, parsed.error());
    out = std::move(*parsed);
    return Result::Ok();
}

Result CatalogResolver::Resolve(const std::string& identifier, ProductDescriptor& out) const {
    const std::string serial = NormalizeSerial(identifier);
    if (serial.empty()) {
        return Result::Fail(kErrProductNotFound, "Could not find product info for serial number: (empty)");
    }

    LogInfo("Looking up product info for serial: %s", serial.c_str());

    auto primary = LookupProduct(serial, serial, out);
    if (primary.is_ok()) {
        LogInfo("Found product: %s (id %s)", out.name.c_str(), out.id.c_str());
        return Result::Ok();
    }
    if (primary.err == kErrCancelled) return primary;
    LogWarn("Primary product lookup failed: %s", primary.msg.c_str());

    HttpResponse page;
    auto pr = FetchOk(*http_, ProductPageUrl(serial), page);
    if (pr.is_ok()) {
        if (auto scraped = CatalogParser::ScrapeProductId(page.body)) {
            LogDebug("Product page names productId=%s", scraped->c_str());
            auto second = LookupProduct(*scraped, *scraped, out);
            if (second.is_ok()) {
                LogInfo("Found product: %s (id %s)", out.name.c_str(), out.id.c_str());
                return Result::Ok();
            }
            if (second.err == kErrCancelled) return second;
            LogWarn("Alternate product lookup failed: %s", second.msg.c_str());
        } else {
            LogWarn("Alternate lookup failed: no productId in product page");
        }
    } else {
        if (pr.err == kErrCancelled) return pr;
        LogWarn("Alternate lookup failed: %s", pr.msg.c_str());
    }

    out = ProductDescriptor{};
    return Result::Fail(kErrProductNotFound, "Could not find product info for serial number: " + serial);
}

Result CatalogResolver::ListDrivers(const ProductDescriptor& product, DriverListing& out) const {
    out = DriverListing{};
    LogInfo("Fetching driver list for %s...", product.id.c_str());

    HttpResponse resp;
    auto fr = FetchOk(*http_, DriverListUrl(product.id), resp);
    if (fr.is_ok()) {
        auto parsed = CatalogParser::ParsePrimaryListing(resp.body);
        if (parsed && CatalogParser::ItemCount(*parsed) > 0) {
            out.drivers = CatalogParser::Normalize(*parsed);
            out.source = CatalogParser::ShapeName(*parsed);
            LogInfo("Found %zu drivers with downloadable files", out.drivers.size());
            return Result::Ok();
        }
        LogWarn("Driver list: %s",
                parsed ? "no DownloadItems in response" : parsed.error().c_str());
    } else {
        if (fr.err == kErrCancelled) return fr;
        LogWarn("Error fetching drivers: %s", fr.msg.c_str());
    }

    out.degraded = true;

    HttpResponse legacy;
    auto lr = FetchOk(*http_, LegacyDriverListUrl(product.id), legacy);
    if (lr.is_ok()) {
        auto parsed = CatalogParser::ParseLegacyListing(legacy.body);
        if (parsed) {
            out.drivers = CatalogParser::Normalize(*parsed);
            out.source = CatalogParser::ShapeName(*parsed);
            LogWarn("Driver list degraded: %zu drivers from the v2 API", out.drivers.size());
            return Result::Ok();
        }
        LogWarn("V2 API response unusable: %s", parsed.error().c_str());
    } else {
        if (lr.err == kErrCancelled) return lr;
        LogWarn("V2 API also failed: %s", lr.msg.c_str());
    }

    LogWarn("Driver list degraded: no drivers could be fetched");
    return Result::Ok();
}

} // namespace driverfetch
