#pragma once

#include "catalog/model.hpp"
#include "net/http_client.hpp"
#include "util/client_config.hpp"
#include "util/result.hpp"

#include <memory>
#include <string>

namespace driverfetch {

class CatalogResolver {
public:
    CatalogResolver(ClientConfig cfg, std::shared_ptr<const IHttpClient> http);

    // Primary product lookup, then the product-page scrape. Fails with
    // kErrProductNotFound once both are exhausted.
    Result Resolve(const std::string& identifier, ProductDescriptor& out) const;

    // v4 listing, then the v2 listing. Never fails: a listing that needed
    // the fallback or produced nothing is flagged degraded.
    Result ListDrivers(const ProductDescriptor& product, DriverListing& out) const;

    // Trimmed, upper-cased serial.
    static std::string NormalizeSerial(const std::string& identifier);

    std::string ProductLookupUrl(const std::string& product_id) const;
    std::string ProductPageUrl(const std::string& serial) const;
    std::string DriverListUrl(const std::string& product_id) const;
    std::string LegacyDriverListUrl(const std::string& product_id) const;

private:
    Result LookupProduct(const std::string& query_id,
                         const std::string& fallback_id,
                         ProductDescriptor& out) const;

    const ClientConfig cfg_;
    std::shared_ptr<const IHttpClient> http_;
};

} // namespace driverfetch
