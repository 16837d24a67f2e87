#pragma once
#include <string>
#include <utility>

namespace driverfetch {

// Values for Result::err that are not errno codes.
enum ErrorCode : int {
    kErrGeneric = -1,
    kErrProductNotFound = 1001,
    kErrCatalogFetchDegraded = 1002,
    kErrTransferFailed = 1003,
    kErrExtractionFailed = 1004,
    kErrInvalidSelection = 1005,
    kErrInvalidConfig = 1006,
    kErrCancelled = 1007,
};

struct Result {
    bool ok{true};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m)};
    }
};

} // namespace driverfetch
