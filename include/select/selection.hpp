#pragma once

#include "catalog/model.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <iosfwd>
#include <utility>
#include <string>
#include <vector>

namespace driverfetch {

// Records whose category equals one of `categories` (case-insensitive).
// An empty allow-list keeps everything.
std::vector<DriverRecord> FilterByCategories(const std::vector<DriverRecord>& drivers,
                                             const std::vector<std::string>& categories);

// SCCM deployment packages: title contains "sccm", files narrowed to .exe
// URLs. Records left without files are dropped.
std::vector<DriverRecord> FilterDeploymentPackages(const std::vector<DriverRecord>& drivers);

// "[n] title" followed by one "- filename (size)" line per file.
void PrintPackageList(std::ostream& os, const std::vector<DriverRecord>& packages);

struct SelectionParse {
    enum class Kind { Indices, All, None, Invalid };

    Kind kind = Kind::Invalid;
    std::vector<std::size_t> indices;  // zero-based, sorted, unique
    std::string error;
};

// Parses one line of user input against `count` items. Empty input means all.
SelectionParse ParseSelection(const std::string& text, std::size_t count);

struct Selection {
    bool cancelled = false;
    std::vector<std::size_t> indices;  // zero-based, sorted, unique
};

class ISelectionProvider {
public:
    virtual ~ISelectionProvider() = default;

    // `packages` has already been shown to the user.
    virtual Result Select(const std::vector<DriverRecord>& packages, Selection& out) = 0;
};

// Prompts on `out` and reads answers from `in` until one parses. End of input
// or a pending interrupt cancels.
class InteractiveSelectionProvider final : public ISelectionProvider {
public:
    InteractiveSelectionProvider(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

    Result Select(const std::vector<DriverRecord>& packages, Selection& out) override;

private:
    std::istream& in_;
    std::ostream& out_;
};

// Indices given up front, 1-based as the user sees them.
class FixedSelectionProvider final : public ISelectionProvider {
public:
    explicit FixedSelectionProvider(std::vector<std::size_t> one_based)
        : one_based_(std::move(one_based)) {}

    Result Select(const std::vector<DriverRecord>& packages, Selection& out) override;

private:
    std::vector<std::size_t> one_based_;
};

} // namespace driverfetch
