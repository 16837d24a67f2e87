#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <span>

namespace driverfetch {

class IWriter {
public:
    virtual ~IWriter() = default;
    virtual Result WriteAll(std::span<const std::uint8_t> in) = 0;
    virtual Result FsyncNow() = 0;
};

} // namespace driverfetch
