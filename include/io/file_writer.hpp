#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace driverfetch {

// Creates (or truncates) a regular file and writes to it through a raw fd.
class FileWriter final : public IWriter {
  public:
    static Result Open(std::string path, FileWriter& out);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;
    Result Close();

    const std::string& Path() const { return path_; }
    std::uint64_t BytesWritten() const { return written_; }

  private:
    std::string path_;
    Fd fd_;
    std::uint64_t written_ = 0;
};

} // namespace driverfetch
