#pragma once

#include "io/io.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace driverfetch {

// Lowercase hex compare; surrounding whitespace ignored.
bool DigestEquals(const std::string& expected_hex, const std::string& actual_hex);

class Sha256Hasher {
public:
    Sha256Hasher();
    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;
    Sha256Hasher(Sha256Hasher&&) noexcept;
    Sha256Hasher& operator=(Sha256Hasher&&) noexcept;
    ~Sha256Hasher();

    void Update(std::span<const std::uint8_t> data);
    std::string FinalHex();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Forwards every chunk to the inner writer and hashes what was written.
class DigestingWriter final : public IWriter {
public:
    explicit DigestingWriter(IWriter& inner) : inner_(inner) {}

    Result WriteAll(std::span<const std::uint8_t> in) override {
        auto r = inner_.WriteAll(in);
        if (r.is_ok()) hasher_.Update(in);
        return r;
    }

    Result FsyncNow() override { return inner_.FsyncNow(); }

    std::string FinalHex() { return hasher_.FinalHex(); }

private:
    IWriter& inner_;
    Sha256Hasher hasher_;
};

} // namespace driverfetch
