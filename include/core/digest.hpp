#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace anonymizer {

/**
 * @brief MD5 helpers shared by the md5 provider and identifier derivation
 *
 * Input strings are hashed as raw bytes (callers pass UTF-8).
 */
class Digest {
public:
    static constexpr size_t kMd5Size = 16;

    using Md5Bytes = std::array<uint8_t, kMd5Size>;

    // Raw 128-bit digest
    [[nodiscard]] static Md5Bytes md5(std::string_view data);

    // 32 lowercase hex characters
    [[nodiscard]] static std::string md5_hex(std::string_view data);

    /**
     * @brief Decimal digits of the digest read as an unsigned big-endian
     *        integer, reduced modulo 10^digits
     *
     * Leading zeros are stripped ("0" when the remainder is zero).
     */
    [[nodiscard]] static std::string md5_decimal_mod(std::string_view data, size_t digits);

    // Full decimal rendering of a big-endian unsigned integer
    [[nodiscard]] static std::string to_decimal(const Md5Bytes& bytes);
};

} // namespace anonymizer
