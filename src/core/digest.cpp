#include "core/digest.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <format>
#include <stdexcept>
#include <vector>

namespace anonymizer {

Digest::Md5Bytes Digest::md5(std::string_view data) {
    Md5Bytes out{};
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_md5(), nullptr) != 1
        || len != kMd5Size) {
        throw std::runtime_error("EVP_Digest(md5) failed");
    }
    return out;
}

std::string Digest::md5_hex(std::string_view data) {
    const auto bytes = md5(data);
    std::string result;
    result.reserve(kMd5Size * 2);
    for (const uint8_t b : bytes) {
        result += std::format("{:02x}", b);
    }
    return result;
}

std::string Digest::to_decimal(const Md5Bytes& bytes) {
    // Little-endian base-10 digits, grown by multiply-add per input byte
    std::vector<uint8_t> digits{0};
    for (const uint8_t b : bytes) {
        unsigned carry = b;
        for (auto& d : digits) {
            const unsigned v = d * 256u + carry;
            d = static_cast<uint8_t>(v % 10);
            carry = v / 10;
        }
        while (carry > 0) {
            digits.push_back(static_cast<uint8_t>(carry % 10));
            carry /= 10;
        }
    }
    while (digits.size() > 1 && digits.back() == 0) {
        digits.pop_back();
    }

    std::string result;
    result.reserve(digits.size());
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        result += static_cast<char>('0' + *it);
    }
    return result;
}

std::string Digest::md5_decimal_mod(std::string_view data, size_t digits) {
    const std::string full = to_decimal(md5(data));
    if (digits == 0) return "0";

    // x mod 10^n is the last n decimal digits
    std::string tail = full.size() > digits ? full.substr(full.size() - digits) : full;
    const auto first = tail.find_first_not_of('0');
    if (first == std::string::npos) return "0";
    return tail.substr(first);
}

} // namespace anonymizer
