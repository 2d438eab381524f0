#pragma once

#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace converse {

// UUID v4 generator for message and tool request ids
class UUID {
 public:
  static std::string generate() {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;

    uint64_t ab = dist(gen);
    uint64_t cd = dist(gen);

    // version 4, RFC 4122 variant
    ab = (ab & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    cd = (cd & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    ss << std::setw(8) << (ab >> 32) << "-";
    ss << std::setw(4) << ((ab >> 16) & 0xFFFF) << "-";
    ss << std::setw(4) << (ab & 0xFFFF) << "-";
    ss << std::setw(4) << (cd >> 48) << "-";
    ss << std::setw(12) << (cd & 0x0000FFFFFFFFFFFFULL);
    return ss.str();
  }

  // "<prefix>_<8 random chars>", used for synthesized tool request ids
  static std::string short_id(const std::string& prefix, size_t length = 8) {
    static const char charset[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<size_t> dist(0, sizeof(charset) - 2);

    std::string result = prefix + "_";
    result.reserve(prefix.size() + 1 + length);
    for (size_t i = 0; i < length; ++i) {
      result += charset[dist(gen)];
    }
    return result;
  }
};

}  // namespace converse
