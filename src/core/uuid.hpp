#pragma once

#include <cstdint>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>
#include <string>

namespace netvisor {

// Random identifiers for daemons and discovery sessions
class UUID {
 public:
  // RFC 4122 version 4
  static std::string generate() {
    uint64_t ab = 0;
    uint64_t cd = 0;
    {
      std::lock_guard lock(mutex());
      ab = engine()();
      cd = engine()();
    }

    ab = (ab & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    cd = (cd & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    ss << std::setw(8) << (ab >> 32) << "-";
    ss << std::setw(4) << ((ab >> 16) & 0xFFFF) << "-";
    ss << std::setw(4) << (ab & 0xFFFF) << "-";
    ss << std::setw(4) << (cd >> 48) << "-";
    ss << std::setw(12) << (cd & 0x0000FFFFFFFFFFFFULL);
    return ss.str();
  }

 private:
  static std::mt19937_64 &engine() {
    static std::random_device rd;
    static std::mt19937_64 gen(rd());
    return gen;
  }

  static std::mutex &mutex() {
    static std::mutex m;
    return m;
  }
};

}  // namespace netvisor
