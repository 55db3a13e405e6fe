#include "core/ids.h"

#include <cstdint>
#include <random>
#include <sstream>

namespace spine::core {

std::string generate_uuid() {
  thread_local std::mt19937 gen{std::random_device{}()};
  std::uniform_int_distribution<uint32_t> dis;

  std::stringstream ss;
  ss << std::hex;
  ss << dis(gen);
  ss << "-";
  ss << (dis(gen) & 0xFFFF);
  ss << "-4"; // Version 4
  ss << (dis(gen) & 0x0FFF);
  ss << "-";
  ss << ((dis(gen) & 0x3FFF) | 0x8000);
  ss << "-";
  ss << (dis(gen) & 0xFFFF);
  ss << (dis(gen) & 0xFFFF);
  ss << (dis(gen) & 0xFFFF);
  return ss.str();
}

std::string generate_id(const std::string &prefix) {
  return prefix + "-" + generate_uuid();
}

} // namespace spine::core
