#include "hex.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace farmer::util {

std::string ToHex(const uint8_t* data, std::size_t size) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < size; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}

std::vector<uint8_t> FromHex(const std::string& str) {
  std::string hex = str;
  if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) hex = hex.substr(2);

  if (hex.size() % 2 != 0) throw std::invalid_argument("hex string has odd length");

  std::vector<uint8_t> out;
  out.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    std::size_t consumed = 0;
    const auto  byte     = std::stoul(hex.substr(i, 2), &consumed, 16);
    if (consumed != 2) throw std::invalid_argument("invalid hex digit in '" + str + "'");
    out.push_back(static_cast<uint8_t>(byte));
  }
  return out;
}

} // namespace farmer::util
