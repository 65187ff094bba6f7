#ifndef BINPOST_CORE_SIZE_FORMAT_HPP_
#define BINPOST_CORE_SIZE_FORMAT_HPP_

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace binpost::core {

// Human-readable binary size: "512 B", "1.50 KiB", "20.00 MiB", "1.25 GiB".
inline std::string FormatByteSize(std::uint64_t bytes) {
  static constexpr const char* kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
  if (bytes < 1024U) {
    return std::to_string(bytes) + " B";
  }

  double value = static_cast<double>(bytes);
  std::size_t unit = 0;
  while (value >= 1024.0 && unit + 1U < sizeof(kUnits) / sizeof(kUnits[0])) {
    value /= 1024.0;
    ++unit;
  }

  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << value << ' ' << kUnits[unit];
  return out.str();
}

} // namespace binpost::core

#endif // BINPOST_CORE_SIZE_FORMAT_HPP_
