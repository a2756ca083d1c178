#include <ar-lib-reader/detail/escape.hxx>

#include <fmt/format.h>

namespace ar_lib_reader::detail {

std::string escape_bytes(std::span<const std::uint8_t> bytes) {
  std::string out;
  out.reserve(bytes.size());
  for (auto b : bytes) {
    if (b >= 0x20 && b < 0x7F && b != '\\' && b != '"')
      out.push_back(static_cast<char>(b));
    else
      out += fmt::format("\\x{:02x}", b);
  }
  return out;
}

} // namespace ar_lib_reader::detail
