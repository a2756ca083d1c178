#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace ar_lib_reader::detail {

/**
 * @brief Render raw bytes for an error or diagnostic message.
 *
 * Printable ASCII is kept as-is; everything else, plus `\` and `"`, becomes a
 * `\xNN` escape.
 */
std::string escape_bytes(std::span<const std::uint8_t> bytes);

} // namespace ar_lib_reader::detail
