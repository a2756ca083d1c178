#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace ar_lib_reader::detail {

/**
 * @struct ArHeader
 * @brief Representation of an `ar` member header (60 bytes).
 *
 * The struct layout matches the on-disk header used by Windows `.lib` files
 * (`IMAGE_ARCHIVE_MEMBER_HEADER`). Every field is left-justified ASCII padded
 * with spaces; none of them is NUL-terminated.
 *
 * The parser reads the fields one by one through a ByteCursor; the struct only
 * documents the layout and supplies the field widths.
 */
struct __attribute__((packed)) ArHeader {
  char name[16];      /**< @brief `/`, `//`, `name/` or `/<offset>`. */
  char date[12];      /**< @brief Modification time (decimal ASCII). */
  char user_id[6];    /**< @brief Owner user ID (often blank). */
  char group_id[6];   /**< @brief Owner group ID (often blank). */
  char mode[8];       /**< @brief File mode (octal text, read as decimal). */
  char size[10];      /**< @brief Content size in bytes (decimal ASCII). */
  char terminator[2]; /**< @brief Always "`\n". */
};

static_assert(sizeof(ArHeader) == 60, "ArHeader must be 60 bytes");

/// Archive signature at offset 0.
inline constexpr std::string_view archive_magic = "!<arch>\n";

/// Marker of the symbol index member(s).
inline constexpr std::string_view symbol_index_name = "/";

/// Marker of the long filename lookup member.
inline constexpr std::string_view filename_lookup_name = "//";

inline constexpr std::uint8_t header_terminator[2] = {0x60, 0x0A};

inline constexpr std::uint8_t padding_byte = '\n';

} // namespace ar_lib_reader::detail
