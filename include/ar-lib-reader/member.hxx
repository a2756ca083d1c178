#pragma once

#include <ar-lib-reader/byte-cursor.hxx>

#include <cstddef>
#include <cstdint>
#include <string>

namespace ar_lib_reader {

/**
 * @struct Member
 * @brief One entry of an archive, after light processing of its header.
 *
 * Mirrors `IMAGE_ARCHIVE_MEMBER_HEADER` from `winnt.h`. `date`, `mode` and
 * `size` are decoded from ASCII; `user_id` and `group_id` are kept as trimmed
 * text because `.lib` files usually leave them blank. The special `/` and `//`
 * members keep their marker as `name`.
 *
 * `content` is a view of exactly `size` bytes of the archive buffer. Copy it
 * before reading; the copy shares the buffer.
 */
struct Member {
  std::string name;
  std::uint64_t date = 0;
  std::string user_id;
  std::string group_id;
  std::uint64_t mode = 0;
  std::uint64_t size = 0;
  std::size_t header_offset = 0; ///< Absolute offset of the 60-byte header.
  ByteCursor content;
};

} // namespace ar_lib_reader
