/**
 * @file byte-cursor.hxx
 * @brief Bounded, zero-copy reader over a shared immutable byte buffer.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace ar_lib_reader {

/**
 * @class ByteCursor
 * @brief A view over a shared byte buffer plus a read position.
 *
 * A ByteCursor is a (shared handle, begin, end) triple with a cursor relative
 * to `begin`. Reads advance the cursor. Sub-streams and clones share the
 * handle, so the root buffer stays alive as long as any view derived from it
 * and no bytes are ever copied.
 *
 * Every read taking an optional `length` consumes the rest of the view when
 * it is omitted. Every read taking an optional `seek` first repositions the
 * cursor to that absolute position within the view.
 *
 * Fixed-width reads are exact: a read asking for more bytes than remain
 * throws BufferRangeError and leaves the cursor untouched, even when a
 * `seek` was requested.
 */
class ByteCursor {
public:
  /// Shared read-only handle to the first byte of the root buffer.
  using Handle = std::shared_ptr<const std::uint8_t>;

  /**
   * @brief Construct an empty cursor (no buffer, nothing to read).
   */
  ByteCursor() = default;

  /**
   * @brief Take ownership of @p bytes and view all of them.
   */
  explicit ByteCursor(std::vector<std::uint8_t> bytes);

  /**
   * @brief View @p size bytes starting at @p data.
   *
   * @p data may be an aliasing shared_ptr whose control block owns some other
   * object (a file mapping, a container) holding the bytes.
   */
  ByteCursor(Handle data, std::size_t size);

  /**
   * @brief Read the next @p length bytes (or the rest of the view).
   *
   * @return A span borrowed from the shared buffer. It is valid while this
   * cursor, or any other view of the same buffer, is alive.
   * @throws BufferRangeError when fewer than @p length bytes remain.
   */
  std::span<const std::uint8_t>
  read_bytes(std::optional<std::size_t> length = std::nullopt,
             std::optional<std::size_t> seek = std::nullopt);

  /**
   * @brief Read bytes and decode them as UTF-8 text.
   *
   * @throws FormatError when the bytes are not valid UTF-8.
   */
  std::string read_ascii(std::optional<std::size_t> length = std::nullopt,
                         std::optional<std::size_t> seek = std::nullopt);

  /**
   * @brief Read a space-padded decimal field.
   *
   * Leading and trailing spaces are trimmed; the remainder must be a
   * non-empty run of decimal digits that fits in 64 bits.
   *
   * @throws FormatError on empty or non-numeric content.
   */
  std::uint64_t
  read_ascii_integer(std::optional<std::size_t> length = std::nullopt,
                     std::optional<std::size_t> seek = std::nullopt);

  /// Read 4 bytes as a big-endian unsigned integer.
  std::uint32_t
  read_big_endian_dword(std::optional<std::size_t> seek = std::nullopt);

  /**
   * @brief Read a NUL-terminated string and advance past the terminator.
   *
   * @throws BufferRangeError when nothing remains to be read or the view ends
   * before a zero byte is found.
   */
  std::string read_cstring(std::optional<std::size_t> seek = std::nullopt);

  /**
   * @brief Carve the next @p length bytes (or the rest) into a new cursor.
   *
   * The returned cursor starts at position 0 of its own view and shares this
   * cursor's buffer. This cursor advances past the carved range.
   */
  ByteCursor read_sub_stream(std::optional<std::size_t> length = std::nullopt,
                             std::optional<std::size_t> seek = std::nullopt);

  /**
   * @brief Move the cursor to @p position (relative to the view start).
   *
   * Seeking to size() is allowed and leaves nothing to read.
   *
   * @throws BufferRangeError when @p position lies past the end of the view.
   */
  void seek(std::size_t position);

  /**
   * @brief Independent cursor over the same view.
   *
   * @param reset When true the clone starts at position 0, otherwise at this
   * cursor's position.
   */
  ByteCursor clone(bool reset = false) const;

  bool more_to_read() const noexcept { return cursor_ < size(); }

  std::size_t position() const noexcept { return cursor_; }

  std::size_t size() const noexcept { return end_ - begin_; }

  std::size_t remaining() const noexcept { return size() - cursor_; }

  /// The whole view, regardless of the cursor position.
  std::span<const std::uint8_t> view() const noexcept;

private:
  ByteCursor(Handle data, std::size_t begin, std::size_t end);

  std::size_t start_position(std::optional<std::size_t> seek) const;
  std::size_t checked_length(std::size_t from,
                             std::optional<std::size_t> length) const;

  Handle data_;
  std::size_t begin_ = 0;
  std::size_t end_ = 0;
  std::size_t cursor_ = 0;
};

} // namespace ar_lib_reader
