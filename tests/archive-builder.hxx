#pragma once

#include <ar-lib-reader/byte-cursor.hxx>

#include <cstddef>
#include <cstdint>
#include <fmt/format.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ar_lib_reader::test_support {

/**
 * @brief Header field overrides for ArchiveBuilder::add().
 */
struct MemberFields {
  std::string date = "1700000000";
  std::string user_id;
  std::string group_id;
  std::string mode = "0";
  std::string size; ///< Empty means the real content size.
  std::string terminator = "`\n";
  char padding = '\n';
};

/**
 * @brief Assembles `ar` archives in memory for tests.
 *
 * Members are appended in order with a 60-byte header and a pad byte when the
 * position becomes odd. A symbol index is reserved with add_index() and its
 * offsets are filled in later with set_index_offsets(), once the headers it
 * points at have been placed.
 */
class ArchiveBuilder {
public:
  explicit ArchiveBuilder(std::string magic = "!<arch>\n")
      : data_(std::move(magic)) {}

  /**
   * @brief Append a member.
   * @return Offset of the member's header.
   */
  std::size_t add(std::string_view name_field, std::string_view content,
                  const MemberFields &fields = {}) {
    auto const offset = data_.size();
    auto const size =
        fields.size.empty() ? std::to_string(content.size()) : fields.size;
    data_ += fmt::format("{:<16}{:<12}{:<6}{:<6}{:<8}{:<10}", name_field,
                         fields.date, fields.user_id, fields.group_id,
                         fields.mode, size);
    data_ += fields.terminator;
    data_ += content;
    if (data_.size() % 2 != 0)
      data_ += fields.padding;
    return offset;
  }

  /**
   * @brief Append a `/` member sized for @p symbols, offsets zeroed.
   * @return Offset of the member's header.
   */
  std::size_t add_index(const std::vector<std::string> &symbols) {
    std::string content(4 + 4 * symbols.size(), '\0');
    put_big_endian(content, 0, static_cast<std::uint32_t>(symbols.size()));
    for (const auto &symbol : symbols) {
      content += symbol;
      content += '\0';
    }
    return add("/", content);
  }

  /// Fill in the offsets of the index whose header is at @p index_offset.
  void set_index_offsets(std::size_t index_offset,
                         const std::vector<std::size_t> &offsets) {
    auto const first = index_offset + 60 + 4;
    for (std::size_t i = 0; i < offsets.size(); ++i)
      put_big_endian(data_, first + 4 * i,
                     static_cast<std::uint32_t>(offsets[i]));
  }

  /// Overwrite the symbol count of the index at @p index_offset.
  void set_index_count(std::size_t index_offset, std::uint32_t count) {
    put_big_endian(data_, index_offset + 60, count);
  }

  /// Drop everything after the first @p size bytes.
  void truncate(std::size_t size) { data_.resize(size); }

  std::size_t size() const { return data_.size(); }

  std::vector<std::uint8_t> bytes() const {
    return std::vector<std::uint8_t>(data_.begin(), data_.end());
  }

  ByteCursor cursor() const { return ByteCursor(bytes()); }

private:
  static void put_big_endian(std::string &out, std::size_t at,
                             std::uint32_t value) {
    for (int shift = 24, i = 0; shift >= 0; shift -= 8, ++i)
      out[at + i] = static_cast<char>((value >> shift) & 0xFF);
  }

  std::string data_;
};

/// Bytes of @p cursor's whole view, as a string.
inline std::string to_string(const ByteCursor &cursor) {
  auto const view = cursor.view();
  return std::string(view.begin(), view.end());
}

} // namespace ar_lib_reader::test_support
