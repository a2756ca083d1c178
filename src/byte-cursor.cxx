#include <ar-lib-reader/byte-cursor.hxx>
#include <ar-lib-reader/detail/escape.hxx>
#include <ar-lib-reader/errors.hxx>

#include <algorithm>
#include <charconv>
#include <fmt/format.h>
#include <string_view>
#include <utility>

namespace ar_lib_reader {
namespace {

/**
 * @brief Check that a byte range is well-formed UTF-8.
 *
 * Rejects truncated sequences, stray continuation bytes, overlong encodings,
 * UTF-16 surrogates and code points above U+10FFFF.
 *
 * @param bytes Range to inspect.
 * @return true when every sequence in the range is valid.
 */
bool is_valid_utf8_impl(std::span<const std::uint8_t> bytes) {
  std::size_t i = 0;
  while (i < bytes.size()) {
    auto c = bytes[i];
    if (c < 0x80) {
      ++i;
      continue;
    }

    std::size_t extra;
    std::uint32_t code_point;
    std::uint32_t minimum;
    if ((c & 0xE0) == 0xC0) {
      extra = 1;
      code_point = c & 0x1F;
      minimum = 0x80;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2;
      code_point = c & 0x0F;
      minimum = 0x800;
    } else if ((c & 0xF8) == 0xF0) {
      extra = 3;
      code_point = c & 0x07;
      minimum = 0x10000;
    } else {
      return false;
    }

    if (bytes.size() - i <= extra)
      return false;
    for (std::size_t k = 1; k <= extra; ++k) {
      auto next = bytes[i + k];
      if ((next & 0xC0) != 0x80)
        return false;
      code_point = (code_point << 6) | (next & 0x3F);
    }

    if (code_point < minimum || code_point > 0x10FFFF ||
        (code_point >= 0xD800 && code_point <= 0xDFFF))
      return false;
    i += extra + 1;
  }
  return true;
}

} // unnamed namespace

ByteCursor::ByteCursor(std::vector<std::uint8_t> bytes) {
  auto owner = std::make_shared<std::vector<std::uint8_t>>(std::move(bytes));
  end_ = owner->size();
  // Alias the vector's storage so views keep the vector itself alive.
  data_ = Handle(owner, owner->data());
}

ByteCursor::ByteCursor(Handle data, std::size_t size)
    : data_(std::move(data)), end_(size) {}

ByteCursor::ByteCursor(Handle data, std::size_t begin, std::size_t end)
    : data_(std::move(data)), begin_(begin), end_(end) {}

void ByteCursor::seek(std::size_t position) {
  if (position > size())
    throw BufferRangeError(fmt::format(
        "Cannot seek to {} in a buffer of {} bytes", position, size()));
  cursor_ = position;
}

std::size_t
ByteCursor::start_position(std::optional<std::size_t> seek) const {
  if (!seek)
    return cursor_;
  if (*seek > size())
    throw BufferRangeError(fmt::format(
        "Cannot seek to {} in a buffer of {} bytes", *seek, size()));
  return *seek;
}

std::size_t
ByteCursor::checked_length(std::size_t from,
                           std::optional<std::size_t> length) const {
  auto const available = size() - from;
  if (!length)
    return available;
  if (*length > available)
    throw BufferRangeError(
        fmt::format("Insufficient data in buffer to return {} bytes "
                    "(position {}, {} remaining)",
                    *length, from, available));
  return *length;
}

std::span<const std::uint8_t> ByteCursor::view() const noexcept {
  if (!data_)
    return {};
  return {data_.get() + begin_, size()};
}

std::span<const std::uint8_t>
ByteCursor::read_bytes(std::optional<std::size_t> length,
                       std::optional<std::size_t> seek) {
  auto const from = start_position(seek);
  auto const count = checked_length(from, length);
  auto result = view().subspan(from, count);
  cursor_ = from + count;
  return result;
}

std::string ByteCursor::read_ascii(std::optional<std::size_t> length,
                                   std::optional<std::size_t> seek) {
  auto bytes = read_bytes(length, seek);
  if (!is_valid_utf8_impl(bytes))
    throw FormatError(fmt::format("Field is not valid UTF-8: \"{}\"",
                                  detail::escape_bytes(bytes)));
  return std::string(bytes.begin(), bytes.end());
}

std::uint64_t
ByteCursor::read_ascii_integer(std::optional<std::size_t> length,
                               std::optional<std::size_t> seek) {
  auto const text = read_ascii(length, seek);
  std::string_view digits = text;
  while (!digits.empty() && digits.front() == ' ')
    digits.remove_prefix(1);
  while (!digits.empty() && digits.back() == ' ')
    digits.remove_suffix(1);

  std::uint64_t value = 0;
  auto const [end, ec] =
      std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (digits.empty() || ec != std::errc{} ||
      end != digits.data() + digits.size())
    throw FormatError(
        fmt::format("Field is not a decimal integer: \"{}\"", text));
  return value;
}

std::uint32_t
ByteCursor::read_big_endian_dword(std::optional<std::size_t> seek) {
  auto const bytes = read_bytes(4, seek);
  std::uint32_t result = 0;
  for (auto b : bytes)
    result = (result << 8) | b;
  return result;
}

std::string ByteCursor::read_cstring(std::optional<std::size_t> seek) {
  auto const from = start_position(seek);
  if (from == size())
    throw BufferRangeError(fmt::format(
        "Unable to read a C string at {}: no more to read", from));

  auto const rest = view().subspan(from);
  auto const terminator = std::find(rest.begin(), rest.end(), 0);
  if (terminator == rest.end())
    throw BufferRangeError(fmt::format(
        "End of C string starting at {} not found within the buffer",
        from));

  auto const text_length =
      static_cast<std::size_t>(terminator - rest.begin());
  auto const text = rest.first(text_length);
  if (!is_valid_utf8_impl(text))
    throw FormatError(fmt::format("C string is not valid UTF-8: \"{}\"",
                                  detail::escape_bytes(text)));

  // Skip the terminator but leave it out of the result.
  cursor_ = from + text_length + 1;
  return std::string(text.begin(), text.end());
}

ByteCursor ByteCursor::read_sub_stream(std::optional<std::size_t> length,
                                       std::optional<std::size_t> seek) {
  auto const from = start_position(seek);
  auto const count = checked_length(from, length);
  auto const start = begin_ + from;
  cursor_ = from + count;
  return ByteCursor(data_, start, start + count);
}

ByteCursor ByteCursor::clone(bool reset) const {
  ByteCursor copy(data_, begin_, end_);
  if (!reset)
    copy.cursor_ = cursor_;
  return copy;
}

} // namespace ar_lib_reader
