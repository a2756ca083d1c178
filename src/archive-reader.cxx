#include <ar-lib-reader/archive-reader.hxx>
#include <ar-lib-reader/detail/ar-header.hxx>
#include <ar-lib-reader/detail/escape.hxx>
#include <ar-lib-reader/errors.hxx>
#include <ar-lib-reader/file-source.hxx>

#include <algorithm>
#include <charconv>
#include <fmt/format.h>
#include <optional>
#include <unordered_map>
#include <utility>

// File format references:
// https://en.wikipedia.org/wiki/Ar_(Unix) ("Windows variant")
// https://www.unix.com/man-page/opensolaris/3head/ar.h/
// Matt Pietrek, "Under the Hood", MSJ April 1998

namespace ar_lib_reader {
namespace {

using detail::ArHeader;

/**
 * @brief Strip the space padding from the end of a header field.
 *
 * @param text Field text as read from the header.
 * @return std::string The field without trailing spaces; empty when the
 * field is all spaces.
 */
std::string trim_trailing_spaces_impl(std::string text) {
  auto const last = text.find_last_not_of(' ');
  text.erase(last == std::string::npos ? 0 : last + 1);
  return text;
}

/**
 * @brief Compare raw bytes against ASCII text.
 *
 * @param bytes Bytes read from the archive.
 * @param text Expected text.
 * @return true when both have the same length and the same bytes.
 */
bool equals_impl(std::span<const std::uint8_t> bytes, std::string_view text) {
  return std::equal(bytes.begin(), bytes.end(), text.begin(), text.end(),
                    [](std::uint8_t b, char c) {
                      return b == static_cast<std::uint8_t>(c);
                    });
}

/**
 * @brief Escape a name taken from the archive for an error message.
 *
 * Control and non-ASCII bytes are rendered as `\xNN`.
 *
 * @param text Name or field text.
 * @return std::string The escaped text.
 */
std::string escape_text_impl(std::string_view text) {
  return detail::escape_bytes(
      {reinterpret_cast<const std::uint8_t *>(text.data()), text.size()});
}

} // unnamed namespace

ArchiveReader::ArchiveReader(DiagnosticSink sink) : sink_(std::move(sink)) {}

ArchiveReader::ArchiveReader(ByteCursor data, DiagnosticSink sink)
    : sink_(std::move(sink)) {
  load(std::move(data));
}

void ArchiveReader::reset() {
  members_.clear();
  symbols_.clear();
  diagnostics_.clear();
  state_ = State::ExpectMagic;
}

const Member *ArchiveReader::find_member(std::string_view name) const {
  auto it = members_.find(name);
  return it != members_.end() ? &it->second : nullptr;
}

const Member *ArchiveReader::member_for_symbol(std::string_view symbol) const {
  auto it = symbols_.find(symbol);
  return it != symbols_.end() ? find_member(it->second) : nullptr;
}

void ArchiveReader::report(Diagnostic diagnostic) {
  diagnostics_.push_back(std::move(diagnostic));
  if (sink_)
    sink_(diagnostics_.back());
}

void ArchiveReader::load_file(const std::filesystem::path &path) {
  load(read_file(path));
}

/**
 * @brief Turn the trimmed 16-byte name field into a member name.
 *
 * `/` and `//` are returned untouched. `name/` is a short name. `/<n>` is a
 * long name stored NUL-terminated at offset n of the `//` member.
 */
std::string ArchiveReader::resolve_name(std::string raw_name,
                                        const Member *filename_member) const {
  if (raw_name == detail::symbol_index_name ||
      raw_name == detail::filename_lookup_name)
    return raw_name;

  if (raw_name.ends_with('/')) {
    raw_name.pop_back();
    return raw_name;
  }

  if (raw_name.starts_with('/')) {
    std::size_t offset = 0;
    auto const first = raw_name.data() + 1;
    auto const last = raw_name.data() + raw_name.size();
    auto const [end, ec] = std::from_chars(first, last, offset);
    if (first == last || ec != std::errc{} || end != last)
      throw ArchiveReadError(
          fmt::format("Filename has unexpected format: \"{}\"",
                      escape_text_impl(raw_name)));
    if (filename_member == nullptr)
      throw ArchiveReadError(
          fmt::format("Member's filename ({}) references nonexistent "
                      "filename lookup member",
                      escape_text_impl(raw_name)));
    if (offset >= filename_member->content.size())
      throw ArchiveReadError(fmt::format(
          "Member's filename ({}) points past the end of the {}-byte "
          "filename lookup member",
          escape_text_impl(raw_name), filename_member->content.size()));
    return filename_member->content.clone(true).read_cstring(offset);
  }

  throw ArchiveReadError(fmt::format("Filename has unexpected format: \"{}\"",
                                     escape_text_impl(raw_name)));
}

/**
 * @brief Read one header plus its content and trailing pad byte.
 *
 * @param stream Root cursor positioned at a header; its positions are
 * absolute archive offsets.
 * @param filename_member The `//` member seen so far, or nullptr.
 * @param members Members cataloged so far, to reject duplicate names.
 */
Member ArchiveReader::read_member(ByteCursor &stream,
                                  const Member *filename_member,
                                  const MemberMap &members) {
  Member member;
  member.header_offset = stream.position();

  member.name = resolve_name(
      trim_trailing_spaces_impl(stream.read_ascii(sizeof(ArHeader::name))),
      filename_member);
  if (member.name != detail::symbol_index_name &&
      member.name != detail::filename_lookup_name &&
      members.contains(member.name))
    throw ArchiveReadError(
        fmt::format("Filename appears in archive twice: \"{}\"",
                    escape_text_impl(member.name)));

  member.date = stream.read_ascii_integer(sizeof(ArHeader::date));
  member.user_id =
      trim_trailing_spaces_impl(stream.read_ascii(sizeof(ArHeader::user_id)));
  member.group_id =
      trim_trailing_spaces_impl(stream.read_ascii(sizeof(ArHeader::group_id)));
  member.mode = stream.read_ascii_integer(sizeof(ArHeader::mode));
  member.size = stream.read_ascii_integer(sizeof(ArHeader::size));

  auto const terminator_offset = stream.position();
  auto const terminator = stream.read_bytes(sizeof(ArHeader::terminator));
  if (!std::equal(terminator.begin(), terminator.end(),
                  std::begin(detail::header_terminator),
                  std::end(detail::header_terminator)))
    report({.kind = DiagnosticKind::HeaderTerminatorMismatch,
            .offset = terminator_offset,
            .expected = detail::escape_bytes(detail::header_terminator),
            .found = detail::escape_bytes(terminator)});

  if (member.size > stream.remaining())
    throw BufferRangeError(fmt::format(
        "Member \"{}\" at {} declares {} bytes but only {} remain",
        escape_text_impl(member.name), member.header_offset, member.size,
        stream.remaining()));
  member.content = stream.read_sub_stream(member.size);

  // Each header starts on an even offset; the declared size excludes the pad.
  if (stream.position() % 2 != 0) {
    auto const padding_offset = stream.position();
    if (!stream.more_to_read()) {
      report({.kind = DiagnosticKind::MissingPadding,
              .offset = padding_offset,
              .expected = detail::escape_bytes(
                  std::span(&detail::padding_byte, 1)),
              .found = {}});
    } else {
      auto const padding = stream.read_bytes(1);
      if (padding[0] != detail::padding_byte)
        report({.kind = DiagnosticKind::BadPadding,
                .offset = padding_offset,
                .expected = detail::escape_bytes(
                    std::span(&detail::padding_byte, 1)),
                .found = detail::escape_bytes(padding)});
    }
  }

  return member;
}

void ArchiveReader::load(ByteCursor data) {
  reset();

  MemberMap members;
  SymbolMap symbols;

  auto const magic = data.read_bytes(detail::archive_magic.size());
  if (!equals_impl(magic, detail::archive_magic))
    throw ArchiveReadError(
        fmt::format("Bad magic number: \"{}\" (expected \"{}\")",
                    detail::escape_bytes(magic),
                    escape_text_impl(detail::archive_magic)));

  state_ = State::ExpectFirstIndex;
  auto const index_member = read_member(data, nullptr, members);
  if (index_member.name != detail::symbol_index_name)
    throw ArchiveReadError(
        fmt::format("First member is unexpectedly named \"{}\"",
                    escape_text_impl(index_member.name)));

  // Catalog every member, remembering where each header started so the
  // symbol index offsets can be resolved afterwards.
  state_ = State::CatalogMembers;
  std::unordered_map<std::size_t, std::string> member_name_by_offset;
  std::optional<Member> filename_member;
  bool expecting_second_index = true;
  while (data.more_to_read()) {
    auto const header_offset = data.position();
    auto member = read_member(
        data, filename_member ? &*filename_member : nullptr, members);

    if (expecting_second_index) {
      expecting_second_index = false;
      // Same symbols, different order; nothing to gain from it.
      if (member.name == detail::symbol_index_name)
        continue;
      report({.kind = DiagnosticKind::MissingSecondIndex,
              .offset = header_offset,
              .expected = std::string(detail::symbol_index_name),
              .found = member.name});
    }

    if (member.name == detail::filename_lookup_name) {
      if (!filename_member)
        filename_member = std::move(member);
      else
        report({.kind = DiagnosticKind::DuplicateFilenameLookup,
                .offset = header_offset,
                .expected = {},
                .found = member.name});
      continue;
    }

    // Only a stray late `/` member can get here with a taken name.
    if (members.contains(member.name))
      throw ArchiveReadError(
          fmt::format("Filename appears in archive twice: \"{}\"",
                      escape_text_impl(member.name)));
    member_name_by_offset.emplace(header_offset, member.name);
    auto name = member.name;
    members.emplace(std::move(name), std::move(member));
  }

  // The index is a big-endian symbol count, that many big-endian header
  // offsets, then that many consecutive NUL-terminated symbol names.
  state_ = State::ParseSymbolIndex;
  auto index = index_member.content.clone(true);
  auto const symbol_count = index.read_big_endian_dword();
  auto offsets = index.read_sub_stream(std::size_t{4} * symbol_count);
  auto names = index.read_sub_stream();

  for (std::uint32_t i = 0; i < symbol_count; ++i) {
    auto const member_offset = offsets.read_big_endian_dword();
    auto symbol_name = names.read_cstring();

    auto const owner = member_name_by_offset.find(member_offset);
    if (owner == member_name_by_offset.end())
      throw ArchiveReadError(fmt::format(
          "Symbol \"{}\" refers to offset {}, where no member header starts",
          escape_text_impl(symbol_name), member_offset));

    auto const [existing, inserted] =
        symbols.emplace(std::move(symbol_name), owner->second);
    if (!inserted)
      throw ArchiveReadError(fmt::format(
          "Symbol \"{}\" is listed for both \"{}\" and \"{}\"; symbols "
          "spanning multiple members are not supported",
          escape_text_impl(existing->first),
          escape_text_impl(existing->second), escape_text_impl(owner->second)));
  }

  members_ = std::move(members);
  symbols_ = std::move(symbols);
  state_ = State::Done;
}

} // namespace ar_lib_reader
