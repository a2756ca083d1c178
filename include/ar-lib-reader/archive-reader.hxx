/**
 * @file archive-reader.hxx
 * @brief Reader for the `ar` container used by Windows `.lib` files.
 */

#pragma once

#include <ar-lib-reader/byte-cursor.hxx>
#include <ar-lib-reader/diagnostic.hxx>
#include <ar-lib-reader/member.hxx>

#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace ar_lib_reader {

/**
 * @class ArchiveReader
 * @brief Catalogs the members of a `.lib` archive and indexes its symbols.
 *
 * A `.lib` file is an `ar` archive. The first member, named `/`, is the symbol
 * index mapping symbol names to the header offset of the member defining
 * them. A second `/` member carrying the same information in another order is
 * skipped. An optional `//` member holds long member names. Every other member
 * is an object file (COFF, not interpreted here).
 *
 * The whole archive must be resident in one buffer. Member contents share
 * that buffer, so a copied Member stays valid after the reader is gone.
 *
 * @code{.cpp}
 * ar_lib_reader::ArchiveReader reader;
 * reader.load_file("user32.lib");
 * if (auto member = reader.member_for_symbol("__imp_MessageBoxW"))
 *   consume_coff(member->content.view());
 * @endcode
 *
 * @note One instance is not safe for concurrent load() calls. Distinct
 * instances share nothing and may run in parallel.
 */
class ArchiveReader {
public:
  /** @enum State Progress of the parse; stays put when load() throws. */
  enum class State {
    ExpectMagic,
    ExpectFirstIndex,
    CatalogMembers,
    ParseSymbolIndex,
    Done
  };

  /// Member name to member, sorted by name.
  using MemberMap = std::map<std::string, Member, std::less<>>;
  /// Symbol name to the name of the member defining it.
  using SymbolMap = std::map<std::string, std::string, std::less<>>;

  /**
   * @brief Construct an empty reader.
   *
   * @param sink Optional receiver of non-fatal diagnostics. Diagnostics are
   * also kept in diagnostics() whether or not a sink is given.
   */
  explicit ArchiveReader(DiagnosticSink sink = {});

  /**
   * @brief Construct a reader and load @p data immediately.
   */
  explicit ArchiveReader(ByteCursor data, DiagnosticSink sink = {});

  /**
   * @brief Parse a whole archive.
   *
   * Prior state is cleared first. On success members() and
   * symbol_member_map() are fully populated and consistent: every symbol
   * maps to a cataloged member.
   *
   * @param data Cursor over the archive, read from its current position.
   * @throws ArchiveReadError on a corrupt or unsupported archive.
   * @throws BufferRangeError when a required field runs past the data.
   * @throws FormatError when a header field cannot be decoded.
   *
   * When an exception escapes, members() and symbol_member_map() are empty;
   * diagnostics() holds what was recorded before the failure.
   */
  void load(ByteCursor data);

  /**
   * @brief Map the file at @p path and load it.
   *
   * @throws SourceError when the file cannot be read, plus anything load()
   * throws.
   */
  void load_file(const std::filesystem::path &path);

  /// Drop all members, symbols and diagnostics.
  void reset();

  const MemberMap &members() const noexcept { return members_; }

  const SymbolMap &symbol_member_map() const noexcept { return symbols_; }

  const std::vector<Diagnostic> &diagnostics() const noexcept {
    return diagnostics_;
  }

  State state() const noexcept { return state_; }

  /// @return the member named @p name, or nullptr.
  const Member *find_member(std::string_view name) const;

  /// @return the member defining @p symbol, or nullptr.
  const Member *member_for_symbol(std::string_view symbol) const;

private:
  Member read_member(ByteCursor &stream, const Member *filename_member,
                     const MemberMap &members);
  std::string resolve_name(std::string raw_name,
                           const Member *filename_member) const;
  void report(Diagnostic diagnostic);

  DiagnosticSink sink_;
  MemberMap members_;
  SymbolMap symbols_;
  std::vector<Diagnostic> diagnostics_;
  State state_ = State::ExpectMagic;
};

} // namespace ar_lib_reader
