#include <ar-lib-reader/archive-reader.hxx>
#include <ar-lib-reader/errors.hxx>
#include <ar-lib-reader/file-source.hxx>
#include <ar-lib-reader/import-symbols.hxx>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <map>
#include <optional>
#include <picosha2.h>
#include <string>
#include <vector>

namespace arl = ar_lib_reader;
namespace fs = std::filesystem;

/**
 * @brief Compute the SHA-256 digest of a member's content.
 *
 * Hashes the member's whole view; the member itself is not advanced.
 *
 * @param member Member whose content to hash.
 * @return std::string Hex-encoded SHA-256 digest.
 */
static std::string sha256sum(const arl::Member &member) {
  auto const bytes = member.content.view();
  std::vector<std::uint8_t> hash(picosha2::k_digest_size);
  picosha2::hash256(bytes.begin(), bytes.end(), hash.begin(), hash.end());
  return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

static fs::path asset_path(const std::string &name) {
  return fs::path(__FILE__).parent_path() / "assets" / name;
}

/**
 * @brief Parameters for a single archive asset.
 *
 * - name: file name under tests/assets
 * - member_hashes: expected SHA-256 of every regular member's content
 * - symbols: expected symbol -> member map
 * - diagnostics: expected diagnostic kinds, in order
 */
struct LibAssetTestCase {
  std::string name;
  std::map<std::string, std::string> member_hashes;
  std::map<std::string, std::string> symbols;
  std::vector<arl::DiagnosticKind> diagnostics;
};

/**
 * @brief Parameterized fixture loading `.lib` assets from disk through the
 * memory-mapped file source.
 */
class LibAssetTest : public ::testing::TestWithParam<LibAssetTestCase> {};

TEST_P(LibAssetTest, MembersMatchExpectedSHA256) {
  const auto &[name, member_hashes, symbols, diagnostics] = GetParam();

  const auto file_path = asset_path(name);
  ASSERT_TRUE(fs::exists(file_path));

  arl::ArchiveReader reader;
  reader.load_file(file_path);

  ASSERT_EQ(reader.members().size(), member_hashes.size());
  for (const auto &[member_name, expected_hash] : member_hashes) {
    const auto *member = reader.find_member(member_name);
    ASSERT_NE(member, nullptr) << member_name;
    const auto hash = sha256sum(*member);
    EXPECT_EQ(hash, expected_hash)
        << member_name << ": expected " << expected_hash << " but got "
        << hash;
  }
}

TEST_P(LibAssetTest, SymbolIndexMatches) {
  const auto &param = GetParam();

  arl::ArchiveReader reader;
  reader.load_file(asset_path(param.name));

  ASSERT_EQ(reader.symbol_member_map().size(), param.symbols.size());
  for (const auto &[symbol, member] : param.symbols) {
    auto it = reader.symbol_member_map().find(symbol);
    ASSERT_NE(it, reader.symbol_member_map().end()) << symbol;
    EXPECT_EQ(it->second, member) << symbol;
  }

  std::vector<arl::DiagnosticKind> kinds;
  for (const auto &diagnostic : reader.diagnostics())
    kinds.push_back(diagnostic.kind);
  EXPECT_EQ(kinds, param.diagnostics);
}

// -----------------------------
// 🧪 Test Case Definitions
// -----------------------------

INSTANTIATE_TEST_SUITE_P(
    LibAssets, LibAssetTest,
    ::testing::Values(
        LibAssetTestCase{
            .name = "static-lib.lib",
            .member_hashes =
                {{"main.obj", "43ad81de735de83564d0c2801921a6f2755e4bb1526de93"
                              "bc08d895cdeaeb1a6"},
                 {"compression_helpers.obj",
                  "9e78fc00c8399bb8d62c6b310cc59ca6b2092963f086c8b4d9ec2110"
                  "26f16264"},
                 {"string_table_builder.obj",
                  "ecebdadf8fc30e35102b721baccf488eb3664532d62cbc6feba31976"
                  "8950ac5a"},
                 {"util.obj", "d4b3995b28c1c67f1897e38f6f5861ff14433c6e211de36"
                              "35b2dc604a70a0cac"}},
            .symbols = {{"main", "main.obj"},
                        {"?compress@@YAXPEAX@Z", "compression_helpers.obj"},
                        {"?build_table@@YAHXZ", "string_table_builder.obj"},
                        {"util_init", "util.obj"},
                        {"util_fini", "util.obj"}},
            .diagnostics = {}},
        LibAssetTestCase{
            .name = "lenient.lib",
            .member_hashes =
                {{"first.obj", "0ec29eac322e441f9baa387faef6a11de5520995de38c7"
                               "ebc8e3ec17a9ff5f65"},
                 {"second.obj", "4c85a80a00e20dec0f82243f6dfb7616dc53db5253e0a"
                                "a76d9d698bffe2ccb07"}},
            .symbols = {{"first_fn", "first.obj"},
                        {"second_fn", "second.obj"}},
            .diagnostics = {arl::DiagnosticKind::BadPadding,
                            arl::DiagnosticKind::MissingSecondIndex}},
        LibAssetTestCase{
            .name = "import-lib.lib",
            .member_hashes =
                {{"user32_desc.obj",
                  "9cafe79a71bbef7d59f7a6a2ae3441a419fa938be7378906a6fc47e7"
                  "a778c746"},
                 {"user32_null.obj",
                  "62ab814d7f4789a583339613175d8a69f131da459b8ffc6088ade500"
                  "7a107ce2"},
                 {"u32_thunk.obj",
                  "8718ba965a2dc357c24711248295684d7c7684055d99e36a56c61fbc"
                  "9de10963"},
                 {"msgbox.obj", "c57cf105b0ef1f7258f0961580a6d4f6b7237df8d2c0"
                                "f087be07f555b0376eac"}},
            .symbols = {{"__IMPORT_DESCRIPTOR_user32", "user32_desc.obj"},
                        {"__NULL_IMPORT_DESCRIPTOR", "user32_null.obj"},
                        {"\x7fuser32_NULL_THUNK_DATA", "u32_thunk.obj"},
                        {"MessageBoxW", "msgbox.obj"},
                        {"__imp_MessageBoxW", "msgbox.obj"}},
            .diagnostics = {}}));

TEST(FileSource, MissingFileThrows) {
  EXPECT_THROW(arl::read_file(asset_path("does-not-exist.lib")),
               arl::SourceError);
}

TEST(FileSource, EmptyFileGivesEmptyCursor) {
  const auto path = fs::temp_directory_path() / "ar-lib-reader-empty.lib";
  { std::ofstream out(path, std::ios::binary | std::ios::trunc); }

  auto cursor = arl::read_file(path);
  EXPECT_EQ(cursor.size(), 0u);
  EXPECT_FALSE(cursor.more_to_read());

  arl::ArchiveReader reader;
  EXPECT_THROW(reader.load(cursor), arl::BufferRangeError);
  fs::remove(path);
}

TEST(FileSource, MappingOutlivesReader) {
  std::optional<arl::Member> kept;
  {
    arl::ArchiveReader reader;
    reader.load_file(asset_path("static-lib.lib"));
    kept = *reader.find_member("util.obj");
  }
  EXPECT_EQ(kept->content.size(), 84u);
  EXPECT_EQ(sha256sum(*kept), "d4b3995b28c1c67f1897e38f6f5861ff14433c6e211de36"
                              "35b2dc604a70a0cac");
}

TEST(ImportSymbols, RecognizesBookkeepingSymbols) {
  EXPECT_TRUE(arl::is_import_bookkeeping_symbol("__IMPORT_DESCRIPTOR_USER32"));
  EXPECT_TRUE(arl::is_import_bookkeeping_symbol("__NULL_IMPORT_DESCRIPTOR"));
  EXPECT_TRUE(
      arl::is_import_bookkeeping_symbol("\x7fUSER32_NULL_THUNK_DATA"));

  EXPECT_FALSE(arl::is_import_bookkeeping_symbol("__imp_MessageBoxW"));
  EXPECT_FALSE(arl::is_import_bookkeeping_symbol("MessageBoxW"));
  EXPECT_FALSE(arl::is_import_bookkeeping_symbol(""));
}
