/**
 * @file ar-lib-dump.cxx
 * @brief Print the members and symbol index of a Windows `.lib` archive.
 */

#include <ar-lib-reader/archive-reader.hxx>
#include <ar-lib-reader/errors.hxx>
#include <ar-lib-reader/import-symbols.hxx>

#include <boost/program_options.hpp>

#include <cstdio>
#include <exception>
#include <fmt/format.h>
#include <iostream>
#include <string>
#include <vector>

namespace po = boost::program_options;
namespace arl = ar_lib_reader;

namespace {

constexpr int exit_not_found = 1;
constexpr int exit_bad_archive = 2;
constexpr int exit_usage = 64;

void print_diagnostic(const arl::Diagnostic &diagnostic) {
  fmt::print(stderr, "warning: {} at offset {}", to_string(diagnostic.kind),
             diagnostic.offset);
  if (!diagnostic.expected.empty() || !diagnostic.found.empty())
    fmt::print(stderr, " (expected \"{}\", found \"{}\")", diagnostic.expected,
               diagnostic.found);
  fmt::print(stderr, "\n");
}

void print_members(const arl::ArchiveReader &reader) {
  fmt::print("{:>10}  {:>10}  {:>8}  {:>10}  {}\n", "offset", "size", "mode",
             "date", "name");
  for (const auto &[name, member] : reader.members())
    fmt::print("{:>10}  {:>10}  {:>8}  {:>10}  {}\n", member.header_offset,
               member.size, member.mode, member.date, name);
}

void print_symbols(const arl::ArchiveReader &reader, bool hide_bookkeeping) {
  for (const auto &[symbol, member] : reader.symbol_member_map()) {
    if (hide_bookkeeping && arl::is_import_bookkeeping_symbol(symbol))
      continue;
    fmt::print("{}  {}\n", symbol, member);
  }
}

} // unnamed namespace

int main(int argc, char **argv) {
  std::string archive;
  std::vector<std::string> lookups;

  po::options_description visible("Options");
  // clang-format off
  visible.add_options()
      ("help,h", "show this help")
      ("members,m", "list archive members")
      ("symbols,s", "list symbol -> member pairs")
      ("lookup,l", po::value<std::vector<std::string>>(&lookups),
       "print the member defining SYMBOL (repeatable)")
      ("hide-bookkeeping", "omit import descriptor and thunk symbols");
  // clang-format on

  po::options_description hidden;
  hidden.add_options()("archive", po::value<std::string>(&archive));

  po::options_description all;
  all.add(visible).add(hidden);

  po::positional_options_description positional;
  positional.add("archive", 1);

  po::variables_map options;
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(all)
                  .positional(positional)
                  .run(),
              options);
    po::notify(options);
  } catch (const po::error &e) {
    fmt::print(stderr, "error: {}\n", e.what());
    return exit_usage;
  }

  if (options.count("help")) {
    std::cout << "usage: ar-lib-dump [options] ARCHIVE\n" << visible;
    return 0;
  }
  if (archive.empty()) {
    fmt::print(stderr, "error: no archive given\n");
    return exit_usage;
  }

  arl::ArchiveReader reader(print_diagnostic);
  try {
    reader.load_file(archive);
  } catch (const arl::SourceError &e) {
    fmt::print(stderr, "error: {}\n", e.what());
    return exit_bad_archive;
  } catch (const std::exception &e) {
    fmt::print(stderr, "error: {}: {}\n", archive, e.what());
    return exit_bad_archive;
  }

  bool const list_members = options.count("members") != 0;
  bool const list_symbols = options.count("symbols") != 0;

  if (list_members)
    print_members(reader);
  if (list_symbols)
    print_symbols(reader, options.count("hide-bookkeeping") != 0);

  int status = 0;
  for (const auto &symbol : lookups) {
    if (auto member = reader.member_for_symbol(symbol)) {
      fmt::print("{}  {}\n", symbol, member->name);
    } else {
      fmt::print(stderr, "{}: not found\n", symbol);
      status = exit_not_found;
    }
  }

  if (!list_members && !list_symbols && lookups.empty())
    fmt::print("{}: {} members, {} symbols\n", archive,
               reader.members().size(), reader.symbol_member_map().size());

  return status;
}
