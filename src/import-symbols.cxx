#include <ar-lib-reader/import-symbols.hxx>

namespace ar_lib_reader {

bool is_import_bookkeeping_symbol(std::string_view symbol) noexcept {
  if (symbol.starts_with("__IMPORT_DESCRIPTOR_"))
    return true;
  if (symbol.starts_with("__NULL_IMPORT_DESCRIPTOR"))
    return true;
  return symbol.find("_NULL_THUNK_DATA") != std::string_view::npos;
}

} // namespace ar_lib_reader
