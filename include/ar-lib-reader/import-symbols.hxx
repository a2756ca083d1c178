#pragma once

#include <string_view>

namespace ar_lib_reader {

/**
 * @brief Whether @p symbol is linker bookkeeping rather than a real export.
 *
 * Import libraries carry one `__IMPORT_DESCRIPTOR_<dll>` symbol, a shared
 * `__NULL_IMPORT_DESCRIPTOR` and one `\x7f<dll>_NULL_THUNK_DATA` symbol per
 * DLL alongside the exported functions.
 */
bool is_import_bookkeeping_symbol(std::string_view symbol) noexcept;

} // namespace ar_lib_reader
