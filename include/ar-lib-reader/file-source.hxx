#pragma once

#include <ar-lib-reader/byte-cursor.hxx>

#include <filesystem>

namespace ar_lib_reader {

/**
 * @brief Map the whole file at @p path read-only.
 *
 * Uses Boost.Iostreams' mapped_file_source. The returned cursor owns the
 * mapping through its shared handle, so the file stays mapped until the last
 * view derived from it (including Member contents) is destroyed. An empty
 * file yields an empty cursor.
 *
 * @throws SourceError when the file cannot be opened or mapped.
 */
ByteCursor read_file(const std::filesystem::path &path);

} // namespace ar_lib_reader
