#include <ar-lib-reader/errors.hxx>
#include <ar-lib-reader/file-source.hxx>

#include <boost/iostreams/device/mapped_file.hpp>

#include <cstdint>
#include <fmt/format.h>
#include <ios>
#include <memory>
#include <system_error>

namespace ar_lib_reader {

ByteCursor read_file(const std::filesystem::path &path) {
  namespace io = boost::iostreams;

  std::error_code ec;
  auto const file_size = std::filesystem::file_size(path, ec);
  if (ec)
    throw SourceError(
        fmt::format("Cannot read \"{}\": {}", path.string(), ec.message()));

  // Mapping zero bytes fails on most platforms.
  if (file_size == 0)
    return ByteCursor();

  auto mapping = std::make_shared<io::mapped_file_source>();
  try {
    mapping->open(path.string());
  } catch (const std::ios_base::failure &e) {
    throw SourceError(
        fmt::format("Cannot map \"{}\": {}", path.string(), e.what()));
  }
  if (!mapping->is_open())
    throw SourceError(fmt::format("Cannot map \"{}\"", path.string()));

  auto const *bytes = reinterpret_cast<const std::uint8_t *>(mapping->data());
  auto const size = mapping->size();
  return ByteCursor(ByteCursor::Handle(std::move(mapping), bytes), size);
}

} // namespace ar_lib_reader
