/**
 * @file errors.hxx
 * @brief Exception types thrown by the archive reader and its collaborators.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace ar_lib_reader {

/**
 * @brief A read or seek went past the end of a ByteCursor view.
 *
 * Thrown for short fixed-width reads, out-of-range seeks and C strings that
 * run off the end of the view without a terminator.
 */
class BufferRangeError : public std::out_of_range {
public:
  explicit BufferRangeError(const std::string &what_arg)
      : std::out_of_range(what_arg) {}
};

/**
 * @brief A field had the right size but its bytes could not be decoded
 * (invalid UTF-8, non-numeric integer field).
 */
class FormatError : public std::runtime_error {
public:
  explicit FormatError(const std::string &what_arg)
      : std::runtime_error(what_arg) {}
};

/**
 * @brief The archive is structurally corrupt or uses an unsupported layout.
 *
 * The message names what was expected and what was found.
 */
class ArchiveReadError : public std::runtime_error {
public:
  explicit ArchiveReadError(const std::string &what_arg)
      : std::runtime_error(what_arg) {}
};

/// The input file could not be opened or mapped.
class SourceError : public std::runtime_error {
public:
  explicit SourceError(const std::string &what_arg)
      : std::runtime_error(what_arg) {}
};

} // namespace ar_lib_reader
