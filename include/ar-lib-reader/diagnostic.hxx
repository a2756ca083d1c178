/**
 * @file diagnostic.hxx
 * @brief Structured records for non-fatal archive anomalies.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace ar_lib_reader {

/**
 * @enum DiagnosticKind
 * @brief The anomalies the reader tolerates.
 */
enum class DiagnosticKind {
  HeaderTerminatorMismatch, /**< @brief Header did not end with "`\n". */
  BadPadding,               /**< @brief Alignment byte was not '\n'. */
  MissingPadding,     /**< @brief Archive ended where a pad byte belonged. */
  MissingSecondIndex, /**< @brief No second `/` member after the first. */
  DuplicateFilenameLookup, /**< @brief Extra `//` member, ignored. */
};

/**
 * @struct Diagnostic
 * @brief One anomaly, located by absolute archive offset.
 *
 * `expected` and `found` hold the raw bytes (escaped) or member names
 * involved; either may be empty when it carries no information.
 */
struct Diagnostic {
  DiagnosticKind kind;
  std::size_t offset = 0;
  std::string expected;
  std::string found;

  bool operator==(const Diagnostic &) const = default;
};

/// Caller-supplied receiver of diagnostics, invoked in archive order.
using DiagnosticSink = std::function<void(const Diagnostic &)>;

/**
 * @brief Stable identifier for @p kind, e.g. "bad-padding".
 */
std::string_view to_string(DiagnosticKind kind) noexcept;

} // namespace ar_lib_reader
