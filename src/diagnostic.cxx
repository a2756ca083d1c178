#include <ar-lib-reader/diagnostic.hxx>

namespace ar_lib_reader {

std::string_view to_string(DiagnosticKind kind) noexcept {
  switch (kind) {
  case DiagnosticKind::HeaderTerminatorMismatch:
    return "header-terminator-mismatch";
  case DiagnosticKind::BadPadding:
    return "bad-padding";
  case DiagnosticKind::MissingPadding:
    return "missing-padding";
  case DiagnosticKind::MissingSecondIndex:
    return "missing-second-index";
  case DiagnosticKind::DuplicateFilenameLookup:
    return "duplicate-filename-lookup";
  }
  return "unknown";
}

} // namespace ar_lib_reader
