// Error conditions surfaced by a generation run.

#ifndef CAVEWALK_CORE_GENERATION_ERROR_H
#define CAVEWALK_CORE_GENERATION_ERROR_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace cavewalk {

/// @brief Fatal error categories of a run.
///
/// Skip rejections are not listed here: they are a normal outcome handled
/// inside post-processing (see SkipVerdict).
enum class ErrorKind : uint8_t {
  None,
  InvalidConfig,  ///< Profile or map skeleton failed validation.
  OutOfBounds,    ///< A walker step would leave the grid.
  Stuck           ///< Lock delay exceeded pos_lock_max_delay.
};

/// @brief Convert ErrorKind to a short string.
const char* errorKindToString(ErrorKind kind);

/// @brief A fatal run error with enough context to diagnose it.
struct GenerationError {
  ErrorKind kind = ErrorKind::None;
  size_t step = 0;         ///< Walker step index at which the error occurred.
  std::string parameter;   ///< Offending profile parameter, if any.
  std::string message;     ///< Human-readable description.

  /// @brief True when no error is recorded.
  bool ok() const { return kind == ErrorKind::None; }

  /// @brief Build an error value.
  static GenerationError make(ErrorKind kind, size_t step, std::string parameter,
                              std::string message);

  /// @brief One-line description: "<kind> at step N [parameter]: message".
  std::string describe() const;
};

}  // namespace cavewalk

#endif  // CAVEWALK_CORE_GENERATION_ERROR_H
