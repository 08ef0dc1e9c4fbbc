// Generation error helpers.

#include "core/generation_error.h"

#include <utility>

namespace cavewalk {

const char* errorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None: return "none";
    case ErrorKind::InvalidConfig: return "invalid_config";
    case ErrorKind::OutOfBounds: return "out_of_bounds";
    case ErrorKind::Stuck: return "stuck";
  }
  return "unknown";
}

GenerationError GenerationError::make(ErrorKind kind, size_t step, std::string parameter,
                                      std::string message) {
  GenerationError error;
  error.kind = kind;
  error.step = step;
  error.parameter = std::move(parameter);
  error.message = std::move(message);
  return error;
}

std::string GenerationError::describe() const {
  if (ok()) return "ok";
  std::string text = errorKindToString(kind);
  text += " at step " + std::to_string(step);
  if (!parameter.empty()) text += " [" + parameter + "]";
  if (!message.empty()) text += ": " + message;
  return text;
}

}  // namespace cavewalk
