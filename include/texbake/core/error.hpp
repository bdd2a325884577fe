#pragma once

#include <string>

namespace texbake {

enum class ErrorCode {
  ConfigError,
  LayoutError,
  DuplicateOutput,
  PresetFormatError,
  RenderFailure,
  IoError,
  MeshParseError,
  NotFound,
  UserCancelled
};

struct Error {
  ErrorCode code;
  std::string message;
};

const char* ErrorCodeName(ErrorCode code);

}  // namespace texbake
