#include "texbake/core/error.hpp"

namespace texbake {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::ConfigError:
      return "ConfigError";
    case ErrorCode::LayoutError:
      return "LayoutError";
    case ErrorCode::DuplicateOutput:
      return "DuplicateOutputError";
    case ErrorCode::PresetFormatError:
      return "PresetFormatError";
    case ErrorCode::RenderFailure:
      return "RenderFailure";
    case ErrorCode::IoError:
      return "IoError";
    case ErrorCode::MeshParseError:
      return "MeshParseError";
    case ErrorCode::NotFound:
      return "NotFound";
    case ErrorCode::UserCancelled:
      return "UserCancelled";
  }
  return "Unknown";
}

}  // namespace texbake
