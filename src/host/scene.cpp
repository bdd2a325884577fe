#include "texbake/host/scene.hpp"

namespace texbake {

const char* ShaderClassName(ShaderClass c) {
  switch (c) {
    case ShaderClass::PrincipledOnly:
      return "PRINCIPLED_ONLY";
    case ShaderClass::CustomOnly:
      return "CUSTOM_ONLY";
    case ShaderClass::Mixed:
      return "MIXED";
  }
  return "PRINCIPLED_ONLY";
}

tl::expected<ShaderClass, Error> ParseShaderClass(const std::string& name) {
  for (ShaderClass c : {ShaderClass::PrincipledOnly, ShaderClass::CustomOnly, ShaderClass::Mixed}) {
    if (name == ShaderClassName(c)) return c;
  }
  return tl::unexpected(Error{ErrorCode::ConfigError, "unknown shader class '" + name + "'"});
}

}  // namespace texbake
