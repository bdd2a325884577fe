#include "texbake/core/naming.hpp"

#include <cctype>

namespace texbake {
namespace {

bool IsSafe(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '-';
}

std::string FileName(const std::string& material, const std::string& channel,
                     const std::optional<int>& tile, NamingMode mode) {
  if (!tile) {
    const char* sep = mode == NamingMode::Mari ? "_" : ".";
    return material + sep + channel + ".png";
  }
  std::string t = std::to_string(*tile);
  switch (mode) {
    case NamingMode::Mari:
      return material + "_" + t + "_" + channel + ".png";
    case NamingMode::Mudbox:
      return material + "." + channel + "." + t + ".png";
    case NamingMode::Standard:
      break;
  }
  return material + "." + t + "." + channel + ".png";
}

}  // namespace

std::string SanitizeName(const std::string& name, const std::string& fallback) {
  if (name.empty()) return fallback;
  std::string out = name;
  for (char& c : out) {
    if (!IsSafe(c)) c = '_';
  }
  return out;
}

std::string BuildOutputPath(const NameRequest& request, const NamingScheme& scheme) {
  std::string object = SanitizeName(request.object, "Object");
  std::string material = SanitizeName(request.material, "Material");
  const ChannelInfo* info = LookupChannel(request.channel);
  std::string channel = info ? info->suffix : "unknown";

  std::string path;
  if (scheme.folder_by_object) path += object + "/";
  if (scheme.folder_by_material) path += material + "/";
  if (scheme.folder_by_resolution) path += ResolutionLabel(request.resolution) + "/";
  path += FileName(material, channel, request.tile, scheme.mode);
  return path;
}

}  // namespace texbake
