#include "texbake/core/channel.hpp"

#include <algorithm>
#include <cctype>

namespace texbake {
namespace {

using G = ColorSpaceGroup;
using P = BakePass;

const std::vector<ChannelInfo>& Table() {
  static const std::vector<ChannelInfo> kChannels = {
      {ChannelKind::BaseColor, "BaseColor", "basecolor", "sRGB", true, false, G::Color, P::Emit,
       "Base Color"},
      {ChannelKind::Roughness, "Roughness", "roughness", "Non-Color", false, false, G::Data,
       P::Roughness, "Roughness"},
      {ChannelKind::Metallic, "Metallic", "metallic", "Non-Color", false, false, G::Data, P::Emit,
       "Metallic"},
      {ChannelKind::Normal, "Normal", "normal", "Non-Color", false, false, G::Normal, P::Normal,
       "Normal"},
      {ChannelKind::Subsurface, "Subsurface", "subsurface", "Non-Color", false, true, G::Data,
       P::Emit, "Subsurface"},
      {ChannelKind::Transmission, "Transmission", "transmission", "Non-Color", false, true,
       G::Data, P::Emit, "Transmission"},
      {ChannelKind::Emission, "Emission", "emission", "sRGB", false, true, G::Emission, P::Emit,
       "Emission"},
      {ChannelKind::Alpha, "Alpha", "alpha", "Non-Color", false, true, G::Data, P::Emit, "Alpha"},
      {ChannelKind::Specular, "Specular", "specular", "Non-Color", false, true, G::Data, P::Emit,
       "Specular"},
      {ChannelKind::Clearcoat, "Clearcoat", "clearcoat", "Non-Color", false, true, G::Data,
       P::Emit, "Clearcoat"},
      {ChannelKind::ClearcoatRoughness, "ClearcoatRoughness", "clearcoatroughness", "Non-Color",
       false, true, G::Data, P::Emit, "Clearcoat Roughness"},
      {ChannelKind::Sheen, "Sheen", "sheen", "Non-Color", false, true, G::Data, P::Emit, "Sheen"},
      {ChannelKind::Displacement, "Displacement", "displacement", "Non-Color", false, true,
       G::Data, P::Emit, ""},
      {ChannelKind::AmbientOcclusion, "AmbientOcclusion", "ao", "Non-Color", false, true, G::Data,
       P::AmbientOcclusion, ""},
      {ChannelKind::CustomShader, "CustomShader", "customshader", "sRGB", false, true, G::Data,
       P::Emit, ""},
  };
  return kChannels;
}

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

}  // namespace

const ChannelInfo* LookupChannel(ChannelKind kind) {
  const auto& table = Table();
  auto it = std::find_if(table.begin(), table.end(),
                         [kind](const ChannelInfo& info) { return info.kind == kind; });
  return it == table.end() ? nullptr : &*it;
}

const std::vector<ChannelInfo>& AllChannels() { return Table(); }

std::string ChannelName(ChannelKind kind) {
  const ChannelInfo* info = LookupChannel(kind);
  return info ? info->name : "Unknown";
}

tl::expected<ChannelKind, Error> ParseChannel(const std::string& name) {
  std::string key = Lower(name);
  for (const auto& info : Table()) {
    if (key == Lower(info.name) || key == info.suffix) {
      return info.kind;
    }
  }
  return tl::unexpected(Error{ErrorCode::ConfigError, "unknown channel '" + name + "'"});
}

const char* BakePassName(BakePass pass) {
  switch (pass) {
    case BakePass::Emit:
      return "EMIT";
    case BakePass::Roughness:
      return "ROUGHNESS";
    case BakePass::Normal:
      return "NORMAL";
    case BakePass::AmbientOcclusion:
      return "AO";
    case BakePass::Combined:
      return "COMBINED";
  }
  return "EMIT";
}

std::vector<ChannelKind> ChannelsForPreset(ChannelPreset preset) {
  switch (preset) {
    case ChannelPreset::Basic:
      return {ChannelKind::BaseColor, ChannelKind::Roughness, ChannelKind::Metallic,
              ChannelKind::Normal};
    case ChannelPreset::Full: {
      std::vector<ChannelKind> out;
      for (const auto& info : Table()) {
        if (info.kind != ChannelKind::CustomShader) out.push_back(info.kind);
      }
      return out;
    }
    case ChannelPreset::CustomShaderOnly:
      return {ChannelKind::CustomShader};
    case ChannelPreset::None:
      break;
  }
  return {};
}

}  // namespace texbake
