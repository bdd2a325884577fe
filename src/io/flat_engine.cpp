#include "texbake/io/flat_engine.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <system_error>

#include <OpenImageIO/imageio.h>
#include <spdlog/spdlog.h>

namespace texbake {
namespace {

unsigned char ToByte(float v) {
  return static_cast<unsigned char>(std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f));
}

}  // namespace

std::array<float, 4> FlatChannelValue(ChannelKind kind) {
  switch (kind) {
    case ChannelKind::BaseColor:
      return {0.8f, 0.8f, 0.8f, 1.0f};
    case ChannelKind::Roughness:
      return {0.5f, 0.5f, 0.5f, 1.0f};
    case ChannelKind::Normal:
      return {0.5f, 0.5f, 1.0f, 1.0f};
    case ChannelKind::Specular:
      return {0.5f, 0.5f, 0.5f, 1.0f};
    case ChannelKind::ClearcoatRoughness:
      return {0.03f, 0.03f, 0.03f, 1.0f};
    case ChannelKind::Alpha:
    case ChannelKind::AmbientOcclusion:
      return {1.0f, 1.0f, 1.0f, 1.0f};
    case ChannelKind::Displacement:
      return {0.5f, 0.5f, 0.5f, 1.0f};
    default:
      return {0.0f, 0.0f, 0.0f, 1.0f};
  }
}

tl::expected<void, Error> FlatValueEngine::Render(const BakeTarget& target) {
  using namespace OIIO;
  std::filesystem::path path(target.output_path);
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      return tl::unexpected(Error{ErrorCode::IoError, "cannot create " +
                                                          path.parent_path().string() + ": " +
                                                          ec.message()});
    }
  }

  const int width = target.resolution.width;
  const int height = target.resolution.height;
  const int channels = 4;
  ImageSpec spec(width, height, channels, TypeDesc::UINT8);
  spec.attribute("oiio:ColorSpace", target.colorspace);

  auto out = ImageOutput::create(path.string());
  if (!out) {
    return tl::unexpected(Error{ErrorCode::IoError, "no image writer for " + path.string()});
  }
  if (!out->open(path.string(), spec)) {
    return tl::unexpected(Error{ErrorCode::IoError, out->geterror()});
  }
  auto value = FlatChannelValue(target.channel);
  std::vector<unsigned char> row(static_cast<size_t>(width) * channels);
  for (int x = 0; x < width; ++x) {
    for (int c = 0; c < channels; ++c) row[x * channels + c] = ToByte(value[c]);
  }
  for (int y = 0; y < height; ++y) {
    if (!out->write_scanline(y, 0, TypeDesc::UINT8, row.data())) {
      std::string err = out->geterror();
      out->close();
      return tl::unexpected(Error{ErrorCode::RenderFailure, err});
    }
  }
  if (!out->close()) {
    return tl::unexpected(Error{ErrorCode::IoError, out->geterror()});
  }
  ++rendered_;
  return {};
}

tl::expected<void, Error> LoggingGraphHost::ApplyRouting(const RoutingInstruction& instr) {
  events_.push_back("route " + instr.material_id + " " + instr.node + "." + instr.socket);
  spdlog::debug("routing {} to {}.{}", instr.material_id, instr.node, instr.socket);
  ++active_;
  return {};
}

void LoggingGraphHost::RestoreRouting(const RoutingInstruction& instr) {
  events_.push_back("restore " + instr.material_id);
  --active_;
}

tl::expected<void, Error> LoggingGraphHost::ApplyUvRemap(const UvRemap& remap) {
  events_.push_back("remap " + remap.object_id + " " + remap.material_id);
  ++active_;
  return {};
}

void LoggingGraphHost::RestoreUvRemap(const UvRemap& remap) {
  events_.push_back("unmap " + remap.object_id + " " + remap.material_id);
  --active_;
}

}  // namespace texbake
