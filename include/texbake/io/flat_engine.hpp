#pragma once

#include <array>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include "texbake/core/error.hpp"
#include "texbake/exec/executor.hpp"

namespace texbake {

// Neutral RGBA value a channel bakes to when the material is left at defaults.
std::array<float, 4> FlatChannelValue(ChannelKind kind);

// Reference engine without a rasterizer: writes each target as a constant
// image at its resolution through OpenImageIO, tagged with its color space.
class FlatValueEngine : public RenderEngine {
 public:
  tl::expected<void, Error> Render(const BakeTarget& target) override;

  size_t rendered() const { return rendered_; }

 private:
  size_t rendered_ = 0;
};

// Graph host for runs outside a DCC: records every rewire and restore.
class LoggingGraphHost : public MaterialGraphHost {
 public:
  tl::expected<void, Error> ApplyRouting(const RoutingInstruction& instr) override;
  void RestoreRouting(const RoutingInstruction& instr) override;
  tl::expected<void, Error> ApplyUvRemap(const UvRemap& remap) override;
  void RestoreUvRemap(const UvRemap& remap) override;

  const std::vector<std::string>& events() const { return events_; }
  int active() const { return active_; }

 private:
  std::vector<std::string> events_;
  int active_ = 0;
};

}  // namespace texbake
