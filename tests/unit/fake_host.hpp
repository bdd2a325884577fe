#pragma once

#include <string>
#include <vector>

#include "texbake/routing/scoped_routing.hpp"

namespace texbake::test {

// Records every call; ApplyRouting fails for `fail_material`.
class RecordingHost : public MaterialGraphHost {
 public:
  tl::expected<void, Error> ApplyRouting(const RoutingInstruction& instr) override {
    if (instr.material_id == fail_material) {
      return tl::unexpected(Error{ErrorCode::RenderFailure, "cannot rewire " + instr.material_id});
    }
    calls.push_back("apply " + instr.material_id);
    ++active;
    return {};
  }
  void RestoreRouting(const RoutingInstruction& instr) override {
    calls.push_back("restore " + instr.material_id);
    --active;
  }
  tl::expected<void, Error> ApplyUvRemap(const UvRemap& remap) override {
    calls.push_back("remap " + remap.material_id);
    ++active;
    return {};
  }
  void RestoreUvRemap(const UvRemap& remap) override {
    calls.push_back("unmap " + remap.material_id);
    --active;
  }

  std::string fail_material;
  std::vector<std::string> calls;
  int active = 0;
};

}  // namespace texbake::test
