#include "texbake/routing/scoped_routing.hpp"

namespace texbake {

tl::expected<void, Error> ScopedRouting::Apply(const RoutingInstruction& instr) {
  auto r = host_.ApplyRouting(instr);
  if (!r) return r;
  applied_.push_back(Entry{false, instr, UvRemap{}});
  return {};
}

tl::expected<void, Error> ScopedRouting::Apply(const UvRemap& remap) {
  auto r = host_.ApplyUvRemap(remap);
  if (!r) return r;
  applied_.push_back(Entry{true, RoutingInstruction{}, remap});
  return {};
}

void ScopedRouting::Release() {
  while (!applied_.empty()) {
    const Entry& e = applied_.back();
    if (e.is_remap) {
      host_.RestoreUvRemap(e.remap);
    } else {
      host_.RestoreRouting(e.routing);
    }
    applied_.pop_back();
  }
}

}  // namespace texbake
