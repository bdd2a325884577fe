#pragma once

#include <vector>

#include <tl/expected.hpp>

#include "texbake/core/error.hpp"
#include "texbake/layout/atlas.hpp"
#include "texbake/routing/shader_routing.hpp"

namespace texbake {

// Host side of the live material graph. Restore calls must not fail.
class MaterialGraphHost {
 public:
  virtual ~MaterialGraphHost() = default;

  virtual tl::expected<void, Error> ApplyRouting(const RoutingInstruction& instr) = 0;
  virtual void RestoreRouting(const RoutingInstruction& instr) = 0;

  virtual tl::expected<void, Error> ApplyUvRemap(const UvRemap& remap) = 0;
  virtual void RestoreUvRemap(const UvRemap& remap) = 0;
};

// Rewires on Apply and restores everything applied, in reverse order, on
// Release or destruction.
class ScopedRouting {
 public:
  explicit ScopedRouting(MaterialGraphHost& host) : host_(host) {}
  ~ScopedRouting() { Release(); }

  ScopedRouting(const ScopedRouting&) = delete;
  ScopedRouting& operator=(const ScopedRouting&) = delete;

  tl::expected<void, Error> Apply(const RoutingInstruction& instr);
  tl::expected<void, Error> Apply(const UvRemap& remap);

  void Release();

  size_t active() const { return applied_.size(); }

 private:
  struct Entry {
    bool is_remap;
    RoutingInstruction routing;
    UvRemap remap;
  };

  MaterialGraphHost& host_;
  std::vector<Entry> applied_;
};

}  // namespace texbake
