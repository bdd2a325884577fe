#include "texbake/routing/shader_routing.hpp"

namespace texbake {
namespace {

SkippedTargetWarning Skip(const MaterialSlot& slot, ChannelKind channel,
                          MixedShaderStrategy strategy, std::string reason) {
  return SkippedTargetWarning{slot.object_id, slot.material_id, slot.material_name,
                              channel,        strategy,         std::move(reason)};
}

RoutingInstruction Base(const MaterialSlot& slot, MixedShaderStrategy strategy) {
  RoutingInstruction instr;
  instr.material_id = slot.material_id;
  instr.graph_handle = slot.graph_handle;
  instr.strategy = strategy;
  instr.kind = RouteKind::SurfaceOutput;
  instr.node = kMaterialOutputNode;
  instr.socket = kSurfaceSocket;
  return instr;
}

}  // namespace

const char* StrategyName(MixedShaderStrategy strategy) {
  switch (strategy) {
    case MixedShaderStrategy::FullSurface:
      return "SURFACE_OUTPUT";
    case MixedShaderStrategy::PrincipledOnly:
      return "PRINCIPLED_ONLY";
    case MixedShaderStrategy::CustomOnly:
      return "CUSTOM_ONLY";
  }
  return "SURFACE_OUTPUT";
}

tl::expected<RoutingInstruction, SkippedTargetWarning> PlanRoute(const MaterialSlot& slot,
                                                                 ChannelKind channel,
                                                                 MixedShaderStrategy strategy) {
  RoutingInstruction instr = Base(slot, strategy);
  switch (strategy) {
    case MixedShaderStrategy::FullSurface:
      return instr;

    case MixedShaderStrategy::PrincipledOnly: {
      if (slot.shader_class == ShaderClass::CustomOnly) {
        return tl::unexpected(
            Skip(slot, channel, strategy, "material has no Principled network to sample"));
      }
      if (channel == ChannelKind::CustomShader) {
        return tl::unexpected(
            Skip(slot, channel, strategy, "custom shader output excluded by Principled-only"));
      }
      // Displacement and AO have no BSDF input and sample the whole BSDF.
      const ChannelInfo* info = LookupChannel(channel);
      instr.kind = RouteKind::PrincipledSocket;
      instr.node = slot.principled_node;
      instr.socket = info && info->principled_socket[0] != '\0' ? info->principled_socket
                                                                : kBsdfSocket;
      return instr;
    }

    case MixedShaderStrategy::CustomOnly: {
      if (slot.shader_class == ShaderClass::PrincipledOnly) {
        return tl::unexpected(
            Skip(slot, channel, strategy, "material has no custom network to sample"));
      }
      if (slot.custom_output.empty()) {
        if (slot.shader_class == ShaderClass::CustomOnly) {
          // The whole surface is the custom network.
          return instr;
        }
        return tl::unexpected(
            Skip(slot, channel, strategy, "host reported no custom output socket"));
      }
      instr.kind = RouteKind::CustomOutput;
      auto dot = slot.custom_output.rfind('.');
      if (dot == std::string::npos) {
        instr.node = slot.custom_output;
        instr.socket = "Shader";
      } else {
        instr.node = slot.custom_output.substr(0, dot);
        instr.socket = slot.custom_output.substr(dot + 1);
      }
      return instr;
    }
  }
  return instr;
}

}  // namespace texbake
