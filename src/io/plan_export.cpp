#include "texbake/io/plan_export.hpp"

#include <fstream>

#include <nlohmann/json.hpp>

namespace texbake {
namespace {

using nlohmann::json;

const char* RouteKindName(RouteKind kind) {
  switch (kind) {
    case RouteKind::SurfaceOutput:
      return "surface_output";
    case RouteKind::PrincipledSocket:
      return "principled_socket";
    case RouteKind::CustomOutput:
      return "custom_output";
  }
  return "surface_output";
}

json Vec2(const Eigen::Vector2d& v) { return json::array({v.x(), v.y()}); }

json TargetJson(const BakeTarget& t) {
  json jt;
  jt["object"] = t.object_name;
  jt["atlas"] = t.is_atlas;
  for (const auto& m : t.materials) jt["materials"].push_back(m.material_name);
  jt["channel"] = ChannelName(t.channel);
  jt["resolution"] = {t.resolution.width, t.resolution.height};
  if (t.tile) {
    jt["udim_tile"] = t.tile->id;
  } else {
    jt["udim_tile"] = nullptr;
  }
  jt["colorspace"] = t.colorspace;
  jt["path"] = t.output_path;
  jt["lighting"] = LightingModeName(t.lighting);
  jt["pass"] = BakePassName(t.pass);
  jt["margin"] = t.margin;
  jt["routing"] = json::array();
  for (const auto& r : t.routing) {
    jt["routing"].push_back({{"material", r.material_id},
                             {"kind", RouteKindName(r.kind)},
                             {"node", r.node},
                             {"socket", r.socket},
                             {"strategy", StrategyName(r.strategy)}});
  }
  return jt;
}

}  // namespace

std::string PlanToJson(const Plan& plan) {
  json j;
  j["resolutions"] = json::array();
  for (const auto& r : plan.resolutions) j["resolutions"].push_back(ResolutionLabel(r));
  j["targets"] = json::array();
  for (const auto& t : plan.targets) j["targets"].push_back(TargetJson(t));
  j["warnings"] = json::array();
  for (const auto& w : plan.warnings) {
    j["warnings"].push_back({{"object", w.object_id},
                             {"material", w.material_name},
                             {"channel", ChannelName(w.channel)},
                             {"strategy", StrategyName(w.strategy)},
                             {"reason", w.reason}});
  }
  j["atlases"] = json::array();
  for (const auto& a : plan.atlases) {
    json ja;
    ja["object"] = a.object_id;
    ja["rows"] = a.layout.rows;
    ja["cols"] = a.layout.cols;
    ja["padding"] = a.layout.padding;
    for (const auto& p : a.layout.placements) {
      ja["placements"].push_back({{"material", p.slot.material_name},
                                  {"uv_offset", Vec2(p.uv_offset)},
                                  {"uv_scale", Vec2(p.uv_scale)}});
    }
    j["atlases"].push_back(ja);
  }
  j["material_rebuild"] = json::array();
  for (const auto& m : plan.rebuilds) {
    json jm;
    jm["object"] = m.object_id;
    jm["material"] = m.material_name;
    jm["resolution"] = {m.resolution.width, m.resolution.height};
    jm["inputs"] = json::array();
    for (const auto& in : m.inputs) {
      jm["inputs"].push_back({{"channel", ChannelName(in.channel)},
                              {"socket", in.socket},
                              {"colorspace", in.colorspace},
                              {"images", in.image_paths}});
    }
    j["material_rebuild"].push_back(jm);
  }
  return j.dump(2);
}

tl::expected<void, Error> WritePlanJson(const Plan& plan,
                                        const std::filesystem::path& json_path) {
  std::ofstream os(json_path);
  if (!os) {
    return tl::unexpected(Error{ErrorCode::IoError, "failed to write plan json"});
  }
  os << PlanToJson(plan);
  return {};
}

}  // namespace texbake
