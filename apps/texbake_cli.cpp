#include <atomic>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include "texbake/api.hpp"
#include "texbake/io/flat_engine.hpp"
#include "texbake/io/plan_export.hpp"
#include "texbake/io/scene_import.hpp"
#include "texbake/preset/preset.hpp"
#include "texbake/preset/preset_store.hpp"

namespace {

std::atomic<bool> g_cancel{false};

void OnInterrupt(int) { g_cancel.store(true); }

struct JobOptions {
  std::string scene_json;
  std::string mesh_path;
  std::string config_path;
  std::string preset_name;
  std::string output_dir;
};

void AddJobOptions(CLI::App* cmd, JobOptions& o) {
  auto* scene = cmd->add_option("--scene", o.scene_json, "Scene description JSON");
  auto* mesh = cmd->add_option("--mesh", o.mesh_path, "Mesh file to import");
  scene->excludes(mesh);
  auto* config = cmd->add_option("--config", o.config_path, "Preset JSON file");
  auto* preset = cmd->add_option("--preset", o.preset_name, "Named preset in --preset-dir");
  config->excludes(preset);
  cmd->add_option("--output-dir", o.output_dir, "Override the output directory");
}

void Report(const texbake::Error& e) {
  spdlog::error("{}: {}", texbake::ErrorCodeName(e.code), e.message);
}

tl::expected<std::string, texbake::Error> ReadFile(const std::string& path) {
  std::ifstream is(path, std::ios::binary);
  if (!is) {
    return tl::unexpected(texbake::Error{texbake::ErrorCode::IoError, "cannot read " + path});
  }
  std::ostringstream ss;
  ss << is.rdbuf();
  return ss.str();
}

tl::expected<texbake::BakeConfig, texbake::Error> LoadConfig(const JobOptions& o,
                                                             const texbake::PresetStore& store) {
  texbake::BakeConfig config;
  if (!o.config_path.empty()) {
    auto text = ReadFile(o.config_path);
    if (!text) return tl::unexpected(text.error());
    auto preset = texbake::DecodePreset(*text);
    if (!preset) return tl::unexpected(preset.error());
    config = preset->config;
  } else if (!o.preset_name.empty()) {
    auto preset = texbake::LoadPreset(store, o.preset_name);
    if (!preset) return tl::unexpected(preset.error());
    config = preset->config;
  }
  if (!o.output_dir.empty()) config.output_directory = o.output_dir;
  return config;
}

tl::expected<texbake::HostScene, texbake::Error> LoadScene(const JobOptions& o) {
  if (!o.mesh_path.empty()) return texbake::ImportMesh(o.mesh_path);
  if (!o.scene_json.empty()) return texbake::LoadSceneJson(o.scene_json);
  return tl::unexpected(
      texbake::Error{texbake::ErrorCode::ConfigError, "one of --scene or --mesh is required"});
}

}  // namespace

int texbake_main(int argc, char** argv) {
  CLI::App app{"texbake"};
  app.fallthrough();
  app.add_flag_callback(
      "-v,--verbose", []() { spdlog::set_level(spdlog::level::debug); }, "Debug logging");
  std::string preset_dir = "presets";
  app.add_option("--preset-dir", preset_dir, "Directory holding named presets");

  app.add_flag_callback("--version", []() {
    std::cout << "texbake 0.1.0" << std::endl;
    std::exit(0);
  });

  int rc = 0;
  auto store = [&]() { return texbake::FilePresetStore(preset_dir); };

  // Plan subcommand
  auto* plan_cmd = app.add_subcommand("plan", "Plan bake targets without rendering");
  JobOptions plan_opts;
  AddJobOptions(plan_cmd, plan_opts);
  std::string plan_json;
  plan_cmd->add_option("--out", plan_json, "Write the plan to JSON");
  plan_cmd->callback([&]() {
    auto presets = store();
    auto config = LoadConfig(plan_opts, presets);
    if (!config) {
      Report(config.error());
      rc = 1;
      return;
    }
    auto scene = LoadScene(plan_opts);
    if (!scene) {
      Report(scene.error());
      rc = 1;
      return;
    }
    auto plan = texbake::PlanBake(*config, *scene);
    if (!plan) {
      Report(plan.error());
      rc = 1;
      return;
    }
    for (const auto& t : plan->targets) {
      std::cout << t.output_path << "  [" << t.colorspace << "]" << std::endl;
    }
    for (const auto& w : plan->warnings) {
      std::cout << "skipped " << w.material_name << " " << texbake::ChannelName(w.channel)
                << ": " << w.reason << std::endl;
    }
    if (!plan_json.empty()) {
      auto w = texbake::WritePlanJson(*plan, plan_json);
      if (!w) {
        Report(w.error());
        rc = 1;
      }
    }
  });

  // Bake subcommand
  auto* bake_cmd = app.add_subcommand("bake", "Plan and bake flat reference images");
  JobOptions bake_opts;
  AddJobOptions(bake_cmd, bake_opts);
  bake_cmd->callback([&]() {
    auto presets = store();
    auto config = LoadConfig(bake_opts, presets);
    if (!config) {
      Report(config.error());
      rc = 1;
      return;
    }
    auto scene = LoadScene(bake_opts);
    if (!scene) {
      Report(scene.error());
      rc = 1;
      return;
    }
    texbake::FlatValueEngine engine;
    texbake::LoggingGraphHost host;
    texbake::ExecuteOptions options;
    options.cancel = &g_cancel;
    std::signal(SIGINT, OnInterrupt);
    auto report = texbake::Bake(*config, *scene, engine, host, options);
    std::signal(SIGINT, SIG_DFL);
    if (!report) {
      Report(report.error());
      rc = 1;
      return;
    }
    std::cout << texbake::SummarizeReport(*report) << std::endl;
    if (report->cancelled) {
      Report(texbake::Error{texbake::ErrorCode::UserCancelled, "bake interrupted"});
      rc = 130;
    } else if (!report->ok()) {
      rc = 1;
    }
  });

  // Preset subcommands
  auto* preset_cmd = app.add_subcommand("preset", "Manage named presets");
  preset_cmd->require_subcommand(1);
  std::string preset_name;
  std::string preset_config;

  auto* save = preset_cmd->add_subcommand("save", "Store a preset file under a name");
  save->add_option("name", preset_name, "Preset name")->required();
  save->add_option("--config", preset_config, "Preset JSON file (defaults when omitted)");
  save->callback([&]() {
    texbake::BakeConfig config;
    if (!preset_config.empty()) {
      auto text = ReadFile(preset_config);
      if (!text) {
        Report(text.error());
        rc = 1;
        return;
      }
      auto decoded = texbake::DecodePreset(*text);
      if (!decoded) {
        Report(decoded.error());
        rc = 1;
        return;
      }
      config = decoded->config;
    }
    auto presets = store();
    auto saved = texbake::SavePreset(presets, preset_name, config);
    if (!saved) {
      Report(saved.error());
      rc = 1;
      return;
    }
    std::cout << presets.PathFor(*saved).string() << std::endl;
  });

  auto* load = preset_cmd->add_subcommand("load", "Print a stored preset");
  load->add_option("name", preset_name, "Preset name")->required();
  load->callback([&]() {
    auto presets = store();
    auto preset = texbake::LoadPreset(presets, preset_name);
    if (!preset) {
      Report(preset.error());
      rc = 1;
      return;
    }
    std::cout << texbake::EncodePreset(*preset) << std::endl;
  });

  auto* remove = preset_cmd->add_subcommand("delete", "Delete a stored preset");
  remove->add_option("name", preset_name, "Preset name")->required();
  remove->callback([&]() {
    auto presets = store();
    auto removed = texbake::DeletePreset(presets, preset_name);
    if (!removed) {
      Report(removed.error());
      rc = 1;
    }
  });

  auto* list = preset_cmd->add_subcommand("list", "List stored presets");
  list->callback([&]() {
    auto presets = store();
    auto names = presets.List();
    if (!names) {
      Report(names.error());
      rc = 1;
      return;
    }
    for (const auto& n : *names) std::cout << n << std::endl;
  });

  try {
    app.require_subcommand();
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }
  return rc;
}

int main(int argc, char** argv) { return texbake_main(argc, argv); }
