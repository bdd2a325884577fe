#pragma once

#include <string>

#include <tl/expected.hpp>

#include "texbake/core/error.hpp"
#include "texbake/plan/config.hpp"

namespace texbake {

// 1: flat record without schema_version (bake settings, channels, color spaces).
// 2: adds output directory, margin, atlas, UDIM, naming and per-channel overrides.
constexpr int kPresetSchemaVersion = 2;

struct Preset {
  std::string name;
  int schema_version = kPresetSchemaVersion;
  BakeConfig config;
};

// Canonical JSON text; encoding a decoded record reproduces it byte for byte.
std::string EncodePreset(const Preset& preset);

// Fields missing from older versions take their defaults. Fails with
// PresetFormatError on malformed JSON, wrong value types or unknown discriminants.
tl::expected<Preset, Error> DecodePreset(const std::string& text);

}  // namespace texbake
