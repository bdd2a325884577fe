#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include "texbake/core/error.hpp"
#include "texbake/preset/preset.hpp"

namespace texbake {

// Durable named preset records. Names passed here are already sanitized.
class PresetStore {
 public:
  virtual ~PresetStore() = default;

  virtual tl::expected<void, Error> Save(const std::string& name, const std::string& text) = 0;
  virtual tl::expected<std::string, Error> Load(const std::string& name) const = 0;
  virtual tl::expected<void, Error> Remove(const std::string& name) = 0;
  // Sorted by name.
  virtual tl::expected<std::vector<std::string>, Error> List() const = 0;
};

// One "<name>.json" file per preset under `dir`.
class FilePresetStore : public PresetStore {
 public:
  explicit FilePresetStore(std::filesystem::path dir);

  tl::expected<void, Error> Save(const std::string& name, const std::string& text) override;
  tl::expected<std::string, Error> Load(const std::string& name) const override;
  tl::expected<void, Error> Remove(const std::string& name) override;
  tl::expected<std::vector<std::string>, Error> List() const override;

  std::filesystem::path PathFor(const std::string& name) const;

 private:
  std::filesystem::path dir_;
};

class MemoryPresetStore : public PresetStore {
 public:
  tl::expected<void, Error> Save(const std::string& name, const std::string& text) override;
  tl::expected<std::string, Error> Load(const std::string& name) const override;
  tl::expected<void, Error> Remove(const std::string& name) override;
  tl::expected<std::vector<std::string>, Error> List() const override;

 private:
  std::map<std::string, std::string> records_;
};

// Keeps alphanumerics, space, '-' and '_', then trims; ConfigError when nothing is left.
tl::expected<std::string, Error> SanitizePresetName(const std::string& name);

tl::expected<std::string, Error> SavePreset(PresetStore& store, const std::string& name,
                                            const BakeConfig& config);
tl::expected<Preset, Error> LoadPreset(const PresetStore& store, const std::string& name);
tl::expected<void, Error> DeletePreset(PresetStore& store, const std::string& name);

}  // namespace texbake
