#include "texbake/preset/preset_store.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace texbake {
namespace {

constexpr const char* kPresetExtension = ".json";

Error NotFound(const std::string& name) {
  return Error{ErrorCode::NotFound, "preset '" + name + "' not found"};
}

}  // namespace

FilePresetStore::FilePresetStore(std::filesystem::path dir) : dir_(std::move(dir)) {}

std::filesystem::path FilePresetStore::PathFor(const std::string& name) const {
  return dir_ / (name + kPresetExtension);
}

tl::expected<void, Error> FilePresetStore::Save(const std::string& name,
                                                const std::string& text) {
  std::error_code ec;
  std::filesystem::create_directories(dir_, ec);
  if (ec) {
    return tl::unexpected(
        Error{ErrorCode::IoError, "cannot create preset directory: " + ec.message()});
  }
  std::ofstream os(PathFor(name), std::ios::binary | std::ios::trunc);
  if (!os) {
    return tl::unexpected(Error{ErrorCode::IoError, "failed to write preset '" + name + "'"});
  }
  os << text;
  if (!os) {
    return tl::unexpected(Error{ErrorCode::IoError, "failed to write preset '" + name + "'"});
  }
  return {};
}

tl::expected<std::string, Error> FilePresetStore::Load(const std::string& name) const {
  std::ifstream is(PathFor(name), std::ios::binary);
  if (!is) {
    return tl::unexpected(NotFound(name));
  }
  std::ostringstream ss;
  ss << is.rdbuf();
  return ss.str();
}

tl::expected<void, Error> FilePresetStore::Remove(const std::string& name) {
  std::error_code ec;
  if (!std::filesystem::remove(PathFor(name), ec)) {
    if (ec) {
      return tl::unexpected(Error{ErrorCode::IoError, "failed to delete preset '" + name +
                                                          "': " + ec.message()});
    }
    return tl::unexpected(NotFound(name));
  }
  return {};
}

tl::expected<std::vector<std::string>, Error> FilePresetStore::List() const {
  std::vector<std::string> names;
  std::error_code ec;
  if (!std::filesystem::exists(dir_, ec)) {
    return names;
  }
  for (std::filesystem::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
    const auto& path = it->path();
    if (it->is_regular_file() && path.extension() == kPresetExtension) {
      names.push_back(path.stem().string());
    }
  }
  if (ec) {
    return tl::unexpected(
        Error{ErrorCode::IoError, "cannot list preset directory: " + ec.message()});
  }
  std::sort(names.begin(), names.end());
  return names;
}

tl::expected<void, Error> MemoryPresetStore::Save(const std::string& name,
                                                  const std::string& text) {
  records_[name] = text;
  return {};
}

tl::expected<std::string, Error> MemoryPresetStore::Load(const std::string& name) const {
  auto it = records_.find(name);
  if (it == records_.end()) return tl::unexpected(NotFound(name));
  return it->second;
}

tl::expected<void, Error> MemoryPresetStore::Remove(const std::string& name) {
  if (records_.erase(name) == 0) return tl::unexpected(NotFound(name));
  return {};
}

tl::expected<std::vector<std::string>, Error> MemoryPresetStore::List() const {
  std::vector<std::string> names;
  for (const auto& entry : records_) names.push_back(entry.first);
  return names;
}

tl::expected<std::string, Error> SanitizePresetName(const std::string& name) {
  std::string kept;
  for (char c : name) {
    if (std::isalnum(static_cast<unsigned char>(c)) || c == ' ' || c == '-' || c == '_') {
      kept.push_back(c);
    }
  }
  auto first = kept.find_first_not_of(' ');
  if (first == std::string::npos) {
    return tl::unexpected(Error{ErrorCode::ConfigError,
                                "preset name '" + name + "' has no usable characters"});
  }
  auto last = kept.find_last_not_of(' ');
  return kept.substr(first, last - first + 1);
}

tl::expected<std::string, Error> SavePreset(PresetStore& store, const std::string& name,
                                            const BakeConfig& config) {
  auto safe = SanitizePresetName(name);
  if (!safe) return safe;
  Preset preset;
  preset.name = *safe;
  preset.config = config;
  auto saved = store.Save(*safe, EncodePreset(preset));
  if (!saved) return tl::unexpected(saved.error());
  spdlog::info("preset '{}' saved", *safe);
  return safe;
}

tl::expected<Preset, Error> LoadPreset(const PresetStore& store, const std::string& name) {
  auto safe = SanitizePresetName(name);
  if (!safe) return tl::unexpected(safe.error());
  auto text = store.Load(*safe);
  if (!text) return tl::unexpected(text.error());
  auto preset = DecodePreset(*text);
  if (!preset) {
    return tl::unexpected(
        Error{preset.error().code, "preset '" + *safe + "': " + preset.error().message});
  }
  if (preset->name.empty()) preset->name = *safe;
  return preset;
}

tl::expected<void, Error> DeletePreset(PresetStore& store, const std::string& name) {
  auto safe = SanitizePresetName(name);
  if (!safe) return tl::unexpected(safe.error());
  auto removed = store.Remove(*safe);
  if (removed) spdlog::info("preset '{}' deleted", *safe);
  return removed;
}

}  // namespace texbake
