#include "texbake/plan/config.hpp"

#include <algorithm>

namespace texbake {

std::vector<ChannelKind> NormalizedChannels(const std::vector<ChannelKind>& channels) {
  std::vector<ChannelKind> out;
  for (const auto& info : AllChannels()) {
    if (std::find(channels.begin(), channels.end(), info.kind) != channels.end()) {
      out.push_back(info.kind);
    }
  }
  return out;
}

tl::expected<void, Error> ValidateConfig(const BakeConfig& config) {
  if (config.margin < 0 || config.margin > kMaxMargin) {
    return tl::unexpected(Error{ErrorCode::ConfigError,
                                "margin " + std::to_string(config.margin) + " outside [0, " +
                                    std::to_string(kMaxMargin) + "]"});
  }
  auto res = ValidateResolutions(config.resolutions);
  if (!res) return res;

  if (config.channels.empty()) {
    return tl::unexpected(Error{ErrorCode::ConfigError, "no channel selected"});
  }
  for (ChannelKind kind : config.channels) {
    if (!LookupChannel(kind)) {
      return tl::unexpected(Error{ErrorCode::ConfigError,
                                  "unknown channel kind " +
                                      std::to_string(static_cast<int>(kind))});
    }
  }

  auto udim = ValidateUdimSettings(config.udim);
  if (!udim) return udim;

  return ValidateColorSpacePolicy(config.colorspace);
}

}  // namespace texbake
