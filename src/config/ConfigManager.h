#ifndef EMACROSSWATCH_CONFIGMANAGER_H
#define EMACROSSWATCH_CONFIGMANAGER_H

#include <expected>
#include <filesystem>
#include <string>

#include "Config.h"

class ConfigManager {
 public:
  // Reads the INI file, applies environment overrides and validates the
  // result. Any error is fatal for the caller.
  static std::expected<Config, std::string> Load(
      const std::filesystem::path& path);
  static std::expected<Config, std::string> CreateDefaultConfig(
      const std::filesystem::path& path);

  static std::expected<void, std::string> ApplyEnvironment(Config& config);
  static std::expected<void, std::string> Validate(const Config& config);
};

#endif  // EMACROSSWATCH_CONFIGMANAGER_H
