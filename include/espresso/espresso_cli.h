#pragma once

#include <espresso/logging.h>
#include <espresso/models.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace espresso {

struct BuildOptions {
  std::optional<std::filesystem::path> root;
  std::optional<std::filesystem::path> config_file;
  std::optional<std::filesystem::path> output_directory;
  std::vector<std::string> formats;
  std::optional<std::size_t> workers;
  std::optional<bool> sort_list_pages;
  std::optional<bool> strict_related;
  std::optional<LogLevel> log_level;
  bool show_help = false;
};

struct SiteConfig {
  SiteSettings settings;
  BuildOptions build;
};

struct ResolvedBuild {
  BuildOptions options;
  SiteSettings settings;
};

BuildOptions ParseBuildArguments(const std::vector<std::string> &arguments);
SiteConfig ParseConfigFile(const std::filesystem::path &path);
BuildOptions MergeOptions(const BuildOptions &config_options,
                          const BuildOptions &cli_options);
ResolvedBuild ResolveBuildOptions(const BuildOptions &cli_options);
BuildConfig MakeBuildConfig(const ResolvedBuild &resolved);

int RunBuild(const std::vector<std::string> &arguments);

} // namespace espresso
