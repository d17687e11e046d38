#include <espresso/cli_exit_codes.h>
#include <espresso/default_site_pipeline.h>
#include <espresso/espresso_cli.h>
#include <espresso/site_pipeline_builder.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace {

using espresso::BuildOptions;

constexpr const char kDefaultConfigFile[] = "site.yml";

void PrintBuildUsage() {
  std::cout
      << "Usage: espresso build --root <path> [options]\n"
      << "Options:\n"
      << "  --root <path>         Site directory containing content/\n"
      << "  --config <file>       YAML site settings (default: <root>/"
      << kDefaultConfigFile << ")\n"
      << "  --out <path>          Directory for the model summary (default: "
         "<root>/target)\n"
      << "  --format <list>       Comma-separated list of summary formats\n"
      << "                        (supported: markdown,json)\n"
      << "  --workers <n>         Number of ingestion workers (default: "
         "hardware concurrency)\n"
      << "  --no-sort             Keep list pages in registration order\n"
      << "  --strict-related      Fail the build on unresolved related links\n"
      << "  --log-level <level>   Logging verbosity (error,warn,info,debug)\n"
      << "  --verbose             Shortcut for --log-level info\n"
      << "  --debug               Shortcut for --log-level debug\n"
      << "  --help                Show this message\n";
}

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::vector<std::string> SplitList(const std::string &raw_values) {
  std::vector<std::string> values;
  std::string current;
  for (const auto character : raw_values) {
    if (character == ',') {
      if (!current.empty()) {
        values.push_back(current);
        current.clear();
      }
    } else {
      current.push_back(character);
    }
  }
  if (!current.empty()) {
    values.push_back(current);
  }
  return values;
}

void AppendFormats(const std::string &raw_formats,
                   std::vector<std::string> &target) {
  for (auto format : SplitList(raw_formats)) {
    format = ToLower(Trim(format));
    if (format != "markdown" && format != "json") {
      throw std::invalid_argument("Unsupported format: " + format);
    }
    if (std::find(target.begin(), target.end(), format) == target.end()) {
      target.push_back(std::move(format));
    }
  }
}

std::size_t ParseWorkerCount(const std::string &value) {
  const auto trimmed = Trim(value);
  if (trimmed.empty() ||
      !std::all_of(trimmed.begin(), trimmed.end(),
                   [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
    throw std::invalid_argument("Worker count must be a non-negative "
                                "integer: " +
                                value);
  }
  return static_cast<std::size_t>(std::stoul(trimmed));
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

bool HandleLoggingOption(const std::vector<std::string> &arguments,
                         std::size_t &index, BuildOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--log-level") {
    options.log_level =
        espresso::ParseLogLevel(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--verbose") {
    options.log_level = espresso::LogLevel::kInfo;
    return true;
  }
  if (argument == "--debug") {
    options.log_level = espresso::LogLevel::kDebug;
    return true;
  }
  return false;
}

bool HandleDerivationOption(const std::vector<std::string> &arguments,
                            std::size_t &index, BuildOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--no-sort") {
    options.sort_list_pages = false;
    return true;
  }
  if (argument == "--strict-related") {
    options.strict_related = true;
    return true;
  }
  if (argument == "--workers") {
    options.workers =
        ParseWorkerCount(RequireValue(arguments, index, "--workers"));
    return true;
  }
  return false;
}

bool DispatchBuildOption(const std::vector<std::string> &arguments,
                         std::size_t &index, BuildOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
    return true;
  }
  if (argument == "--root") {
    options.root = RequireValue(arguments, index, "--root");
    return true;
  }
  if (argument == "--config") {
    options.config_file = RequireValue(arguments, index, "--config");
    return true;
  }
  if (argument == "--out") {
    options.output_directory = RequireValue(arguments, index, "--out");
    return true;
  }
  if (argument == "--format") {
    AppendFormats(RequireValue(arguments, index, "--format"), options.formats);
    return true;
  }
  return HandleDerivationOption(arguments, index, options) ||
         HandleLoggingOption(arguments, index, options);
}

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = {"title", "nav", "footer",
                                                "build"};
  return keys;
}

const std::vector<std::string> &SupportedBuildKeys() {
  static const std::vector<std::string> keys = {
      "sort_list_pages", "workers", "strict_related", "formats", "out",
      "log_level"};
  return keys;
}

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  return key;
}

[[noreturn]] void ThrowUnknownKey(const std::string &section,
                                  const std::string &key,
                                  const std::vector<std::string> &supported) {
  std::string message = "Unknown " + section + " key: " + key +
                        ". Supported keys: ";
  for (std::size_t i = 0; i < supported.size(); ++i) {
    message += supported[i];
    if (i + 1 < supported.size()) {
      message += ", ";
    }
  }
  throw std::invalid_argument(message);
}

std::string ExtractStringScalar(const YAML::Node &node,
                                const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a string value");
  }
  return node.as<std::string>();
}

bool ExtractBool(const YAML::Node &node, const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a boolean");
  }
  const auto normalized = ToLower(Trim(node.as<std::string>()));
  if (normalized == "true" || normalized == "1" || normalized == "yes" ||
      normalized == "on") {
    return true;
  }
  if (normalized == "false" || normalized == "0" || normalized == "no" ||
      normalized == "off") {
    return false;
  }
  throw std::invalid_argument("Config key '" + key_name +
                              "' must be a boolean, got '" + normalized + "'");
}

void RequireMap(const YAML::Node &node, const std::string &key_name) {
  if (!node.IsMap()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a mapping");
  }
}

template <typename Item>
std::vector<Item> ExtractLinkItems(const YAML::Node &node,
                                   const std::string &key_name) {
  std::vector<Item> items;
  if (node.IsNull()) {
    return items;
  }
  if (!node.IsSequence()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a list of {label, target} items");
  }
  for (const auto &child : node) {
    RequireMap(child, key_name);
    Item item;
    if (child["label"]) {
      item.label = ExtractStringScalar(child["label"], key_name + ".label");
    }
    if (child["target"]) {
      item.target = ExtractStringScalar(child["target"], key_name + ".target");
    }
    items.push_back(std::move(item));
  }
  return items;
}

void ApplyNavSection(const YAML::Node &node, espresso::SiteSettings &settings) {
  if (node.IsNull()) {
    return;
  }
  RequireMap(node, "nav");
  for (const auto &entry : node) {
    const auto key = NormalizeConfigKey(entry.first.as<std::string>());
    if (key == "override") {
      settings.nav.override = ExtractBool(entry.second, "nav.override");
    } else if (key == "items") {
      settings.nav.items =
          ExtractLinkItems<espresso::NavItem>(entry.second, "nav.items");
    } else {
      ThrowUnknownKey("nav", key, {"override", "items"});
    }
  }
}

void ApplyFooterSection(const YAML::Node &node,
                        espresso::SiteSettings &settings) {
  if (node.IsNull()) {
    return;
  }
  RequireMap(node, "footer");
  for (const auto &entry : node) {
    const auto key = NormalizeConfigKey(entry.first.as<std::string>());
    if (key == "text") {
      settings.footer.text = ExtractStringScalar(entry.second, "footer.text");
    } else if (key == "items") {
      settings.footer.items =
          ExtractLinkItems<espresso::FooterItem>(entry.second, "footer.items");
    } else {
      ThrowUnknownKey("footer", key, {"text", "items"});
    }
  }
}

std::vector<std::string> ExtractFormats(const YAML::Node &node) {
  std::vector<std::string> formats;
  if (node.IsScalar()) {
    AppendFormats(node.as<std::string>(), formats);
    return formats;
  }
  if (!node.IsSequence()) {
    throw std::invalid_argument(
        "Config key 'build.formats' must be a string or list of strings");
  }
  for (const auto &child : node) {
    AppendFormats(ExtractStringScalar(child, "build.formats"), formats);
  }
  return formats;
}

void ApplyBuildSection(const YAML::Node &node, BuildOptions &options) {
  if (node.IsNull()) {
    return;
  }
  RequireMap(node, "build");
  for (const auto &entry : node) {
    const auto key = NormalizeConfigKey(entry.first.as<std::string>());
    const auto &value = entry.second;
    if (key == "sort_list_pages") {
      options.sort_list_pages = ExtractBool(value, "build." + key);
    } else if (key == "strict_related") {
      options.strict_related = ExtractBool(value, "build." + key);
    } else if (key == "workers") {
      options.workers = ParseWorkerCount(ExtractStringScalar(value, key));
    } else if (key == "formats") {
      options.formats = ExtractFormats(value);
    } else if (key == "out") {
      options.output_directory = ExtractStringScalar(value, "build." + key);
    } else if (key == "log_level") {
      options.log_level =
          espresso::ParseLogLevel(ExtractStringScalar(value, "build." + key));
    } else {
      ThrowUnknownKey("build", key, SupportedBuildKeys());
    }
  }
}

void ValidateBuildOptions(const BuildOptions &options) {
  if (!options.root) {
    throw std::invalid_argument("--root is required");
  }
}

void WriteFileIfContent(const std::filesystem::path &path,
                        const std::string &content) {
  if (content.empty()) {
    return;
  }
  std::ofstream stream(path);
  if (!stream) {
    throw std::runtime_error("Failed to open output file: " + path.string());
  }
  stream << content;
}

void WriteReports(const std::filesystem::path &root,
                  const espresso::Report &report) {
  std::filesystem::create_directories(root);
  WriteFileIfContent(root / "site_model.md", report.markdown);
  WriteFileIfContent(root / "site_model.json", report.json);
}

} // namespace

namespace espresso {

BuildOptions ParseBuildArguments(const std::vector<std::string> &arguments) {
  BuildOptions options;

  for (std::size_t i = 0; i < arguments.size(); ++i) {
    if (!DispatchBuildOption(arguments, i, options)) {
      throw std::invalid_argument("Unknown argument: " + arguments[i]);
    }
    if (options.show_help) {
      break;
    }
  }

  return options;
}

SiteConfig ParseConfigFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw std::invalid_argument("Unsupported config format: " + extension);
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(path.string());
  } catch (const YAML::Exception &error) {
    throw std::invalid_argument("Invalid config file " + path.string() + ": " +
                                error.what());
  }

  SiteConfig config;
  config.build.config_file = path;
  if (root.IsNull()) {
    return config;
  }
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "Config file must contain a mapping at the root");
  }

  for (const auto &entry : root) {
    const auto key = NormalizeConfigKey(entry.first.as<std::string>());
    if (key == "title") {
      config.settings.title = ExtractStringScalar(entry.second, key);
    } else if (key == "nav") {
      ApplyNavSection(entry.second, config.settings);
    } else if (key == "footer") {
      ApplyFooterSection(entry.second, config.settings);
    } else if (key == "build") {
      ApplyBuildSection(entry.second, config.build);
    } else {
      ThrowUnknownKey("config", key, SupportedConfigKeys());
    }
  }
  return config;
}

BuildOptions MergeOptions(const BuildOptions &config_options,
                          const BuildOptions &cli_options) {
  BuildOptions merged = config_options;
  const auto override_value = [](auto &target, const auto &source) {
    if (source) {
      target = source;
    }
  };

  override_value(merged.root, cli_options.root);
  override_value(merged.config_file, cli_options.config_file);
  override_value(merged.output_directory, cli_options.output_directory);
  override_value(merged.workers, cli_options.workers);
  override_value(merged.sort_list_pages, cli_options.sort_list_pages);
  override_value(merged.strict_related, cli_options.strict_related);
  override_value(merged.log_level, cli_options.log_level);

  if (!cli_options.formats.empty()) {
    merged.formats = cli_options.formats;
  }
  return merged;
}

ResolvedBuild ResolveBuildOptions(const BuildOptions &cli_options) {
  if (cli_options.show_help) {
    return ResolvedBuild{cli_options, {}};
  }
  ValidateBuildOptions(cli_options);

  auto config_path = cli_options.config_file;
  if (!config_path) {
    const auto candidate = *cli_options.root / kDefaultConfigFile;
    if (std::filesystem::exists(candidate)) {
      config_path = candidate;
    }
  }

  SiteConfig config;
  if (config_path) {
    config = ParseConfigFile(*config_path);
  }

  ResolvedBuild resolved;
  resolved.options = MergeOptions(config.build, cli_options);
  resolved.settings = config.settings;
  return resolved;
}

BuildConfig MakeBuildConfig(const ResolvedBuild &resolved) {
  const auto &options = resolved.options;
  BuildConfig config;
  config.root_path = options.root ? options.root->generic_string() : "";
  if (!options.formats.empty()) {
    config.formats = options.formats;
  }
  config.workers = options.workers.value_or(0);
  config.finalize.sort_list_pages = options.sort_list_pages.value_or(true);
  config.finalize.strict_related = options.strict_related.value_or(false);
  config.settings = resolved.settings;
  return config;
}

int RunBuild(const std::vector<std::string> &arguments) {
  const auto cli_options = ParseBuildArguments(arguments);
  if (cli_options.show_help) {
    PrintBuildUsage();
    return kExitSuccess;
  }

  const auto resolved = ResolveBuildOptions(cli_options);
  const auto config = MakeBuildConfig(resolved);
  LoggingConfig logging;
  logging.level = resolved.options.log_level.value_or(LogLevel::kWarn);
  auto logger = MakeLogger(logging, std::clog);

  const auto output_root = resolved.options.output_directory.value_or(
      *resolved.options.root / "target");

  auto pipeline = SitePipelineBuilder()
                      .WithLogger(logger)
                      .WithRenderContext(RenderContext{output_root, ""})
                      .Build();
  const auto result = pipeline.Run(config);

  WriteReports(output_root, result.report);
  return BuildExitCode(result.build.warnings);
}

} // namespace espresso
