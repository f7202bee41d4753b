// lola/project/project_config.cpp - Project configuration implementation
//
#include "lola/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace lola
{

namespace
{

std::optional<EventCombination> parse_event_combination(const std::string & text)
{
  if (text == "any") return EventCombination::Any;
  if (text == "all") return EventCombination::All;
  return std::nullopt;
}

std::optional<FrequencyRule> parse_frequency_rule(const std::string & text)
{
  if (text == "integer_multiple") return FrequencyRule::IntegerMultiple;
  if (text == "equal") return FrequencyRule::Equal;
  return std::nullopt;
}

ConfigLoadResult build_config(const YAML::Node & root, const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;

  // An empty document is a valid, all-default configuration
  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  try {
    // Parse 'analysis' section
    if (root["analysis"]) {
      const auto & analysis = root["analysis"];
      if (!analysis.IsMap()) {
        return ConfigLoadResult::fail("analysis must be a map");
      }

      if (analysis["event_combination"]) {
        const auto text = analysis["event_combination"].as<std::string>();
        const auto value = parse_event_combination(text);
        if (!value) {
          return ConfigLoadResult::fail(
            "invalid analysis.event_combination: '" + text + "' (must be 'any' or 'all')");
        }
        config.analysis.event_combination = *value;
      }

      if (analysis["frequency_rule"]) {
        const auto text = analysis["frequency_rule"].as<std::string>();
        const auto value = parse_frequency_rule(text);
        if (!value) {
          return ConfigLoadResult::fail(
            "invalid analysis.frequency_rule: '" + text +
            "' (must be 'integer_multiple' or 'equal')");
        }
        config.analysis.frequency_rule = *value;
      }

      if (analysis["default_literals"]) {
        config.analysis.default_literals = analysis["default_literals"].as<bool>();
      }
      if (analysis["warn_unused_inputs"]) {
        config.analysis.warn_unused_inputs = analysis["warn_unused_inputs"].as<bool>();
      }
    }

    // Parse 'output' section
    if (root["output"]) {
      const auto & output = root["output"];
      if (!output.IsMap()) {
        return ConfigLoadResult::fail("output must be a map");
      }
      if (output["ir_dir"]) {
        config.output.ir_dir = output["ir_dir"].as<std::string>();
      }
    }
  } catch (const YAML::BadConversion & e) {
    return ConfigLoadResult::fail("invalid value: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  return build_config(root, fs::absolute(config_path).parent_path());
}

ConfigLoadResult parse_project_config(
  std::string_view yaml_text, const std::filesystem::path & project_root)
{
  YAML::Node root;
  try {
    root = YAML::Load(std::string(yaml_text));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return build_config(root, project_root);
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

std::filesystem::path resolve_ir_dir(const ProjectConfig & config)
{
  if (config.output.ir_dir.is_absolute()) return config.output.ir_dir;
  return config.project_root / config.output.ir_dir;
}

}  // namespace lola
