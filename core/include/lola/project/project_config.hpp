// lola/project/project_config.hpp - Project configuration (lolac.yaml)
//
// Parses and validates lolac.yaml files. The file only tunes analysis
// policy; every setting has a default, so a missing file is not an error.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "lola/sema/pacing/pacing.hpp"

namespace lola
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Analysis configuration section.
 */
struct AnalysisConfig
{
  /// "any" | "all"
  EventCombination event_combination = EventCombination::Any;

  /// "integer_multiple" | "equal"
  FrequencyRule frequency_rule = FrequencyRule::IntegerMultiple;

  /// Default unconstrained literals to Int64 / Float64
  bool default_literals = true;

  /// Warn about inputs that nothing reads
  bool warn_unused_inputs = true;

  [[nodiscard]] PacingPolicy pacing_policy() const
  {
    return PacingPolicy{event_combination, frequency_rule};
  }
};

/**
 * Output configuration section.
 */
struct OutputConfig
{
  /// Directory for IR dumps (relative to lolac.yaml)
  std::filesystem::path ir_dir = "generated";
};

/**
 * Complete project configuration (lolac.yaml).
 */
struct ProjectConfig
{
  AnalysisConfig analysis;
  OutputConfig output;

  /// Directory containing lolac.yaml (for resolving relative paths)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a lolac.yaml file.
 *
 * @param config_path Path to lolac.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Parse configuration text.
 *
 * @param project_root Directory relative paths are resolved against
 */
[[nodiscard]] ConfigLoadResult parse_project_config(
  std::string_view yaml_text, const std::filesystem::path & project_root);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to lolac.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/// Absolute IR output directory of `config`.
[[nodiscard]] std::filesystem::path resolve_ir_dir(const ProjectConfig & config);

inline constexpr const char * k_project_config_file_name = "lolac.yaml";

}  // namespace lola
