// tests/unit/project/test_project_config.cpp - lolac.yaml parsing tests
#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "lola/project/project_config.hpp"

using namespace lola;
namespace fs = std::filesystem;

namespace
{

fs::path make_temp_dir(std::string_view prefix)
{
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = fs::temp_directory_path() / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

}  // namespace

TEST(ProjectConfigTest, EmptyDocumentUsesDefaults)
{
  const auto result = parse_project_config("", "/proj");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.analysis.event_combination, EventCombination::Any);
  EXPECT_EQ(result.config.analysis.frequency_rule, FrequencyRule::IntegerMultiple);
  EXPECT_TRUE(result.config.analysis.default_literals);
  EXPECT_TRUE(result.config.analysis.warn_unused_inputs);
  EXPECT_EQ(result.config.output.ir_dir, fs::path("generated"));
  EXPECT_EQ(result.config.project_root, fs::path("/proj"));
}

TEST(ProjectConfigTest, ParsesAllSettings)
{
  const auto result = parse_project_config(
    R"(
analysis:
  event_combination: all
  frequency_rule: equal
  default_literals: false
  warn_unused_inputs: false
output:
  ir_dir: out/ir
)",
    "/proj");

  ASSERT_TRUE(result.success) << result.error;
  const AnalysisConfig & a = result.config.analysis;
  EXPECT_EQ(a.event_combination, EventCombination::All);
  EXPECT_EQ(a.frequency_rule, FrequencyRule::Equal);
  EXPECT_FALSE(a.default_literals);
  EXPECT_FALSE(a.warn_unused_inputs);
  EXPECT_EQ(a.pacing_policy().event_combination, EventCombination::All);
  EXPECT_EQ(result.config.output.ir_dir, fs::path("out/ir"));
}

TEST(ProjectConfigTest, RejectsUnknownEventCombination)
{
  const auto result = parse_project_config("analysis:\n  event_combination: some\n", "/proj");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("analysis.event_combination"), std::string::npos);
  EXPECT_NE(result.error.find("'some'"), std::string::npos);
}

TEST(ProjectConfigTest, RejectsUnknownFrequencyRule)
{
  const auto result = parse_project_config("analysis:\n  frequency_rule: loose\n", "/proj");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("must be 'integer_multiple' or 'equal'"), std::string::npos);
}

TEST(ProjectConfigTest, RejectsBadShapes)
{
  EXPECT_FALSE(parse_project_config("- a\n- b\n", "/proj").success);
  EXPECT_FALSE(parse_project_config("analysis: 3\n", "/proj").success);
  EXPECT_FALSE(parse_project_config("output: [1, 2]\n", "/proj").success);

  const auto bad_bool = parse_project_config("analysis:\n  default_literals: maybe\n", "/proj");
  EXPECT_FALSE(bad_bool.success);
  EXPECT_NE(bad_bool.error.find("invalid value"), std::string::npos);
}

TEST(ProjectConfigTest, ResolveIrDir)
{
  ProjectConfig config;
  config.project_root = "/proj";
  EXPECT_EQ(resolve_ir_dir(config), fs::path("/proj/generated"));

  config.output.ir_dir = "/abs/ir";
  EXPECT_EQ(resolve_ir_dir(config), fs::path("/abs/ir"));
}

TEST(ProjectConfigTest, LoadAndFindFile)
{
  const fs::path root = make_temp_dir("lola_config");
  const fs::path nested = root / "specs" / "flight";
  fs::create_directories(nested);
  {
    std::ofstream out(root / k_project_config_file_name);
    out << "analysis:\n  event_combination: all\n";
  }

  const auto found = find_project_config(nested);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(fs::weakly_canonical(*found), fs::weakly_canonical(root / "lolac.yaml"));

  const auto loaded = load_project_config(*found);
  ASSERT_TRUE(loaded.success) << loaded.error;
  EXPECT_EQ(loaded.config.analysis.event_combination, EventCombination::All);
  EXPECT_EQ(fs::weakly_canonical(loaded.config.project_root), fs::weakly_canonical(root));

  fs::remove_all(root);
}

TEST(ProjectConfigTest, LoadMissingFile)
{
  const auto result = load_project_config("/nonexistent/lolac.yaml");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("configuration file not found"), std::string::npos);
}

TEST(ProjectConfigTest, LoadMalformedYaml)
{
  const fs::path root = make_temp_dir("lola_config_bad");
  const fs::path file = root / "lolac.yaml";
  {
    std::ofstream out(file);
    out << "analysis: [unclosed\n";
  }

  const auto result = load_project_config(file);
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("failed to parse YAML"), std::string::npos);
  fs::remove_all(root);
}
