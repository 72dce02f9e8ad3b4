// tests/project/test_project_config.cpp - Unit tests for wirec.yaml loading
//

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "wire_check/project/project_config.hpp"

using namespace wire_check;

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(std::filesystem::path p) : path(std::move(p))
  {
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

}  // namespace

TEST(ProjectConfig, ParsesAllSections)
{
  const auto r = parse_project_config(
    "package:\n"
    "  name: 'demo'\n"
    "  version: '0.1.0'\n"
    "checker:\n"
    "  manifests: ['./ports.json', 'sub/more.json']\n"
    "  max_alias_depth: 16\n"
    "output:\n"
    "  format: 'json'\n"
    "  color: 'never'\n",
    "/work/demo");
  ASSERT_TRUE(r.success) << r.error;

  const auto & c = r.config;
  EXPECT_EQ(c.package.name, "demo");
  EXPECT_EQ(c.package.version, "0.1.0");
  ASSERT_EQ(c.checker.manifests.size(), 2U);
  EXPECT_EQ(c.checker.max_alias_depth, 16U);
  EXPECT_EQ(c.output.format, OutputFormat::Json);
  EXPECT_EQ(c.output.color, ColorMode::Never);

  const auto resolved = c.resolved_manifests();
  ASSERT_EQ(resolved.size(), 2U);
  EXPECT_EQ(resolved[0].generic_string(), "/work/demo/ports.json");
  EXPECT_EQ(resolved[1].generic_string(), "/work/demo/sub/more.json");
}

TEST(ProjectConfig, DefaultsWhenSectionsAreMissing)
{
  const auto r = parse_project_config("package:\n  name: 'x'\n", "/work");
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_TRUE(r.config.checker.manifests.empty());
  EXPECT_EQ(r.config.checker.max_alias_depth, 64U);
  EXPECT_EQ(r.config.output.format, OutputFormat::Text);
  EXPECT_EQ(r.config.output.color, ColorMode::Auto);
}

TEST(ProjectConfig, RejectsInvalidValues)
{
  EXPECT_FALSE(parse_project_config("checker:\n  manifests: 'one.json'\n", "/w").success);
  EXPECT_FALSE(parse_project_config("checker:\n  max_alias_depth: 0\n", "/w").success);
  EXPECT_FALSE(parse_project_config("output:\n  format: 'xml'\n", "/w").success);
  EXPECT_FALSE(parse_project_config("output:\n  color: 'sometimes'\n", "/w").success);
  EXPECT_FALSE(parse_project_config("- just\n- a list\n", "/w").success);
  EXPECT_FALSE(parse_project_config("checker: [unclosed\n", "/w").success);
}

TEST(ProjectConfig, LoadsFileAndRecordsRoot)
{
  const TempDir temp_dir(std::filesystem::temp_directory_path() / "wirec_test_config_load");
  const auto config_path = temp_dir.path / k_project_config_file_name;
  {
    std::ofstream f(config_path);
    f << "checker:\n  manifests: ['ports.json']\n";
  }

  const auto r = load_project_config(config_path);
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(
    r.config.project_root.string(), std::filesystem::absolute(temp_dir.path).string());
  ASSERT_EQ(r.config.resolved_manifests().size(), 1U);
  EXPECT_EQ(r.config.resolved_manifests()[0].filename().string(), "ports.json");
}

TEST(ProjectConfig, MissingFileFails)
{
  const auto r = load_project_config("/nonexistent/wirec.yaml");
  ASSERT_FALSE(r.success);
  EXPECT_NE(r.error.find("not found"), std::string::npos);
}

TEST(ProjectConfig, FindSearchesParentDirectories)
{
  const TempDir temp_dir(std::filesystem::temp_directory_path() / "wirec_test_config_find");
  const auto nested = temp_dir.path / "a" / "b";
  std::filesystem::create_directories(nested);
  {
    std::ofstream f(temp_dir.path / k_project_config_file_name);
    f << "package:\n  name: 'found'\n";
  }

  const auto found = find_project_config(nested);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->filename().string(), k_project_config_file_name);
  EXPECT_EQ(
    found->parent_path().string(), std::filesystem::absolute(temp_dir.path).string());
}
