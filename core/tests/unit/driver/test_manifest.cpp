// tests/driver/test_manifest.cpp - Unit tests for declaration manifests
//

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>

#include "wire_check/driver/manifest.hpp"
#include "wire_check/types/type_utils.hpp"

using namespace wire_check;
using nlohmann::json;

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

const char * const k_sample = R"({
  "module": "Main",
  "ports": [
    {"name": "clicks", "direction": "input", "type": {"app": "Stream", "args": ["Int"]}},
    {"name": "log", "direction": "output", "type": {"lambda": ["String", {"tuple": []}]}}
  ],
  "loopbacks": [
    {"name": "feedback", "type": {"record": [
      {"name": "mailbox", "type": {"app": "Mailbox", "args": ["Int"]}},
      {"name": "stream", "type": {"app": "Stream", "args": ["Int"]}}
    ]}},
    {"name": "results", "implementation": "Http.get url",
     "type": {"app": "Stream", "args": [{"app": "Result", "args": ["String", "Int"]}]}}
  ]
})";

}  // namespace

TEST(DriverManifest, ParsesPortsAndLoopbacks)
{
  TypeContext types;
  const auto r = parse_manifest(json::parse(k_sample), types);
  ASSERT_TRUE(r.success) << r.error;

  const auto & m = r.manifest;
  EXPECT_EQ(m.module_name, "Main");
  ASSERT_EQ(m.ports.size(), 2U);
  EXPECT_EQ(m.ports[0].name, "clicks");
  EXPECT_EQ(m.ports[0].direction, WireDirection::In);
  EXPECT_EQ(to_string(m.ports[0].type), "Stream Int");
  EXPECT_EQ(m.ports[1].direction, WireDirection::Out);
  EXPECT_EQ(to_string(m.ports[1].type), "String -> ()");

  ASSERT_EQ(m.loopbacks.size(), 2U);
  EXPECT_FALSE(m.loopbacks[0].implementation.has_value());
  ASSERT_TRUE(m.loopbacks[1].implementation.has_value());
  EXPECT_EQ(m.loopbacks[1].implementation->source, "Http.get url");
}

TEST(DriverManifest, EmptyManifestIsValid)
{
  TypeContext types;
  const auto r = parse_manifest(json::object(), types);
  ASSERT_TRUE(r.success);
  EXPECT_TRUE(r.manifest.ports.empty());
  EXPECT_TRUE(r.manifest.loopbacks.empty());
}

TEST(DriverManifest, RejectsInvalidDirection)
{
  TypeContext types;
  const auto r = parse_manifest(
    json::parse(R"({"ports": [{"name": "p", "direction": "sideways", "type": "Int"}]})"), types);
  ASSERT_FALSE(r.success);
  EXPECT_NE(r.error.find("$.ports[0].direction"), std::string::npos);
  EXPECT_NE(r.error.find("sideways"), std::string::npos);
}

TEST(DriverManifest, ReportsTypeErrorPath)
{
  TypeContext types;
  const auto r = parse_manifest(
    json::parse(R"({"loopbacks": [{"name": "l", "type": {"app": "Stream", "args": ["Nope"]}}]})"),
    types);
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error, "$.loopbacks[0].type.args[0]: unknown type name 'Nope'");
}

TEST(DriverManifest, NonStringIdentityHomeFailsWithPath)
{
  TypeContext types;
  ManifestLoadResult r;
  EXPECT_NO_THROW(
    r = parse_manifest(
      json::parse(
        R"({"ports": [{"name": "p", "direction": "in", "type": {"named": {"home": 5, "name": "X"}}}]})"),
      types));
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error, "$.ports[0].type.named.home: expected a string");
}

TEST(DriverManifest, RequiresNames)
{
  TypeContext types;
  const auto r =
    parse_manifest(json::parse(R"({"ports": [{"direction": "input", "type": "Int"}]})"), types);
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error, "$.ports[0].name: expected a non-empty string");
}

TEST(DriverManifest, LoadsFromFile)
{
  const TempDir temp_dir(std::filesystem::temp_directory_path() / "wirec_test_manifest_load");
  const auto file = temp_dir.path / "ports.json";
  {
    std::ofstream f(file);
    f << k_sample;
  }

  TypeContext types;
  const auto r = load_manifest(file, types);
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.manifest.source_path.string(), file.string());
  EXPECT_EQ(r.manifest.ports.size(), 2U);
}

TEST(DriverManifest, LoadReportsMissingAndMalformedFiles)
{
  const TempDir temp_dir(std::filesystem::temp_directory_path() / "wirec_test_manifest_bad");
  TypeContext types;

  const auto missing = load_manifest(temp_dir.path / "absent.json", types);
  ASSERT_FALSE(missing.success);
  EXPECT_NE(missing.error.find("manifest not found"), std::string::npos);

  const auto file = temp_dir.path / "broken.json";
  {
    std::ofstream f(file);
    f << "{ \"ports\": [ ";
  }
  const auto broken = load_manifest(file, types);
  ASSERT_FALSE(broken.success);
  EXPECT_NE(broken.error.find("failed to parse JSON"), std::string::npos);
}

TEST(DriverManifest, LoopbackJson)
{
  TypeContext types;
  const auto * original = types.stream(types.result(types.string_type(), types.int_type()));
  const LoopbackDecl decl = PromiseLoopback{
    "results", types.stream(types.promise(types.string_type(), types.int_type())),
    ImplementationExpr{"Http.get url"}, original};

  const auto j = loopback_to_json(decl);
  EXPECT_EQ(j["kind"], "promise");
  EXPECT_EQ(j["name"], "results");
  EXPECT_EQ(j["implementation"], "Http.get url");
  EXPECT_EQ(j["type"]["args"][0]["app"], "Promise");
  EXPECT_EQ(j["originalType"]["args"][0]["app"], "Result");

  const LoopbackDecl mailbox = MailboxLoopback{"m", types.int_type()};
  EXPECT_EQ(loopback_to_json(mailbox), json::parse(R"({"kind": "mailbox", "name": "m", "type": "Int"})"));
}
