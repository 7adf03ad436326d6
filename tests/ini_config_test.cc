// Tester for IniConfig

#include <filesystem>
#include <stdexcept>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "rxmap/config/IniConfig.hpp"
#include "test_structures.h"

namespace {

using rxmap::IniConfig;
using testing::ElementsAre;
using testing::HasSubstr;
using testing::IsEmpty;

const char kConfig[] = R"(
# reaction between two chain ends
[input]
pre_data = pre.data
post_data = "post.data"

[reaction]
bonding_atoms = 8, 9
delete_atoms = 12 13,14
elements_by_type = C, O H

; mapping knobs
[mapping]
initial_radius = 4
allow_inference = off
)";

TEST(TestIniConfig, Values) {
  const IniConfig cfg = IniConfig::from_string(kConfig, "/work");
  EXPECT_EQ(cfg.get_string("input", "pre_data"), "pre.data");
  EXPECT_EQ(cfg.get_string("input", "post_data"), "post.data");
  EXPECT_EQ(cfg.get_int("mapping", "initial_radius"), 4);
  EXPECT_EQ(cfg.get_int("mapping", "expand_hops_self", 3), 3);
  EXPECT_FALSE(cfg.get_bool("mapping", "allow_inference"));
  EXPECT_TRUE(cfg.get_bool("mapping", "debug", true));
  EXPECT_EQ(cfg.base_dir(), std::filesystem::path("/work"));
}

TEST(TestIniConfig, Lists) {
  const IniConfig cfg = IniConfig::from_string(kConfig);
  EXPECT_THAT(cfg.get_id_list("reaction", "bonding_atoms"), ElementsAre(8, 9));
  EXPECT_THAT(cfg.get_id_list("reaction", "delete_atoms"), ElementsAre(12, 13, 14));
  EXPECT_THAT(cfg.get_id_list("reaction", "create_atoms"), IsEmpty());
  EXPECT_THAT(cfg.get_list("reaction", "elements_by_type"), ElementsAre("C", "O", "H"));
}

TEST(TestIniConfig, SectionsAndUnknownKeys) {
  const IniConfig cfg = IniConfig::from_string(kConfig);
  EXPECT_THAT(cfg.section_names(), ElementsAre("input", "mapping", "reaction"));
  EXPECT_TRUE(cfg.has_key("reaction", "delete_atoms"));
  EXPECT_FALSE(cfg.has_key("output", "map"));
  EXPECT_THAT(cfg.unknown_keys({"input.pre_data", "input.post_data", "reaction.bonding_atoms",
                                "reaction.delete_atoms", "reaction.elements_by_type", "mapping.initial_radius"}),
              ElementsAre("mapping.allow_inference"));
}

TEST(TestIniConfig, MissingKeyThrows) {
  const IniConfig cfg = IniConfig::from_string(kConfig);
  try {
    cfg.get_string("output", "map");
    FAIL() << "expected a missing key error";
  } catch (const std::runtime_error& e) {
    EXPECT_THAT(e.what(), HasSubstr("missing required key 'map' in section [output]"));
  }
}

TEST(TestIniConfig, BadValuesThrow) {
  const IniConfig cfg = IniConfig::from_string("[a]\nn = 3x\nb = maybe\nids = 1, two\n");
  EXPECT_THROW(cfg.get_int("a", "n"), std::runtime_error);
  EXPECT_THROW(cfg.get_bool("a", "b"), std::runtime_error);
  EXPECT_THROW(cfg.get_id_list("a", "ids"), std::runtime_error);
}

TEST(TestIniConfig, SyntaxErrors) {
  EXPECT_THROW(IniConfig::from_string("key = 1\n"), std::runtime_error);
  EXPECT_THROW(IniConfig::from_string("[a]\njust words\n"), std::runtime_error);
  EXPECT_THROW(IniConfig::from_string("[ ]\n"), std::runtime_error);
}

TEST(TestIniConfig, ReadFromFile) {
  const auto dir = rxmap_test::ScratchDir("rxmap_ini");
  ASSERT_TRUE(rxmap_test::WriteText(dir / "run.ini", kConfig));
  const IniConfig cfg(dir / "run.ini");
  EXPECT_EQ(cfg.base_dir(), dir);
  EXPECT_EQ(cfg.get_string("input", "pre_data"), "pre.data");
  EXPECT_THROW({ const IniConfig missing(dir / "absent.ini"); }, std::runtime_error);
}

}  // namespace
