// Tester for RunConfig and Runner

#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "rxmap/app/Runner.hpp"
#include "rxmap/config/IniConfig.hpp"
#include "rxmap/io/LammpsDataReader.hpp"
#include "test_structures.h"

namespace {

namespace fs = std::filesystem;

using rxmap::IniConfig;
using rxmap::RunConfig;
using rxmap::Runner;
using testing::HasSubstr;

// Twelve carbons as two chains 1..6 and 7..12, or one chain when `coupled`.
std::string ChainData(bool coupled) {
  std::ostringstream out;
  out << "chain " << (coupled ? "after" : "before") << "\n\n";
  out << "12 atoms\n" << (coupled ? 11 : 10) << " bonds\n1 atom types\n1 bond types\n\n";
  out << "0.0 20.0 xlo xhi\n0.0 20.0 ylo yhi\n0.0 20.0 zlo zhi\n\n";
  out << "Masses\n\n1 12.011\n\n";
  out << "Atoms # full\n\n";
  for (int i = 1; i <= 12; ++i) {
    out << i << " " << (coupled || i <= 6 ? 1 : 2) << " 1 0.0 " << 1.5 * i << " 0.0 0.0\n";
  }
  out << "\nBonds\n\n";
  int n = 0;
  for (int i = 1; i < 12; ++i) {
    if (!coupled && i == 6) continue;
    out << ++n << " 1 " << i << " " << i + 1 << "\n";
  }
  return out.str();
}

const char kRunConfig[] = R"([input]
pre_data = pre.data
post_data = post.data

[reaction]
bonding_atoms = 6 7
elements_by_type = C

[output]
directory = out
)";

class TestRunner : public testing::Test {
  protected:
    fs::path _dir;

    void SetUp() override {
      _dir = rxmap_test::ScratchDir("rxmap_runner");
      ASSERT_TRUE(rxmap_test::WriteText(_dir / "pre.data", ChainData(false)));
      ASSERT_TRUE(rxmap_test::WriteText(_dir / "post.data", ChainData(true)));
    }

    IniConfig Config(const std::string& text) {
      EXPECT_TRUE(rxmap_test::WriteText(_dir / "run.ini", text));
      return IniConfig(_dir / "run.ini");
    }
};

TEST_F(TestRunner, ResolvesPathsAndDefaults) {
  const IniConfig cfg = Config(kRunConfig);
  const RunConfig rc = RunConfig::from_ini(cfg);
  EXPECT_EQ(rc.pre_data, _dir / "pre.data");
  EXPECT_EQ(rc.out_dir, _dir / "out");
  EXPECT_EQ(rc.map, _dir / "out" / "automap.data");
  EXPECT_EQ(rc.pre_template, _dir / "out" / "pre-molecule.data");
  EXPECT_EQ(rc.spec.post_bonding, rc.spec.pre_bonding);
  EXPECT_EQ(rc.options.correspondence, rxmap::CorrespondenceMode::Identity);
  EXPECT_EQ(rc.options.boundary.initial_radius, 3);
  EXPECT_TRUE(rc.options.disconnected_byproducts);
}

TEST_F(TestRunner, CorrespondenceModes) {
  const IniConfig cfg = Config(std::string(kRunConfig) + "\n[mapping]\ncorrespondence = search\n");
  EXPECT_EQ(RunConfig::from_ini(cfg).options.correspondence, rxmap::CorrespondenceMode::Neighbourhood);

  const IniConfig bad = Config(std::string(kRunConfig) + "\n[mapping]\ncorrespondence = guess\n");
  EXPECT_THROW(RunConfig::from_ini(bad), std::runtime_error);
}

TEST_F(TestRunner, RejectsBadReactionKeys) {
  EXPECT_THROW(RunConfig::from_ini(Config("[input]\npre_data=a\npost_data=b\n[reaction]\nbonding_atoms = 1 2 3\n")),
               std::runtime_error);
  EXPECT_THROW(RunConfig::from_ini(Config("[input]\npre_data=a\npost_data=b\n[reaction]\nbonding_atoms = 4 4\n")),
               std::runtime_error);
  EXPECT_THROW(RunConfig::from_ini(Config("[input]\npre_data=a\npost_data=b\n[reaction]\nbonding_atoms = 1 2\n"
                                          "delete_atoms = 5 6\npost_delete_atoms = 5\n")),
               std::runtime_error);
  EXPECT_THROW(RunConfig::from_ini(Config(std::string(kRunConfig) + "\n[mapping]\nexpand_hops_self = 0\n")),
               std::runtime_error);
}

TEST_F(TestRunner, ValidateWritesNothing) {
  const IniConfig cfg = Config(kRunConfig);
  Runner runner(cfg);
  EXPECT_EQ(runner.validate_config(), 0);
  EXPECT_FALSE(fs::exists(_dir / "out"));
}

TEST_F(TestRunner, UnknownBondingAtom) {
  std::string text = kRunConfig;
  text.replace(text.find("6 7"), 3, "6 70");
  const IniConfig cfg = Config(text);
  Runner runner(cfg);
  EXPECT_THROW(runner.validate_config(), std::runtime_error);
}

TEST_F(TestRunner, WritesTemplatesAndMap) {
  const IniConfig cfg = Config(kRunConfig);
  Runner runner(cfg);
  ASSERT_EQ(runner.run(), 0);

  const fs::path out = _dir / "out";
  ASSERT_TRUE(fs::exists(out / "automap.data"));
  ASSERT_TRUE(fs::exists(out / "pre-molecule.data"));
  ASSERT_TRUE(fs::exists(out / "post-molecule.data"));

  // Retained atoms 3..10; edges 3 and 10 become local ids 1 and 8.
  const std::string map = rxmap_test::ReadText(out / "automap.data");
  EXPECT_THAT(map, HasSubstr("8 equivalences\n2 edgeIDs\n0 deleteIDs\n0 createIDs\n"));
  EXPECT_THAT(map, HasSubstr("\nInitiatorIDs\n\n4\n5\n"));
  EXPECT_THAT(map, HasSubstr("\nEdgeIDs\n\n1\n8\n"));
  EXPECT_THAT(map, HasSubstr("\nEquivalences\n\n1\t1\n"));

  const auto pre = rxmap::read_lammps_molecule(out / "pre-molecule.data");
  const auto post = rxmap::read_lammps_molecule(out / "post-molecule.data");
  EXPECT_EQ(pre.atoms.size(), 8u);
  EXPECT_EQ(post.atoms.size(), 8u);
  EXPECT_EQ(pre.bonds.size(), 6u);
  EXPECT_EQ(post.bonds.size(), 7u);
  EXPECT_TRUE(pre.has_mol);
}

TEST_F(TestRunner, FailedWriteKeepsPreviousOutputs) {
  const fs::path out = _dir / "out";
  ASSERT_TRUE(fs::create_directories(out / "automap.data" / "keep"));
  ASSERT_TRUE(rxmap_test::WriteText(out / "pre-molecule.data", "previous\n"));

  const IniConfig cfg = Config(kRunConfig);
  Runner runner(cfg);
  EXPECT_THROW(runner.run(), std::runtime_error);

  EXPECT_EQ(rxmap_test::ReadText(out / "pre-molecule.data"), "previous\n");
  EXPECT_FALSE(fs::exists(out / "post-molecule.data"));
  EXPECT_FALSE(fs::exists(out / "pre-molecule.data.tmp"));
  EXPECT_FALSE(fs::exists(out / "post-molecule.data.tmp"));
  EXPECT_FALSE(fs::exists(out / "automap.data.tmp"));
  EXPECT_TRUE(fs::is_directory(out / "automap.data"));
}

}  // namespace
