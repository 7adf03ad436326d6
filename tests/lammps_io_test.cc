// Tester for the LAMMPS data/molecule readers and the template writers.

#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "rxmap/core/ElementTable.hpp"
#include "rxmap/io/LammpsDataReader.hpp"
#include "rxmap/io/TemplateWriter.hpp"
#include "rxmap/reaction/MappingEmitter.hpp"
#include "test_structures.h"

namespace {

using rxmap::StructureData;
using testing::DoubleEq;
using testing::ElementsAre;
using testing::HasSubstr;
using testing::Not;

const char kDataFile[] = R"(LAMMPS data file via write_data

5 atoms
3 atom types
4 bonds
1 angles

0.0 10.0 xlo xhi
0.0 10.0 ylo yhi
0.0 10.0 zlo zhi

Masses

1 12.011
2 15.999 # O
3 1.008

Pair Coeffs # lj/cut

1 0.1 3.4
2 0.2 3.0
3 0.0 0.0

Atoms # full

1 1 1 -0.1 0.0 0.0 0.0
2 1 1 0.1 1.5 0.0 0.0
3 1 2 -0.4 2.9 0.0 0.0 0 0 0
4 1 3 0.4 3.5 0.8 0.0
5 1 3 0.0 -0.5 0.9 0.0

Velocities

1 0.0 0.0 0.0
2 0.0 0.0 0.0
3 0.0 0.0 0.0
4 0.0 0.0 0.0
5 0.0 0.0 0.0

Bonds

1 1 1 2
2 1 2 3
3 2 3 4
4 3 1 5

Angles

1 1 1 2 3
)";

const char kMoleculeFile[] = R"(# pre-reaction template

3 atoms
2 bonds

Coords

1 0.0 0.0 0.0
2 1.0 0.0 0.0
3 2.0 0.0 0.0

Types

1 1
2 2
3 1

Charges

1 0.1
2 -0.2
3 0.1

Bonds

1 1 1 2
2 1 2 3
)";

StructureData ReadData(const std::string& text, const std::string& source = "test.data") {
  std::istringstream in(text);
  return rxmap::read_lammps_data(in, source);
}

TEST(TestLammpsData, ReadFullStyle) {
  const StructureData d = ReadData(kDataFile);
  EXPECT_EQ(d.atom_style, "full");
  EXPECT_TRUE(d.has_charges);
  EXPECT_TRUE(d.has_mol);
  ASSERT_EQ(d.atoms.size(), 5u);
  EXPECT_EQ(d.atoms[2].id, 3);
  EXPECT_EQ(d.atoms[2].type, 2);
  EXPECT_THAT(d.atoms[2].charge, DoubleEq(-0.4));
  EXPECT_THAT(d.atoms[2].pos[0], DoubleEq(2.9));
  ASSERT_EQ(d.bonds.size(), 4u);
  EXPECT_EQ(d.bonds[2].type, 2);
  EXPECT_EQ(d.bonds[2].ai, 3);
  EXPECT_EQ(d.bonds[2].aj, 4);
  EXPECT_EQ(d.angles.size(), 1u);
  ASSERT_EQ(d.mass_by_type.size(), 4u);
  EXPECT_THAT(d.mass_by_type[2], DoubleEq(15.999));
}

TEST(TestLammpsData, ElementsFromMasses) {
  const StructureData d = ReadData(kDataFile);
  const auto elements = rxmap::ElementTable::from_masses(d.mass_by_type);
  EXPECT_EQ(elements.element(1), "C");
  EXPECT_EQ(elements.element(2), "O");
  EXPECT_TRUE(elements.is_hydrogen(3));
  EXPECT_EQ(elements.element(7), "T7");
}

TEST(TestLammpsData, StyleInferredFromColumns) {
  const StructureData d = ReadData("title\n\n2 atoms\n\nAtoms\n\n1 1 0.0 0.0 0.0\n2 1 1.0 0.0 0.0\n");
  EXPECT_EQ(d.atom_style, "atomic");
  EXPECT_FALSE(d.has_mol);
  EXPECT_FALSE(d.has_charges);
  EXPECT_EQ(d.atoms.size(), 2u);
}

TEST(TestLammpsData, NoAtomsThrows) {
  EXPECT_THROW(ReadData("title\n\n0 atoms\n"), std::runtime_error);
}

struct MalformedCase {
  std::string name;
  std::string text;
  std::string expected;
};

class TestMalformedData : public testing::TestWithParam<MalformedCase> {};

TEST_P(TestMalformedData, Tests) {
  const auto params = GetParam();
  try {
    ReadData(params.text, "bad.data");
    FAIL() << "expected a parse error for\n" << params.text;
  } catch (const std::runtime_error& e) {
    EXPECT_THAT(e.what(), HasSubstr("bad.data"));
    EXPECT_THAT(e.what(), HasSubstr(params.expected));
  }
}
INSTANTIATE_TEST_SUITE_P(TestMalformedData, TestMalformedData, testing::Values(
  MalformedCase{"ShortBondLine", "t\n\nAtoms # full\n\n1 1 1 0.0 0 0 0\n2 1 1 0.0 1 0 0\n\nBonds\n\n1 1 2\n",
                "line 10: malformed Bonds line"},
  MalformedCase{"BadAtomId", "t\n\nAtoms # full\n\n1x 1 1 0.0 0 0 0\n", "line 5: invalid integer for Atoms.id"},
  MalformedCase{"BadCharge", "t\n\nAtoms # full\n\n1 1 1 abc 0 0 0\n", "invalid number for Atoms.q"},
  MalformedCase{"UnknownColumnCount", "t\n\nAtoms\n\n1 1 1 0\n", "cannot infer atom style"},
  MalformedCase{"UnsupportedStyle", "t\n\nAtoms # sphere\n\n1 1 1 1.0 0 0 0\n", "unsupported atom style 'sphere'"},
  MalformedCase{"SixColumnsNeedHint", "t\n\nAtoms\n\n1 1 -1 0.0 0.0 0.0\n",
                "line 5: ambiguous atom style for 6 columns"},
  MalformedCase{"NineColumnsNeedHint", "t\n\nAtoms\n\n1 1 2 0.0 0.0 0.0 0 0 0\n", "ambiguous atom style for 9 columns"},
  MalformedCase{"NegativeAtomType", "t\n\nAtoms # molecular\n\n1 1 -1 0.0 0.0 0.0\n",
                "line 5: Atoms.type must be >= 1 (got -1)"},
  MalformedCase{"ZeroAtomTypeCharge", "t\n\nAtoms # charge\n\n1 0 -0.5 0.0 0.0 0.0\n",
                "Atoms.type must be >= 1 (got 0)"},
  MalformedCase{"ZeroMassType", "t\n\nMasses\n\n0 12.0\n", "Masses.type must be >= 1"}
), [](const testing::TestParamInfo<MalformedCase>& info) { return info.param.name; });

TEST(TestLammpsData, ChargeStyleWithHint) {
  const StructureData d = ReadData("t\n\nAtoms # charge\n\n1 2 -0.5 1.0 0.0 0.0\n2 1 0.5 2.0 0.0 0.0\n");
  EXPECT_EQ(d.atom_style, "charge");
  EXPECT_TRUE(d.has_charges);
  EXPECT_FALSE(d.has_mol);
  ASSERT_EQ(d.atoms.size(), 2u);
  EXPECT_EQ(d.atoms[0].type, 2);
  EXPECT_THAT(d.atoms[0].charge, DoubleEq(-0.5));
  EXPECT_THAT(d.atoms[1].pos[0], DoubleEq(2.0));
}

TEST(TestLammpsMolecule, ReadSections) {
  std::istringstream in(kMoleculeFile);
  const StructureData d = rxmap::read_lammps_molecule(in, "pre.mol");
  EXPECT_EQ(d.atom_style, "molecule");
  EXPECT_TRUE(d.has_charges);
  EXPECT_FALSE(d.has_mol);
  ASSERT_EQ(d.atoms.size(), 3u);
  EXPECT_EQ(d.atoms[1].type, 2);
  EXPECT_THAT(d.atoms[1].charge, DoubleEq(-0.2));
  EXPECT_THAT(d.atoms[2].pos[0], DoubleEq(2.0));
  EXPECT_EQ(d.bonds.size(), 2u);
}

TEST(TestLammpsMolecule, TypesMustBePositive) {
  std::istringstream in("mol\n\n1 atoms\n\nCoords\n\n1 0.0 0.0 0.0\n\nTypes\n\n1 0\n");
  try {
    rxmap::read_lammps_molecule(in, "bad.mol");
    FAIL() << "expected a type error";
  } catch (const std::runtime_error& e) {
    EXPECT_THAT(e.what(), HasSubstr("bad.mol"));
    EXPECT_THAT(e.what(), HasSubstr("line 11: Types.type must be >= 1 (got 0)"));
  }
}

TEST(TestLammpsMolecule, ReadStructureDispatches) {
  const auto dir = rxmap_test::ScratchDir("rxmap_io_dispatch");
  ASSERT_TRUE(rxmap_test::WriteText(dir / "a.data", kDataFile));
  ASSERT_TRUE(rxmap_test::WriteText(dir / "b.mol", kMoleculeFile));

  EXPECT_EQ(rxmap::read_structure(dir / "a.data").atom_style, "full");
  EXPECT_EQ(rxmap::read_structure(dir / "b.mol").atom_style, "molecule");
  EXPECT_THROW(rxmap::read_structure(dir / "missing.data"), std::runtime_error);
}

TEST(TestExtractTemplate, RenumbersAndDropsCrossingTopology) {
  const StructureData full = ReadData(kDataFile);
  const StructureData tpl = rxmap::extract_template(full, {3, 1, 2});

  ASSERT_EQ(tpl.atoms.size(), 3u);
  EXPECT_EQ(tpl.atoms[0].id, 1);
  EXPECT_EQ(tpl.atoms[0].type, 2);
  EXPECT_THAT(tpl.atoms[0].pos[0], DoubleEq(2.9));
  EXPECT_TRUE(tpl.has_charges);

  // 1-2 -> 2-3 and 2-3 -> 3-1 survive; 3-4 and 1-5 leave the template.
  ASSERT_EQ(tpl.bonds.size(), 2u);
  EXPECT_EQ(tpl.bonds[0].ai, 2);
  EXPECT_EQ(tpl.bonds[0].aj, 3);
  EXPECT_EQ(tpl.bonds[1].ai, 3);
  EXPECT_EQ(tpl.bonds[1].aj, 1);
  ASSERT_EQ(tpl.angles.size(), 1u);
  EXPECT_EQ(tpl.angles[0].ai, 2);
  EXPECT_EQ(tpl.angles[0].aj, 3);
  EXPECT_EQ(tpl.angles[0].ak, 1);
}

TEST(TestExtractTemplate, RejectsBadAtomLists) {
  const StructureData full = ReadData(kDataFile);
  EXPECT_THROW(rxmap::extract_template(full, {1, 2, 1}), std::runtime_error);
  EXPECT_THROW(rxmap::extract_template(full, {1, 9}), std::runtime_error);
}

TEST(TestWriteMolecule, ReadableByMoleculeReader) {
  const StructureData tpl = rxmap::extract_template(ReadData(kDataFile), {1, 2, 3});
  std::ostringstream out;
  rxmap::write_molecule(out, tpl, "pre-reaction template");
  const std::string text = out.str();

  EXPECT_THAT(text, HasSubstr("# pre-reaction template\n\n3 atoms\n2 bonds\n1 angles\n"));
  EXPECT_THAT(text, HasSubstr("\nCharges\n\n"));
  EXPECT_THAT(text, HasSubstr("\nMolecules\n\n"));
  EXPECT_THAT(text, Not(HasSubstr("Dihedrals")));

  std::istringstream in(text);
  const StructureData back = rxmap::read_lammps_molecule(in, "written");
  ASSERT_EQ(back.atoms.size(), 3u);
  EXPECT_EQ(back.atoms[2].type, 2);
  EXPECT_THAT(back.atoms[2].charge, DoubleEq(-0.4));
  EXPECT_EQ(back.atoms[2].mol, 1);
  EXPECT_EQ(back.bonds.size(), 2u);
  EXPECT_EQ(back.angles.size(), 1u);
}

rxmap::MappingRecord SmallRecord() {
  rxmap::MappingRecord rec;
  for (int i = 1; i <= 2; ++i) {
    rxmap::MappingEntry e;
    e.pre_id = i;
    e.post_id = i;
    e.pre_local = i;
    e.post_local = i;
    rec.entries.push_back(e);
  }
  rxmap::MappingEntry gone;
  gone.pre_id = 5;
  gone.pre_local = 3;
  gone.deleted = true;
  rec.entries.push_back(gone);
  rxmap::MappingEntry born;
  born.post_id = 6;
  born.post_local = 3;
  born.created = true;
  rec.entries.push_back(born);

  rec.initiators = {1, 2};
  rec.edges = {2};
  rec.deletes = {3};
  rec.creates = {3};
  rec.pre_count = 3;
  rec.post_count = 3;
  return rec;
}

TEST(TestWriteMap, Format) {
  std::ostringstream out;
  rxmap::write_map(out, SmallRecord(), "test map");
  EXPECT_EQ(out.str(),
            "# test map\n\n"
            "2 equivalences\n"
            "1 edgeIDs\n"
            "1 deleteIDs\n"
            "1 createIDs\n"
            "\nInitiatorIDs\n\n1\n2\n"
            "\nEdgeIDs\n\n2\n"
            "\nDeleteIDs\n\n3\n"
            "\nCreateIDs\n\n3\n"
            "\nEquivalences\n\n1\t1\n2\t2\n");
}

TEST(TestWriteMap, EmptySectionsOmitted) {
  rxmap::MappingRecord rec = SmallRecord();
  rec.edges.clear();
  rec.creates.clear();
  std::ostringstream out;
  rxmap::write_map(out, rec, "t");
  EXPECT_THAT(out.str(), HasSubstr("0 edgeIDs\n"));
  EXPECT_THAT(out.str(), Not(HasSubstr("EdgeIDs")));
  EXPECT_THAT(out.str(), Not(HasSubstr("CreateIDs")));
}

}  // namespace
