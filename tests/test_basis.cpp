#include "basis/gtoint_basis.hpp"
#include "molecule/gtoint_constants.hpp"
#include "molecule/gtoint_geometry.hpp"
#include "integrals/gtoint_overlap.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using BASIS::make_contractions;
using BASIS::read_basis_file;

namespace
{
    const std::string data_dir = GTOINT_TEST_DATA_DIR;

    // Write text to a scratch file and return its path
    std::string scratch_file(const std::string& name, const std::string& text)
    {
        const std::filesystem::path path = std::filesystem::temp_directory_path() / name;
        std::ofstream out(path);
        out << text;
        return path.string();
    }
}

TEST(BasisReader, Sto3g)
{
    const BASIS::BasisFile bf = read_basis_file(data_dir + "/sto-3g.gbs");

    EXPECT_EQ(bf.coord_type, "spherical");
    ASSERT_EQ(bf.shells.size(), 2u);

    const auto& h = bf.shells.at("H");
    ASSERT_EQ(h.size(), 1u);
    EXPECT_EQ(h[0].L, 0);
    EXPECT_EQ(h[0].alpha.size(), 3);
    EXPECT_DOUBLE_EQ(h[0].alpha(0), 3.42525091);
    EXPECT_DOUBLE_EQ(h[0].coeffs(2, 0), 0.44463454);

    // SP is split into an S and a P shell with common exponents
    const auto& o = bf.shells.at("O");
    ASSERT_EQ(o.size(), 3u);
    EXPECT_EQ(o[0].L, 0);
    EXPECT_EQ(o[1].L, 0);
    EXPECT_EQ(o[2].L, 1);
    EXPECT_TRUE(o[1].alpha == o[2].alpha);
    EXPECT_DOUBLE_EQ(o[1].coeffs(0, 0), -0.09996723);
    EXPECT_DOUBLE_EQ(o[2].coeffs(0, 0), 0.15591627);
    EXPECT_EQ(o[2].coeffs.cols(), 1);
}

TEST(BasisReader, FortranExponentsAndGeneralContractions)
{
    const std::string file = scratch_file("gtoint_general.gbs",
        "cl 0\n"
        "D   2   1.00\n"
        "  1.0D+01   0.5D0   0.1\n"
        "  2.5d-01   0.6D0   0.9\n"
        "****\n");

    const BASIS::BasisFile bf = read_basis_file(file);

    EXPECT_EQ(bf.coord_type, "cartesian");
    const auto& cl = bf.shells.at("Cl");
    ASSERT_EQ(cl.size(), 1u);
    EXPECT_EQ(cl[0].L, 2);
    EXPECT_DOUBLE_EQ(cl[0].alpha(0), 10.0);
    EXPECT_DOUBLE_EQ(cl[0].alpha(1), 0.25);
    ASSERT_EQ(cl[0].coeffs.cols(), 2);
    EXPECT_DOUBLE_EQ(cl[0].coeffs(1, 0), 0.6);
    EXPECT_DOUBLE_EQ(cl[0].coeffs(1, 1), 0.9);
}

TEST(BasisReader, ScaleFactorIsOptional)
{
    const std::string file = scratch_file("gtoint_no_scale.gbs",
        "H 0\n"
        "S   2\n"
        "  1.5   0.4\n"
        "  0.3   0.7\n"
        "P 1 1.00\n"
        "  0.8   1.0\n"
        "****\n");

    const BASIS::BasisFile bf = read_basis_file(file);
    const auto& h = bf.shells.at("H");

    ASSERT_EQ(h.size(), 2u);
    EXPECT_EQ(h[0].L, 0);
    EXPECT_EQ(h[0].alpha.size(), 2);
    EXPECT_DOUBLE_EQ(h[0].coeffs(1, 0), 0.7);
    EXPECT_EQ(h[1].L, 1);

    const std::string no_count = scratch_file("gtoint_no_count.gbs",
        "H 0\n"
        "S\n"
        "  1.5   0.4\n"
        "****\n");
    EXPECT_THROW(read_basis_file(no_count), std::runtime_error);
}

TEST(BasisReader, MalformedFiles)
{
    EXPECT_THROW(read_basis_file(data_dir + "/no_such_basis.gbs"), std::runtime_error);

    const std::string bad_shell = scratch_file("gtoint_bad_shell.gbs",
        "H 0\n"
        "K   1   1.00\n"
        "  1.0   1.0\n"
        "****\n");
    EXPECT_THROW(read_basis_file(bad_shell), std::runtime_error);

    const std::string bad_number = scratch_file("gtoint_bad_number.gbs",
        "H 0\n"
        "S   2   1.00\n"
        "  1.0   1.0\n"
        "  0.5   abc\n"
        "****\n");
    EXPECT_THROW(read_basis_file(bad_number), std::runtime_error);

    const std::string truncated = scratch_file("gtoint_truncated.gbs",
        "H 0\n"
        "S   3   1.00\n"
        "  1.0   1.0\n");
    EXPECT_THROW(read_basis_file(truncated), std::runtime_error);

    const std::string unterminated = scratch_file("gtoint_unterminated.gbs",
        "H 0\n"
        "S   1   1.00\n"
        "  1.0   1.0\n");
    EXPECT_THROW(read_basis_file(unterminated), std::runtime_error);
}

TEST(BasisReader, NormalizeLabel)
{
    EXPECT_EQ(BASIS::normalize_label("CL"), "Cl");
    EXPECT_EQ(BASIS::normalize_label("c"), "C");
    EXPECT_EQ(BASIS::normalize_label("He"), "He");
}

TEST(MakeContractions, Water)
{
    const BASIS::BasisFile bf = read_basis_file(data_dir + "/sto-3g.gbs");
    const MOLEC::Geometry geom = MOLEC::Geometry::read_xyz(data_dir + "/water.xyz", "angstrom");

    const auto shells = make_contractions(bf.shells, geom.get_labels(), geom.get_coords());

    ASSERT_EQ(shells.size(), 5u);
    EXPECT_EQ(shells[2].L(), 1);
    EXPECT_TRUE(shells[3].r().isApprox(geom.get_coords().row(1).transpose()));

    // 1s 2s 2p on O, 1s on each H
    const EigenMatrix<double> S = OVERLAP::overlap_integral(shells, bf.coord_type);
    ASSERT_EQ(S.rows(), 7);

    for (Index i = 0; i < S.rows(); ++i)
        EXPECT_NEAR(S(i, i), 1.0, 1.0E-10);

    // O 1s and 2s overlap in STO-3G
    EXPECT_NEAR(S(0, 1), 0.2367, 1.0E-04);
}

TEST(MakeContractions, InvalidInput)
{
    const BASIS::BasisFile bf = read_basis_file(data_dir + "/sto-3g.gbs");

    EigenMatrix<double> coords = EigenMatrix<double>::Zero(2, 3);
    EXPECT_THROW(make_contractions(bf.shells, {"H", "C"}, coords), std::invalid_argument);
    EXPECT_THROW(make_contractions(bf.shells, {"H"}, coords), std::invalid_argument);
    EXPECT_THROW(make_contractions(bf.shells, {"H", "H"}, EigenMatrix<double>::Zero(2, 2)), std::invalid_argument);
}

TEST(Geometry, ReadXyz)
{
    const MOLEC::Geometry bohr = MOLEC::Geometry::read_xyz(data_dir + "/water.xyz", "bohr");
    const MOLEC::Geometry angs = MOLEC::Geometry::read_xyz(data_dir + "/water.xyz", "angstrom");

    ASSERT_EQ(bohr.get_num_atoms(), 3);
    EXPECT_EQ(bohr.get_labels()[0], "O");
    EXPECT_EQ(bohr.get_comment(), "water, Angstrom");
    EXPECT_DOUBLE_EQ(bohr.get_charges()(0), 8.0);
    EXPECT_DOUBLE_EQ(bohr.get_charges()(2), 1.0);
    EXPECT_DOUBLE_EQ(bohr.get_coords()(1, 1), 0.755453);
    EXPECT_NEAR(angs.get_coords()(1, 1), 0.755453 * MOLEC_CONSTANTS::angstrom_to_bohr, 1.0E-12);

    const Vec3D coc = bohr.get_center_of_charge_vector();
    EXPECT_NEAR(coc(1), 0.0, 1.0E-12);
    EXPECT_NEAR(coc(2), (8.0 * 0.117790 - 2.0 * 0.471161) / 10.0, 1.0E-12);
}

TEST(Geometry, InvalidInput)
{
    EXPECT_THROW(MOLEC::Geometry::read_xyz(data_dir + "/water.xyz", "parsec"), std::invalid_argument);
    EXPECT_THROW(MOLEC::Geometry::read_xyz(data_dir + "/missing.xyz", "bohr"), std::runtime_error);

    const std::string short_file = scratch_file("gtoint_short.xyz", "3\ncomment\nO 0 0 0\n");
    EXPECT_THROW(MOLEC::Geometry::read_xyz(short_file, "bohr"), std::runtime_error);

    EigenMatrix<double> coords = EigenMatrix<double>::Zero(1, 3);
    EXPECT_THROW(MOLEC::Geometry({"Xx"}, coords), std::invalid_argument);
}
