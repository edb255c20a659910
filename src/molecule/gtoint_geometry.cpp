#include "gtoint_geometry.hpp"
#include "gtoint_constants.hpp"
#include "gtoint_elements.hpp"
#include "../basis/gtoint_basis.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

using MOLEC_CONSTANTS::angstrom_to_bohr;

MOLEC::Geometry::Geometry(const std::vector<std::string>& labels, const EigenMatrix<double>& coords)
: m_coords(coords)
{
    if (m_coords.cols() != 3)
        throw std::invalid_argument("Coordinates must have 3 columns.");

    if (static_cast<Index>(labels.size()) != m_coords.rows())
        throw std::invalid_argument("Number of atom labels and coordinates differ.");

    m_charges = EigenVector<double>(m_coords.rows());

    for (size_t i = 0; i < labels.size(); ++i)
    {
        const std::string name = BASIS::normalize_label(labels[i]);
        const auto iter = ELEMENTDATA::name_to_Z.find(name);

        if (iter == ELEMENTDATA::name_to_Z.end())
            throw std::invalid_argument("Unsupported element: " + labels[i]);

        m_labels.emplace_back(name);
        m_charges(static_cast<Index>(i)) = iter->second;
    }
}

MOLEC::Geometry MOLEC::Geometry::read_xyz(const std::string& filename, const std::string& unit)
{
    double unit_convert = 1.0;
    if (unit == "angstrom")
        unit_convert = angstrom_to_bohr;
    else if (unit != "bohr")
        throw std::invalid_argument("Unknown unit type " + unit + ", expected angstrom or bohr.");

    if (!std::filesystem::exists(filename))
        throw std::runtime_error("Geometry file " + filename + " does not exist.");

    std::ifstream inputfile(filename, std::ifstream::in);
    std::string line;

    std::getline(inputfile, line);
    Index natoms = 0;
    {
        std::istringstream data(line);
        data >> natoms;
        if (data.fail() || natoms <= 0)
            throw std::runtime_error("Error reading " + filename + ": first line must hold the number of atoms.\n"
                                     + "  last known data: " + line);
    }

    std::string title;
    std::getline(inputfile, title);

    std::vector<std::string> labels;
    EigenMatrix<double> coords = EigenMatrix<double>(natoms, 3);

    for (Index i = 0; i < natoms; ++i)
    {
        if (!std::getline(inputfile, line))
            throw std::runtime_error("Error reading " + filename + ": expected " + std::to_string(natoms)
                                     + " atoms, found " + std::to_string(i) + ".");

        std::istringstream data(line);
        std::string atom_symbol;
        double x, y, z;
        data >> atom_symbol >> x >> y >> z;

        if (data.fail())
            throw std::runtime_error("Error reading " + filename + ": bad coordinate format on line containing:\n  "
                                     + line);

        labels.emplace_back(atom_symbol);
        coords.row(i) << x * unit_convert, y * unit_convert, z * unit_convert;
    }

    Geometry geom(labels, coords);
    geom.comment = title;

    return geom;
}

Vec3D MOLEC::Geometry::get_center_of_charge_vector() const
{
    return (m_coords.transpose() * m_charges) / m_charges.sum();
}
