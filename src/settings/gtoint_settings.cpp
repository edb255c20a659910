#include "gtoint_settings.hpp"
#include <stdexcept>

using namespace SETTINGS;

void gtoint_settings::set_basis_set_path(const std::string& basis_set_path)
{
    m_basis_set_path = basis_set_path;
}

void gtoint_settings::set_basis_coord_type(const std::string& basis_coord_type)
{
    if (basis_coord_type != "cartesian" && basis_coord_type != "spherical")
        throw std::invalid_argument("Invalid coordinate type " + basis_coord_type + ", expected cartesian or spherical.");

    m_basis_coord_type = basis_coord_type;
}

void gtoint_settings::set_unit_type(const std::string& unit)
{
    if (unit != "bohr" && unit != "angstrom")
        throw std::invalid_argument("Invalid unit " + unit + ", expected angstrom or bohr.");

    m_unit_type = unit;
}

// "charge": nuclear center of charge, "origin": (0, 0, 0)
void gtoint_settings::set_moment_origin(const std::string& origin)
{
    if (origin != "charge" && origin != "origin")
        throw std::invalid_argument("Invalid moment origin " + origin + ", expected charge or origin.");

    m_moment_origin = origin;
}

void gtoint_settings::set_moment_order(const int order)
{
    if (order < 0)
        throw std::invalid_argument("Multipole order must be non-negative.");

    m_moment_order = order;
}

void gtoint_settings::set_num_threads(const int nthreads)
{
    if (nthreads < 0)
        throw std::invalid_argument("Number of threads must be non-negative, 0 for all available.");

    m_num_threads = nthreads;
}

void gtoint_settings::set_verbosity(const short verbosity)
{
    if (verbosity < 1 || verbosity > 5)
        throw std::invalid_argument("Verbosity must be in the range 1 to 5.");

    m_verbosity = verbosity;
}
