#ifndef MOLEC_GEOMETRY_H
#define MOLEC_GEOMETRY_H

#include "../math/gtoint_math.hpp"
#include <string>
#include <vector>

namespace MOLEC
{
    // Atom labels, nuclear charges and Bohr coordinates of a molecule
    class Geometry
    {
        public:
            Geometry() = delete;
            explicit Geometry(const std::vector<std::string>& labels, const EigenMatrix<double>& coords);

            // XYZ file: atom count, comment line, then "El x y z" per atom.
            // unit is "angstrom" or "bohr". Throws std::runtime_error for a missing or malformed file.
            static Geometry read_xyz(const std::string& filename, const std::string& unit);

            const std::vector<std::string>& get_labels() const {return m_labels;}
            const EigenMatrix<double>& get_coords() const {return m_coords;}
            const EigenVector<double>& get_charges() const {return m_charges;}
            const std::string& get_comment() const {return comment;}
            Index get_num_atoms() const {return m_coords.rows();}

            // Get the center of charge vector. Useful for dipoles or other properties
            Vec3D get_center_of_charge_vector() const;

        private:
            std::vector<std::string> m_labels;
            EigenMatrix<double> m_coords;
            EigenVector<double> m_charges;
            std::string comment;
    };
}

#endif
// MOLEC_GEOMETRY_H
