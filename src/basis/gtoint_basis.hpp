#ifndef GTOINT_BASIS
#define GTOINT_BASIS
#include "../integrals/gtoint_shell.hpp"
#include <map>
#include <string>
#include <vector>

using BASIS::ContractionShell;
using ShellVector = std::vector<ContractionShell>;

namespace BASIS
{
// One shell of an element's basis, K exponents and a K x M coefficient matrix
struct ShellData
{
    int L;
    EigenVector<double> alpha;
    EigenMatrix<double> coeffs;
};

// element label -> shells, in file order
using BasisDict = std::map<std::string, std::vector<ShellData>>;

struct BasisFile
{
    std::string coord_type{"cartesian"}; // header line, cartesian unless stated otherwise
    BasisDict shells;
};

// "c", "CL" -> "C", "Cl"
std::string normalize_label(const std::string& label);

// Gaussian94 / psi4 .gbs format. Throws std::runtime_error for a missing or malformed file.
BasisFile read_basis_file(const std::string& filename);

// Shells for each atom in order, atom i centred at coords row i (Bohr)
ShellVector make_contractions(const BasisDict& basis_dict, const std::vector<std::string>& atoms,
                              const EigenMatrix<double>& coords);
}

#endif
// end GTOINT_BASIS
