#include "gtoint_basis.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace
{
    const std::map<std::string, int> orbital_types
    {
        {"S", 0}, {"P", 1}, {"D", 2}, {"F", 3}, {"G", 4}, {"H", 5}, {"I", 6}
    };

    std::string strip(const std::string& line)
    {
        const auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos) return "";

        const auto last = line.find_last_not_of(" \t\r");
        return line.substr(first, last - first + 1);
    }

    [[noreturn]] void parse_error(const std::string& filename, size_t line_num, const std::string& line,
                                  const std::string& what)
    {
        throw std::runtime_error("Error reading basis file " + filename + " line " + std::to_string(line_num)
                                 + ": " + what + "\n  last known data: " + line);
    }

    // Exponent followed by one or more coefficients, Fortran D exponents accepted
    std::vector<double> parse_numbers(std::string line)
    {
        std::for_each(line.begin(), line.end(), [] (char& c){ if (c == 'D' || c == 'd') c = 'E'; });
        std::istringstream data(line);

        std::vector<double> values;
        std::string token;
        while (data >> token)
        {
            size_t pos = 0;
            const double val = std::stod(token, &pos);
            if (pos != token.size()) throw std::invalid_argument(token);
            values.emplace_back(val);
        }

        return values;
    }
}

std::string BASIS::normalize_label(const std::string& label)
{
    std::string name = label;
    for (size_t i = 0; i < name.size(); ++i)
        name[i] = (i) ? static_cast<char>(std::tolower(name[i])) : static_cast<char>(std::toupper(name[i]));

    return name;
}

BASIS::BasisFile BASIS::read_basis_file(const std::string& filename)
{
    if (!std::filesystem::exists(filename))
        throw std::runtime_error("Basis file " + filename + " does not exist.");

    std::ifstream inputfile(filename, std::ifstream::in);
    if (!inputfile.good())
        throw std::runtime_error("Unable to open basis file " + filename + ".");

    BasisFile basis;
    std::string line;
    size_t line_num = 0;

    const auto next_line = [&]() -> bool
    {
        if (!std::getline(inputfile, line)) return false;
        ++line_num;
        line = strip(line);
        return true;
    };

    std::string atom_name;
    bool in_atom = false;

    while (next_line())
    {
        if (line.empty() || "!" == line.substr(0, 1)) continue;

        // Get the header line for the basis, spherical or cartesian if present
        if (!in_atom && (line == "cartesian" || line == "spherical"))
        {
            basis.coord_type = line;
            continue;
        }

        if ("*" == line.substr(0, 1))
        {
            in_atom = false;
            continue;
        }

        std::istringstream data(line);

        if (!in_atom)
        {
            int endmarker = -1;
            data >> atom_name >> endmarker; // endmarker unused

            if (data.fail() || atom_name.empty() || !std::isalpha(static_cast<unsigned char>(atom_name[0])))
                parse_error(filename, line_num, line, "expected an atom header \"El 0\".");

            atom_name = normalize_label(atom_name);
            basis.shells[atom_name]; // an element may carry no shells
            in_atom = true;
            continue;
        }

        // Shell header, e.g. "SP 3 1.00". The scale factor is optional and currently unused.
        std::string orbitaltype;
        int num_cof = 0;
        data >> orbitaltype >> num_cof;
        const bool header_read = !data.fail();

        std::transform(orbitaltype.begin(), orbitaltype.end(), orbitaltype.begin(),
                       [] (unsigned char c){ return static_cast<char>(std::toupper(c)); });

        const bool sp_shell = "SP" == orbitaltype;
        const auto iter = orbital_types.find(orbitaltype);

        if (!header_read || num_cof <= 0 || (!sp_shell && iter == orbital_types.end()))
            parse_error(filename, line_num, line, "unrecognised shell. S, P, SP, D, F, G, H and I supported only.");

        std::vector<std::vector<double>> rows;

        for (int i = 0; i < num_cof; ++i)
        {
            if (!next_line())
                parse_error(filename, line_num, line, "unexpected end of file inside a shell.");

            std::vector<double> values;
            try
            {
                values = parse_numbers(line);
            }
            catch (const std::invalid_argument&)
            {
                parse_error(filename, line_num, line, "expected an exponent and coefficients.");
            }
            catch (const std::out_of_range&)
            {
                parse_error(filename, line_num, line, "number out of range.");
            }

            if (values.size() < 2 || (sp_shell && values.size() != 3))
                parse_error(filename, line_num, line, "wrong number of coefficients.");

            if (!rows.empty() && rows.back().size() != values.size())
                parse_error(filename, line_num, line, "inconsistent number of coefficients within a shell.");

            rows.emplace_back(values);
        }

        const Index K = static_cast<Index>(rows.size());
        const Index M = static_cast<Index>(rows[0].size()) - 1;

        EigenVector<double> alpha = EigenVector<double>(K);
        EigenMatrix<double> coeffs = EigenMatrix<double>(K, M);

        for (Index k = 0; k < K; ++k)
        {
            alpha(k) = rows[k][0];
            for (Index m = 0; m < M; ++m) coeffs(k, m) = rows[k][m + 1];
        }

        auto& shells = basis.shells[atom_name];

        if (sp_shell)
        {
            shells.emplace_back(ShellData{0, alpha, coeffs.col(0)});
            shells.emplace_back(ShellData{1, alpha, coeffs.col(1)});
        }
        else
            shells.emplace_back(ShellData{iter->second, alpha, coeffs});
    }

    if (in_atom)
        throw std::runtime_error("Error reading basis file " + filename + ": last atom block " + atom_name
                                 + " is not terminated by ****.");

    return basis;
}

ShellVector BASIS::make_contractions(const BasisDict& basis_dict, const std::vector<std::string>& atoms,
                                     const EigenMatrix<double>& coords)
{
    if (coords.cols() != 3)
        throw std::invalid_argument("Coordinates must have 3 columns, got " + std::to_string(coords.cols()) + ".");

    if (static_cast<Index>(atoms.size()) != coords.rows())
        throw std::invalid_argument("Got " + std::to_string(atoms.size()) + " atoms and "
                                    + std::to_string(coords.rows()) + " coordinates.");

    ShellVector shells;

    for (size_t a = 0; a < atoms.size(); ++a)
    {
        const auto iter = basis_dict.find(normalize_label(atoms[a]));

        if (iter == basis_dict.end())
            throw std::invalid_argument("Atom " + atoms[a] + " is not present in the basis set.");

        const Vec3D r = coords.row(static_cast<Index>(a)).transpose();

        for (const auto& sd : iter->second)
            shells.emplace_back(ContractionShell(sd.L, r, sd.coeffs, sd.alpha));
    }

    return shells;
}
