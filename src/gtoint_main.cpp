#include "settings/gtoint_settings.hpp"
#include "gtoint_main.hpp"
#include "integrals/gtoint_overlap.hpp"
#include "integrals/gtoint_multipole.hpp"
#include "pretty_print/gtoint_pretty_print.hpp"
#include <iostream>
#include <Eigen/Core>
#include <filesystem>
#include <tclap/CmdLine.h>
#include <ctime>
#include <chrono>
#include <iomanip>
#include <cmath>
#include <memory>
#ifdef HAS_CMAKE_CONFIG // cmake support
#include <cmakeconfig.h>
#endif

#ifdef _OPENMP
#include <omp.h>
#endif

using SETTINGS::gtoint_settings;

Mol::gtoint::gtoint(const short verbose, const int threads)
: m_verbose(verbose)
{
    int maxthreads = Eigen::nbThreads();

    if (threads > maxthreads)
    {
        std::cout << "  Warning: supplied threads greater than max threads, "
                  << "setting maximum possible threads to " << maxthreads << '\n';
        Eigen::setNbThreads(maxthreads);
    }
    else if (threads == 0)
    {
        Eigen::setNbThreads(maxthreads);
    }
    else
    {
        #ifdef _OPENMP
        omp_set_num_threads(threads);
        #endif
        Eigen::setNbThreads(threads);
    }
}

void Mol::gtoint::print_banner() const
{
    std::cout << "  ************************************************************************";
    std::cout << "\n  *   gtoint: One electron integrals over contracted Gaussian functions. *";
    std::cout << "\n  *                                                                      *";
    std::cout << "\n  *          Driven by Eigen3: A C++ linear algebra package.             *";
    std::cout << "\n  ************************************************************************\n\n";

    std::cout << "**************************************************************************\n";
    std::cout << "  Build information\n";
    std::cout << "**************************************************************************\n";

    #ifdef HAS_CMAKE_CONFIG
    std::cout << "  C++ Compiler Id            = " << __VERSION__ << '\n';
    std::cout << "  Build system               = cmake\n";
    std::cout << "  Program version            = " << PROGRAM_VERSION << '\n';
    std::cout << "  Project root               = " << GTOINT_DIR << '\n';
    #endif

    #ifdef _OPENMP
    std::cout << "  OPENMP support             = " << "Yes" << '\n';
    #else
    std::cout << "  OPENMP support             = " << "No" << '\n';
    #endif
    std::cout << "  Eigen threads              = " << Eigen::nbThreads() << '\n';
}

void Mol::gtoint::print_geometry(const MOLEC::Geometry& geom) const
{
    GTOUT::print_header("Geometry (Bohr)");
    if (!geom.get_comment().empty()) std::cout << "  " << geom.get_comment() << '\n';

    std::cout << "\n  Atom         Z              x              y              z\n";
    const auto& coords = geom.get_coords();

    for (Index i = 0; i < geom.get_num_atoms(); ++i)
    {
        std::cout << "  " << std::left << std::setw(4) << geom.get_labels()[i]
                  << std::right << std::setw(10) << std::setprecision(1) << std::fixed << geom.get_charges()(i);

        for (Index k = 0; k < 3; ++k)
            std::cout << std::setw(15) << std::setprecision(8) << coords(i, k);

        std::cout << '\n';
    }
}

void Mol::gtoint::print_basis(const ShellVector& shells, const std::string& coord_type) const
{
    const TWOINDEX::CoordSpec coord(coord_type);

    GTOUT::print_header("Basis set");
    std::cout << "  Basis file                 = " << gtoint_settings::get_basis_set_path() << '\n';
    std::cout << "  Coordinate type            = " << coord_type << '\n';
    std::cout << "  Number of shells           = " << shells.size() << '\n';
    std::cout << "  Number of basis functions  = " << coord.num_functions(shells) << '\n';

    if (m_verbose < 3) return;

    constexpr char am_labels[] = "spdfghi";
    std::cout << "\n  Shell   L      x              y              z        K    M\n";

    for (size_t s = 0; s < shells.size(); ++s)
    {
        const auto& sh = shells[s];
        const char label = (sh.L() < 7) ? am_labels[sh.L()] : '?';

        std::cout << "  " << std::setw(5) << s + 1 << "   " << label
                  << std::setprecision(8) << std::fixed
                  << std::setw(15) << sh.x() << std::setw(15) << sh.y() << std::setw(15) << sh.z()
                  << std::setw(5) << sh.num_prims() << std::setw(5) << sh.num_seg_cont() << '\n';
    }
}

void Mol::gtoint::run(const std::string& geometry_file)
{
    if (false == std::filesystem::exists(geometry_file))
        throw std::runtime_error("Input file not found at path: " + geometry_file);

    print_banner();

    const MOLEC::Geometry geom = MOLEC::Geometry::read_xyz(geometry_file, gtoint_settings::get_unit_type());
    if (m_verbose > 1) print_geometry(geom);

    const BASIS::BasisFile basis_file = BASIS::read_basis_file(gtoint_settings::get_basis_set_path());
    const std::string coord_type = gtoint_settings::get_basis_coord_type().value_or(basis_file.coord_type);

    const ShellVector shells = BASIS::make_contractions(basis_file.shells, geom.get_labels(), geom.get_coords());
    print_basis(shells, coord_type);

    const TWOINDEX::CoordSpec coord(coord_type);

    GTOUT::print_header("Overlap matrix");
    const EigenMatrix<double> S = OVERLAP::overlap_integral(shells, coord);
    GTOUT::pretty_print_matrix<double>(S);

    const int max_order = gtoint_settings::get_moment_order();
    if (max_order < 1) return;

    const bool about_charge = gtoint_settings::get_moment_origin() == "charge";
    const std::string origin_name = (about_charge) ? "center of charge" : "origin";
    const Vec3D origin = (about_charge) ? geom.get_center_of_charge_vector() : Vec3D::Zero().eval();
    const EigenMatrix<int> all_orders = MULTIPOLE::orders_up_to(max_order);
    const EigenMatrix<int> orders = all_orders.bottomRows(all_orders.rows() - 1); // overlap printed above

    GTOUT::print_header("Multipole moment integrals");
    std::cout << "  Origin (Bohr)              = " << std::setprecision(8) << origin.transpose() << '\n';
    std::cout << "  Maximum order              = " << max_order << '\n';

    const std::vector<EigenMatrix<double>> moments = MULTIPOLE::moment_integral(shells, origin, orders, coord);

    std::vector<std::string> labels;
    for (Index n = 0; n < orders.rows(); ++n)
    {
        std::string label;
        const char axes[] = "xyz";
        for (Index k = 0; k < 3; ++k) label += std::string(static_cast<size_t>(orders(n, k)), axes[k]);
        labels.emplace_back("Moment " + label + ":");
    }

    if (m_verbose > 1)
        GTOUT::pretty_print_matrix<double>(moments, labels);

    // Electronic expectation needs a density, print the nuclear moments instead
    std::cout << "\n  Nuclear moments about the " << origin_name << '\n';
    for (Index n = 0; n < orders.rows(); ++n)
    {
        double mom = 0.0;
        for (Index a = 0; a < geom.get_num_atoms(); ++a)
        {
            double term = geom.get_charges()(a);
            for (Index k = 0; k < 3; ++k)
                term *= std::pow(geom.get_coords()(a, k) - origin(k), orders(n, k));
            mom += term;
        }

        std::cout << "  " << std::left << std::setw(14) << labels[n] << std::right << std::setw(18)
                  << std::setprecision(10) << mom << '\n';
    }
}

int main(int argc, char **argv)
{
    std::clock_t start_time = std::clock();
    auto w_start = std::chrono::high_resolution_clock::now();

    try
    {
        #ifdef HAS_CMAKE_CONFIG
        std::string version = PROGRAM_VERSION;
        #else
        std::string version = "unknown";
        #endif

        TCLAP::CmdLine cmd("gtoint computes overlap and multipole moment integrals over contracted Gaussian "\
                           "basis functions for a given molecular geometry.", ' ', version);

        TCLAP::ValueArg<std::string> arg_inputfile("i", "input", "Input geometry file (xyz).", true, "", "filename");
        cmd.add(arg_inputfile);

        TCLAP::ValueArg<std::string> arg_basisset("b", "basis", "Basis set file, Gaussian94 (.gbs) format.",
                                                  true, "", "filename");
        cmd.add(arg_basisset);

        TCLAP::ValueArg<std::string> arg_coord("c", "coord", "cartesian or spherical, overrides the basis file header.",
                                               false, "", "string");
        cmd.add(arg_coord);

        TCLAP::ValueArg<std::string> arg_units("u", "units", "Geometry units, angstrom or bohr.", false,
                                               "angstrom", "string");
        cmd.add(arg_units);

        TCLAP::ValueArg<std::string> arg_origin("o", "origin", "Multipole origin, charge (center of charge) or origin.",
                                                false, "charge", "string");
        cmd.add(arg_origin);

        TCLAP::ValueArg<int> arg_moment("m", "moment", "Maximum multipole order, 0 for overlap only.", false, 1, "int");
        cmd.add(arg_moment);

        TCLAP::ValueArg<int> arg_threads("n", "nthreads", "The number of CPU threads to use. ", false, 0, "int");
        cmd.add(arg_threads);

        TCLAP::ValueArg<short> arg_verbose("v", "verbose", "Verbosity level 1 to 5.", false, 1, "int");
        cmd.add(arg_verbose);

        cmd.parse(argc, argv);

        gtoint_settings::set_basis_set_path(arg_basisset.getValue());
        if (arg_coord.isSet()) gtoint_settings::set_basis_coord_type(arg_coord.getValue());
        gtoint_settings::set_unit_type(arg_units.getValue());
        gtoint_settings::set_moment_origin(arg_origin.getValue());
        gtoint_settings::set_moment_order(arg_moment.getValue());
        gtoint_settings::set_verbosity(arg_verbose.getValue());
        gtoint_settings::set_num_threads(arg_threads.getValue());

        std::unique_ptr<Mol::gtoint> gto = std::make_unique<Mol::gtoint>(gtoint_settings::get_verbosity(),
                                                                         gtoint_settings::get_num_threads());
        gto->run(arg_inputfile.getValue());
    }
    catch (TCLAP::ArgException &e)
    {
        std::cerr << "Error: " << e.error() << " for arg " << e.argId() << '\n';
        return -1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\n  Error: " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    std::clock_t end_time = std::clock();
    double milli_sec = 1000.0 * (end_time - start_time) / CLOCKS_PER_SEC;
    double cpu_sec = milli_sec / 1000.0;
    long cpu_min = std::floor(cpu_sec / 60);
    long cpu_hr = std::floor(cpu_sec / 3600);

    auto w_end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double, std::milli> duration = w_end - w_start;
    auto w_sec = duration.count() / 1000;
    long w_min = std::floor(w_sec / 60);
    long w_hr = std::floor(w_sec / 3600);

    std::cout << "\n  CPU usage: " << std::setprecision(0) << 100 * cpu_sec / w_sec << "%CPU\n";
    std::cout << "  CPU  time: " << cpu_hr  << "h" << cpu_min  - 60 * cpu_hr << "m"
              << std::fixed << std::setprecision(3) << cpu_sec - 60.0 * cpu_min << "s\n";
    std::cout << "  Wall time: " << w_hr  << "h" << w_min - 60 * w_hr << "m"
              << std::setprecision(3) << w_sec - 60.0 * w_min << "s\n\n";
    std::cout << "  gtoint execution end.\n\n";
    return 0;
}
