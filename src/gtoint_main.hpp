#ifndef MOL_GTOINT
#define MOL_GTOINT

#include "molecule/gtoint_geometry.hpp"
#include "basis/gtoint_basis.hpp"
#include <string>

namespace Mol
{
    class gtoint
    {
        public:
            explicit gtoint(const short verbose, const int threads);
            gtoint(const gtoint&) = delete;
            gtoint& operator=(const gtoint& other) = delete;
            gtoint(const gtoint&&) = delete;
            gtoint&& operator=(const gtoint&& other) = delete;
            void run(const std::string& geometry_file);

        private:
            void print_banner() const;
            void print_geometry(const MOLEC::Geometry& geom) const;
            void print_basis(const ShellVector& shells, const std::string& coord_type) const;

            short m_verbose;
    };
}

#endif
// end MOL_GTOINT
