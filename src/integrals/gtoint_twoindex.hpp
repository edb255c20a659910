#ifndef GTOINT_TWOINDEX
#define GTOINT_TWOINDEX

#include "gtoint_shell.hpp"
#include "../math/gtoint_tensors.hpp"
#include <string>
#include <vector>

using BASIS::ContractionShell;
using tensormath::tensor4d;

namespace TWOINDEX
{
    enum class CoordType
    {
        cartesian, spherical
    };

    // "cartesian", "spherical", or one of those per shell
    class CoordSpec
    {
        public:
            CoordSpec(const char* type) : CoordSpec(std::string(type)) {}
            CoordSpec(const std::string& type);
            CoordSpec(const std::vector<std::string>& types);

            static CoordType parse(const std::string& type);

            bool is_per_shell() const {return per_shell;}
            CoordType at(Index shell) const;

            // per shell list must match the basis length
            void validate(Index nshells) const;

            // basis size in this coordinate system
            Index num_functions(const std::vector<ContractionShell>& basis) const;

            // first function of each shell, size nshells + 1
            std::vector<Index> offsets(const std::vector<ContractionShell>& basis) const;

        private:
            bool per_shell{false};
            std::vector<CoordType> types;
    };

    /*
     * Dense two index arrays over a basis (or a pair of bases) from a shell pair block function.
     * Derived classes supply the raw, contraction unnormalized, Cartesian blocks and the number of
     * components, one output matrix is returned per component.
     *
     * A symmetric instance only computes shell pairs j >= i and mirrors the transpose.
     */
    class TwoIndexBase
    {
        public:
            explicit TwoIndexBase(const std::vector<ContractionShell>& basis);
            explicit TwoIndexBase(const std::vector<ContractionShell>& basis_one,
                                  const std::vector<ContractionShell>& basis_two);
            TwoIndexBase(const TwoIndexBase&) = delete;
            TwoIndexBase& operator=(const TwoIndexBase& other) = delete;
            virtual ~TwoIndexBase() = default;

            virtual Index num_components() const = 0;

            // (M1, cart1, M2, cart2) block per component
            virtual std::vector<tensor4d<double>>
            construct_array_contraction(const ContractionShell& sh1, const ContractionShell& sh2) const = 0;

            std::vector<EigenMatrix<double>> construct_array_cartesian() const;
            std::vector<EigenMatrix<double>> construct_array_spherical() const;
            std::vector<EigenMatrix<double>> construct_array_mix(const CoordSpec& coord) const;
            std::vector<EigenMatrix<double>> construct_array_mix(const CoordSpec& coord_one,
                                                                 const CoordSpec& coord_two) const;

            // T A T^T, the same transform and coordinate system on both indices
            std::vector<EigenMatrix<double>> construct_array_lincomb(const EigenMatrix<double>& transform,
                                                                     const CoordSpec& coord) const;
            // T1 A T2^T
            std::vector<EigenMatrix<double>> construct_array_lincomb(const EigenMatrix<double>& transform_one,
                                                                     const EigenMatrix<double>& transform_two,
                                                                     const CoordSpec& coord_one,
                                                                     const CoordSpec& coord_two) const;

            bool is_symmetric() const {return symmetric;}

        protected:
            const std::vector<ContractionShell>& m_basis_one;
            const std::vector<ContractionShell>& m_basis_two;
            const bool symmetric;
    };

    // Apply T1 (and T2) to a set of arrays, shapes are checked by the caller
    std::vector<EigenMatrix<double>> lincomb(const std::vector<EigenMatrix<double>>& arrays,
                                             const EigenMatrix<double>& transform_one,
                                             const EigenMatrix<double>& transform_two);
}

#endif
// End GTOINT_TWOINDEX
