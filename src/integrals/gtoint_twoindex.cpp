#include "gtoint_twoindex.hpp"
#include "gtoint_transform.hpp"
#include <stdexcept>
#ifdef _OPENMP
    #include <omp.h>
#endif

using TWOINDEX::CoordType;

TWOINDEX::CoordSpec::CoordSpec(const std::string& type)
{
    types.emplace_back(parse(type));
}

TWOINDEX::CoordSpec::CoordSpec(const std::vector<std::string>& coord_types) : per_shell(true)
{
    for (const auto& type : coord_types)
        types.emplace_back(parse(type));
}

CoordType TWOINDEX::CoordSpec::parse(const std::string& type)
{
    if (type == "cartesian") return CoordType::cartesian;
    if (type == "spherical") return CoordType::spherical;

    throw std::invalid_argument("Unknown coordinate type \"" + type
                                + "\", expected \"cartesian\" or \"spherical\".");
}

CoordType TWOINDEX::CoordSpec::at(Index shell) const
{
    return (per_shell) ? types.at(static_cast<size_t>(shell)) : types[0];
}

void TWOINDEX::CoordSpec::validate(Index nshells) const
{
    if (per_shell && static_cast<Index>(types.size()) != nshells)
        throw std::invalid_argument("Per shell coordinate types list " + std::to_string(types.size())
                                    + " entries for a basis of " + std::to_string(nshells) + " shells.");
}

std::vector<Index> TWOINDEX::CoordSpec::offsets(const std::vector<ContractionShell>& basis) const
{
    validate(static_cast<Index>(basis.size()));

    std::vector<Index> offs(basis.size() + 1, 0);

    for (size_t s = 0; s < basis.size(); ++s)
    {
        const auto& sh = basis[s];
        const Index nfunc = (at(static_cast<Index>(s)) == CoordType::spherical) ? sh.get_sirange()
                                                                                : sh.get_cirange();
        offs[s + 1] = offs[s] + nfunc * sh.num_seg_cont();
    }

    return offs;
}

Index TWOINDEX::CoordSpec::num_functions(const std::vector<ContractionShell>& basis) const
{
    return offsets(basis).back();
}

TWOINDEX::TwoIndexBase::TwoIndexBase(const std::vector<ContractionShell>& basis)
: m_basis_one(basis), m_basis_two(basis), symmetric(true)
{
}

TWOINDEX::TwoIndexBase::TwoIndexBase(const std::vector<ContractionShell>& basis_one,
                                     const std::vector<ContractionShell>& basis_two)
: m_basis_one(basis_one), m_basis_two(basis_two), symmetric(false)
{
}

std::vector<EigenMatrix<double>> TWOINDEX::TwoIndexBase::construct_array_cartesian() const
{
    return construct_array_mix(CoordSpec("cartesian"), CoordSpec("cartesian"));
}

std::vector<EigenMatrix<double>> TWOINDEX::TwoIndexBase::construct_array_spherical() const
{
    return construct_array_mix(CoordSpec("spherical"), CoordSpec("spherical"));
}

std::vector<EigenMatrix<double>> TWOINDEX::TwoIndexBase::construct_array_mix(const CoordSpec& coord) const
{
    return construct_array_mix(coord, coord);
}

std::vector<EigenMatrix<double>> TWOINDEX::TwoIndexBase::construct_array_mix(const CoordSpec& coord_one,
                                                                             const CoordSpec& coord_two) const
{
    const std::vector<Index> offs1 = coord_one.offsets(m_basis_one);
    const std::vector<Index> offs2 = coord_two.offsets(m_basis_two);

    // only mirrored when both indices use the same coordinate types
    bool mirror = symmetric;
    for (size_t s = 0; mirror && s < m_basis_one.size(); ++s)
        mirror = coord_one.at(static_cast<Index>(s)) == coord_two.at(static_cast<Index>(s));

    const Index ncomp = num_components();
    const Index nshells1 = static_cast<Index>(m_basis_one.size());
    const Index nshells2 = static_cast<Index>(m_basis_two.size());

    std::vector<EigenMatrix<double>> arrays(ncomp);
    for (auto& a : arrays)
        a = EigenMatrix<double>::Zero(offs1.back(), offs2.back());

#ifdef _OPENMP
    #pragma omp parallel for schedule(dynamic)
#endif
    for (Index s1 = 0; s1 < nshells1; ++s1)
    {
        const auto& sh1 = m_basis_one[s1];
        const bool pure1 = coord_one.at(s1) == CoordType::spherical;

        for (Index s2 = (mirror) ? s1 : 0; s2 < nshells2; ++s2)
        {
            const auto& sh2 = m_basis_two[s2];
            const bool pure2 = coord_two.at(s2) == CoordType::spherical;

            const std::vector<tensor4d<double>> blocks = construct_array_contraction(sh1, sh2);

            for (Index c = 0; c < ncomp; ++c)
            {
                const EigenMatrix<double> block = TRANSFORM::transform(sh1, sh2, blocks[c], pure1, pure2);
                TRANSFORM::place(block, arrays[c], offs1[s1], offs2[s2], mirror && s1 != s2);
            }
        }
    }

    return arrays;
}

std::vector<EigenMatrix<double>>
TWOINDEX::TwoIndexBase::construct_array_lincomb(const EigenMatrix<double>& transform,
                                                const CoordSpec& coord) const
{
    return construct_array_lincomb(transform, transform, coord, coord);
}

std::vector<EigenMatrix<double>>
TWOINDEX::TwoIndexBase::construct_array_lincomb(const EigenMatrix<double>& transform_one,
                                                const EigenMatrix<double>& transform_two,
                                                const CoordSpec& coord_one,
                                                const CoordSpec& coord_two) const
{
    const Index n1 = coord_one.num_functions(m_basis_one);
    const Index n2 = coord_two.num_functions(m_basis_two);

    if (transform_one.cols() != n1)
        throw std::invalid_argument("Transform has " + std::to_string(transform_one.cols())
                                    + " columns but the basis has " + std::to_string(n1) + " functions.");

    if (transform_two.cols() != n2)
        throw std::invalid_argument("Transform has " + std::to_string(transform_two.cols())
                                    + " columns but the basis has " + std::to_string(n2) + " functions.");

    return lincomb(construct_array_mix(coord_one, coord_two), transform_one, transform_two);
}

std::vector<EigenMatrix<double>> TWOINDEX::lincomb(const std::vector<EigenMatrix<double>>& arrays,
                                                   const EigenMatrix<double>& transform_one,
                                                   const EigenMatrix<double>& transform_two)
{
    std::vector<EigenMatrix<double>> out;
    out.reserve(arrays.size());

    for (const auto& a : arrays)
        out.emplace_back(transform_one * a * transform_two.transpose());

    return out;
}
