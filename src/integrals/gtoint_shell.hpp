#ifndef GTOINT_SHELL
#define GTOINT_SHELL
#include "../math/gtoint_math.hpp"
#include <vector>

namespace BASIS
{

// Cartesian component (l, m, n) = (ax, ay, az) and its position ci within the shell
struct idq
{
    Index l;
    Index m;
    Index n;
    Index ci;
};

/*
 * Generalized contraction shell: K primitives with common center, angular momentum and exponents,
 * and M segmented contractions given by the columns of the K x M coefficient matrix.
 *
 * Construction is two phase. Components, primitive norms and the spherical transform are set first,
 * then the contraction norms are taken from the self overlap computed by the moment engine, which
 * only reads the primitive level attributes. The shell is immutable afterwards.
 */
class ContractionShell
{
    private:
        int m_L;
        Vec3D m_r;
        EigenVector<double> m_alpha;
        EigenMatrix<double> m_coeffs;     // K x M
        EigenMatrix<double> m_prim_norm;  // cart x K
        EigenMatrix<double> m_cont_norm;  // M x cart
        EigenMatrix<double> cart_to_spherical; // sph x cart
        std::vector<BASIS::idq> indices;
        Index cirange;
        Index sirange;

        void check_input() const;
        void assign_prim_norm();
        void assign_cont_norm();

    public:
        explicit ContractionShell(const int L, const Eigen::Ref<const Vec3D>& r,
                                  const EigenMatrix<double>& coeffs,
                                  const EigenVector<double>& alpha);

        // segmented contraction, M = 1
        explicit ContractionShell(const int L, const Eigen::Ref<const Vec3D>& r,
                                  const EigenVector<double>& coeffs,
                                  const EigenVector<double>& alpha);

        int L() const {return m_L;}
        double x() const {return m_r(0);}
        double y() const {return m_r(1);}
        double z() const {return m_r(2);}
        const Vec3D& r() const {return m_r;}
        const EigenVector<double>& alpha() const {return m_alpha;}
        const EigenMatrix<double>& coeffs() const {return m_coeffs;}
        const EigenMatrix<double>& prim_norm() const {return m_prim_norm;}
        const EigenMatrix<double>& cont_norm() const {return m_cont_norm;}
        const EigenMatrix<double>& get_spherical_form() const {return cart_to_spherical;}
        const std::vector<BASIS::idq>& get_indices() const {return indices;}

        Index get_cirange() const {return cirange;}
        Index get_sirange() const {return sirange;}
        Index num_prims() const {return m_alpha.size();}
        Index num_seg_cont() const {return m_coeffs.cols();}

        // cart x 3 matrix of (ax, ay, az), one row per Cartesian component
        EigenMatrix<int> cart_components() const;

        // -L .. L
        std::vector<int> sph_components() const;
};
}

#endif
// end GTOINT_SHELL
