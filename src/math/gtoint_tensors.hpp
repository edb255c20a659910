#ifndef TENSOR_MATH_H
#define TENSOR_MATH_H

// Dense row-major tensors for the integral kernels, last index fastest
#include "gtoint_math.hpp"

namespace tensormath
{
    // Recurrence table, (moment order, j, i) in the moment engine
    template <typename T>
    class tensor3d
    {
        private:
            Index m_dim1;
            Index m_dim2;
            Index m_dim3;
            EigenVector<T> t3;

        public:
            explicit tensor3d(Index dim1, Index dim2, Index dim3)
            : m_dim1(dim1), m_dim2(dim2), m_dim3(dim3), t3(EigenVector<T>::Zero(dim1 * dim2 * dim3)) {}

            const T& operator()(const Index p, const Index q, const Index r) const
            {
                return t3[(p * m_dim2 + q) * m_dim3 + r];
            }

            T& operator()(const Index p, const Index q, const Index r)
            {
                return t3[(p * m_dim2 + q) * m_dim3 + r];
            }

            Index dim1() const { return m_dim1; }
            Index dim2() const { return m_dim2; }
            Index dim3() const { return m_dim3; }
    };

    // Shell pair block, (segment 1, cart 1, segment 2, cart 2)
    template <typename T>
    class tensor4d
    {
        private:
            Index m_dim1;
            Index m_dim2;
            Index m_dim3;
            Index m_dim4;
            EigenVector<T> t4;

        public:
            explicit tensor4d(Index dim1, Index dim2, Index dim3, Index dim4)
            : m_dim1(dim1), m_dim2(dim2), m_dim3(dim3), m_dim4(dim4),
              t4(EigenVector<T>::Zero(dim1 * dim2 * dim3 * dim4)) {}

            const T& operator()(const Index p, const Index q, const Index r, const Index s) const
            {
                return t4[((p * m_dim2 + q) * m_dim3 + r) * m_dim4 + s];
            }

            T& operator()(const Index p, const Index q, const Index r, const Index s)
            {
                return t4[((p * m_dim2 + q) * m_dim3 + r) * m_dim4 + s];
            }

            // (p, q) flattened to p * dim2 + q, (r, s) to r * dim4 + s
            EigenMatrix<T> matricize() const
            {
                return Eigen::Map<const EigenMatrix<T>>(t4.data(), m_dim1 * m_dim2, m_dim3 * m_dim4);
            }

            Index dim1() const { return m_dim1; }
            Index dim2() const { return m_dim2; }
            Index dim3() const { return m_dim3; }
            Index dim4() const { return m_dim4; }
    };
}

#endif
// TENSOR_MATH_H
