#ifndef PRETTY_PRINT_H
#define PRETTY_PRINT_H

#include "../math/gtoint_math.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace GTOUT
{

// Panels of six columns, 1 based row and column labels. rows and cols limit the printed block, 0 for all.
template<typename T>
void pretty_print_matrix(const Eigen::Ref<const EigenMatrix<T> >& mat, Index rows = 0,  Index cols = 0)
{
    constexpr Index panel = 6;
    const Index nrows = (rows) ? rows : mat.rows();
    const Index ncols = (cols) ? cols : mat.cols();

    for (Index first = 0; first < ncols; first += panel)
    {
        const Index last = std::min(first + panel, ncols);

        std::cout << "   ";
        for (Index j = first; j < last; ++j) std::cout << std::setw(17) << j + 1;
        std::cout << '\n';

        for (Index i = 0; i < nrows; ++i)
        {
            std::cout << std::setw(3) << i + 1 << std::fixed << std::setprecision(9);
            for (Index j = first; j < last; ++j) std::cout << std::setw(17) << mat(i, j);
            std::cout << '\n';
        }

        std::cout << '\n';
    }
}

template<typename T>
void pretty_print_matrix(const std::vector<EigenMatrix<T>>& vec_mat, const std::vector<std::string>& labels)
{
    for (size_t i = 0; i < vec_mat.size(); ++i)
    {
        const EigenMatrix<T>& mat = vec_mat[i];
        std::cout << "\n  " << ((i < labels.size()) ? labels[i] : std::to_string(i + 1))
                  << " Dimensions: " << mat.rows() << "x" << mat.cols() << "\n\n";

        pretty_print_matrix<T>(mat);
    }
}

inline void print_header(const std::string& title)
{
    std::cout << "\n  " << title << '\n';
    std::cout << "  " << std::string(title.size(), '*') << "\n";
}

}
#endif
