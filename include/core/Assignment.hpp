#pragma once

#include <vector>
#include <Eigen/Dense>

namespace BgcNet {

/**
 * @brief Minimum-cost one-to-one assignment of rows to columns.
 */
struct AssignmentResult {
    std::vector<int> row_to_col;  ///< Column assigned to each row
    double total_cost = 0.0;      ///< Sum of cost(i, row_to_col[i])
};

/**
 * @brief Solves the assignment problem on a square cost matrix.
 *
 * Kuhn-Munkres with row/column potentials, O(N^3) time and O(N) extra space.
 * Rectangular problems are handled by the caller padding with zeros.
 *
 * @param cost N x N matrix of finite, nonnegative costs.
 * @return Optimal permutation and its total cost. N = 0 yields an empty result.
 * @throws std::logic_error if the matrix is not square or holds a negative or
 *         non-finite entry.
 */
AssignmentResult solve_assignment(const Eigen::MatrixXd& cost);

}  // namespace BgcNet
