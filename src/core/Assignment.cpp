#include "core/Assignment.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace BgcNet {

static void check_cost_matrix(const Eigen::MatrixXd& cost) {
    if (cost.rows() != cost.cols()) {
        throw std::logic_error("Assignment cost matrix must be square, got " + std::to_string(cost.rows()) + "x" +
                               std::to_string(cost.cols()));
    }
    for (Eigen::Index i = 0; i < cost.rows(); ++i) {
        for (Eigen::Index j = 0; j < cost.cols(); ++j) {
            double c = cost(i, j);
            if (!std::isfinite(c) || c < 0.0) {
                throw std::logic_error("Assignment cost matrix holds invalid entry at (" + std::to_string(i) + "," +
                                       std::to_string(j) + ")");
            }
        }
    }
}

AssignmentResult solve_assignment(const Eigen::MatrixXd& cost) {
    check_cost_matrix(cost);

    const int n = static_cast<int>(cost.rows());
    AssignmentResult result;
    if (n == 0) {
        return result;
    }

    const double inf = std::numeric_limits<double>::infinity();

    // 1-based potentials; column 0 is a virtual column holding the row being inserted
    std::vector<double> u(n + 1, 0.0), v(n + 1, 0.0);
    std::vector<int> match(n + 1, 0);  // match[j] = row assigned to column j
    std::vector<int> way(n + 1, 0);

    for (int i = 1; i <= n; ++i) {
        match[0] = i;
        int j0 = 0;
        std::vector<double> minv(n + 1, inf);
        std::vector<char> used(n + 1, 0);

        do {
            used[j0] = 1;
            const int i0 = match[j0];
            double delta = inf;
            int j1 = 0;

            for (int j = 1; j <= n; ++j) {
                if (used[j]) continue;
                double cur = cost(i0 - 1, j - 1) - u[i0] - v[j];
                if (cur < minv[j]) {
                    minv[j] = cur;
                    way[j] = j0;
                }
                if (minv[j] < delta) {
                    delta = minv[j];
                    j1 = j;
                }
            }

            if (j1 == 0) {
                throw std::logic_error("Assignment solver found no augmenting column");
            }

            for (int j = 0; j <= n; ++j) {
                if (used[j]) {
                    u[match[j]] += delta;
                    v[j] -= delta;
                } else {
                    minv[j] -= delta;
                }
            }
            j0 = j1;
        } while (match[j0] != 0);

        // Flip the augmenting path
        do {
            int j1 = way[j0];
            match[j0] = match[j1];
            j0 = j1;
        } while (j0 != 0);
    }

    result.row_to_col.assign(n, -1);
    for (int j = 1; j <= n; ++j) {
        result.row_to_col[match[j] - 1] = j - 1;
    }
    for (int i = 0; i < n; ++i) {
        result.total_cost += cost(i, result.row_to_col[i]);
    }

    return result;
}

}  // namespace BgcNet
