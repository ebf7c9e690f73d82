#include "boatcount/linear_assignment.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace boatcount {
namespace matching {

std::vector<std::pair<int, int>> linearAssignment(const Eigen::MatrixXf& cost_matrix) {
    const int rows = static_cast<int>(cost_matrix.rows());
    const int cols = static_cast<int>(cost_matrix.cols());
    if (rows == 0 || cols == 0) {
        return {};
    }
    if (!cost_matrix.allFinite()) {
        throw std::invalid_argument("assignment cost matrix must be finite");
    }

    const int n = std::max(rows, cols);
    const double inf = std::numeric_limits<double>::infinity();

    // 1-based potentials; column 0 is the virtual start of each augmenting path
    auto cost = [&](int i, int j) -> double {
        return (i < rows && j < cols) ? static_cast<double>(cost_matrix(i, j)) : 0.0;
    };

    std::vector<double> u(n + 1, 0.0), v(n + 1, 0.0);
    std::vector<int> p(n + 1, 0), way(n + 1, 0);

    for (int i = 1; i <= n; ++i) {
        p[0] = i;
        int j0 = 0;
        std::vector<double> minv(n + 1, inf);
        std::vector<char> used(n + 1, false);
        do {
            used[j0] = true;
            const int i0 = p[j0];
            double delta = inf;
            int j1 = 0;
            for (int j = 1; j <= n; ++j) {
                if (used[j]) continue;
                const double cur = cost(i0 - 1, j - 1) - u[i0] - v[j];
                if (cur < minv[j]) {
                    minv[j] = cur;
                    way[j] = j0;
                }
                if (minv[j] < delta) {
                    delta = minv[j];
                    j1 = j;
                }
            }
            for (int j = 0; j <= n; ++j) {
                if (used[j]) {
                    u[p[j]] += delta;
                    v[j] -= delta;
                } else {
                    minv[j] -= delta;
                }
            }
            j0 = j1;
        } while (p[j0] != 0);

        // Augment along the alternating path
        do {
            const int j1 = way[j0];
            p[j0] = p[j1];
            j0 = j1;
        } while (j0 != 0);
    }

    std::vector<int> row_to_col(rows, -1);
    for (int j = 1; j <= n; ++j) {
        const int i = p[j] - 1;
        if (i >= 0 && i < rows && j - 1 < cols) {
            row_to_col[i] = j - 1;
        }
    }

    std::vector<std::pair<int, int>> assignments;
    for (int i = 0; i < rows; ++i) {
        if (row_to_col[i] >= 0) {
            assignments.emplace_back(i, row_to_col[i]);
        }
    }
    return assignments;
}

} // namespace matching
} // namespace boatcount
