#pragma once

#include <Eigen/Dense>
#include <utility>
#include <vector>

namespace boatcount {
namespace matching {

/**
 * @brief Solve the minimum-cost linear assignment problem (Hungarian algorithm)
 *
 * Rectangular matrices are padded to square with zero-cost dummy cells; rows or
 * columns assigned to padding are left unmatched. The solver visits rows in index
 * order and always takes the lowest column among equal reduced costs, so ties
 * resolve to the lowest row, then the lowest column, and identical input gives
 * identical output.
 *
 * @param cost_matrix R x C matrix of finite costs
 * @return std::vector<std::pair<int, int>> (row, column) pairs sorted by row
 */
std::vector<std::pair<int, int>> linearAssignment(const Eigen::MatrixXf& cost_matrix);

} // namespace matching
} // namespace boatcount
