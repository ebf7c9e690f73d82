#pragma once

#include <Eigen/Dense>
#include <functional>
#include <tuple>
#include <utility>
#include <vector>
#include "boatcount/track.hpp"
#include "boatcount/detection.hpp"

namespace boatcount {

namespace matching {

/**
 * @brief Compute intersection over union between two boxes
 *
 * @param a Box in format (min x, min y, max x, max y)
 * @param b Box in format (min x, min y, max x, max y)
 * @return float IoU in [0, 1]; 0 when the boxes are disjoint or either has zero area
 */
float iou(const Eigen::Vector4f& a, const Eigen::Vector4f& b);

/**
 * @brief Compute intersection over union between one box and a set of candidates
 *
 * @param bbox Single bounding box (min x, min y, max x, max y)
 * @param candidates Matrix of candidate bounding boxes, one per row, same format
 * @return Eigen::VectorXf IoU scores
 */
Eigen::VectorXf iou(const Eigen::Vector4f& bbox, const Eigen::MatrixXf& candidates);

/**
 * @brief Compute IoU distance (1 - IoU) cost matrix between tracks and detections
 */
Eigen::MatrixXf iouCost(const std::vector<Track>& tracks,
                        const std::vector<Detection>& detections,
                        const std::vector<int>& track_indices,
                        const std::vector<int>& detection_indices);

using DistanceMetric = std::function<Eigen::MatrixXf(const std::vector<Track>&,
                                                     const std::vector<Detection>&,
                                                     const std::vector<int>&,
                                                     const std::vector<int>&)>;

using MatchResult = std::tuple<std::vector<std::pair<int, int>>, std::vector<int>, std::vector<int>>;

/**
 * @brief Solve linear assignment between tracks and detections
 *
 * Costs above max_distance are clamped before solving and the pairs that land on
 * them are rejected afterwards, so a poor match is never accepted to improve the
 * global cost.
 *
 * @return MatchResult (matches, unmatched tracks, unmatched detections), as indices
 */
MatchResult minCostMatching(const DistanceMetric& distance_metric,
                            float max_distance,
                            const std::vector<Track>& tracks,
                            const std::vector<Detection>& detections,
                            const std::vector<int>& track_indices = {},
                            const std::vector<int>& detection_indices = {});

} // namespace matching
} // namespace boatcount
