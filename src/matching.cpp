#include "boatcount/matching.hpp"
#include "boatcount/linear_assignment.hpp"
#include <algorithm>
#include <numeric>

namespace boatcount
{
    namespace matching
    {

        namespace
        {
            std::vector<int> allIndices(size_t count)
            {
                std::vector<int> indices(count);
                std::iota(indices.begin(), indices.end(), 0);
                return indices;
            }
        } // namespace

        float iou(const Eigen::Vector4f &a, const Eigen::Vector4f &b)
        {
            Eigen::Vector2f intersection_tl = a.head<2>().cwiseMax(b.head<2>());
            Eigen::Vector2f intersection_br = a.tail<2>().cwiseMin(b.tail<2>());
            Eigen::Vector2f wh = (intersection_br - intersection_tl).cwiseMax(0.0f);
            float area_intersection = wh.prod();

            float area_a = (a.tail<2>() - a.head<2>()).cwiseMax(0.0f).prod();
            float area_b = (b.tail<2>() - b.head<2>()).cwiseMax(0.0f).prod();
            float area_union = area_a + area_b - area_intersection;

            if (area_intersection <= 0.0f || area_union <= 0.0f)
            {
                return 0.0f;
            }
            return area_intersection / area_union;
        }

        Eigen::VectorXf iou(const Eigen::Vector4f &bbox, const Eigen::MatrixXf &candidates)
        {
            int num_candidates = candidates.rows();
            Eigen::VectorXf iou_scores(num_candidates);

            for (int i = 0; i < num_candidates; ++i)
            {
                Eigen::Vector4f candidate = candidates.row(i).transpose();
                iou_scores(i) = iou(bbox, candidate);
            }

            return iou_scores;
        }

        Eigen::MatrixXf iouCost(const std::vector<Track> &tracks,
                                const std::vector<Detection> &detections,
                                const std::vector<int> &track_indices,
                                const std::vector<int> &detection_indices)
        {
            Eigen::MatrixXf candidates(detection_indices.size(), 4);
            for (size_t j = 0; j < detection_indices.size(); ++j)
            {
                candidates.row(j) = detections[detection_indices[j]].getTLBR().transpose();
            }

            Eigen::MatrixXf cost_matrix(track_indices.size(), detection_indices.size());

            for (size_t i = 0; i < track_indices.size(); ++i)
            {
                Eigen::Vector4f bbox = tracks[track_indices[i]].toTLBR();
                Eigen::VectorXf iou_scores = iou(bbox, candidates);
                cost_matrix.row(i) = Eigen::RowVectorXf::Constant(detection_indices.size(), 1.0f) - iou_scores.transpose();
            }

            return cost_matrix;
        }

        MatchResult minCostMatching(const DistanceMetric &distance_metric,
                                    float max_distance,
                                    const std::vector<Track> &tracks,
                                    const std::vector<Detection> &detections,
                                    const std::vector<int> &track_indices,
                                    const std::vector<int> &detection_indices)
        {

            std::vector<int> _track_indices = track_indices;
            std::vector<int> _detection_indices = detection_indices;

            if (_track_indices.empty())
            {
                _track_indices = allIndices(tracks.size());
            }
            if (_detection_indices.empty())
            {
                _detection_indices = allIndices(detections.size());
            }

            if (_detection_indices.empty() || _track_indices.empty())
            {
                return {{}, _track_indices, _detection_indices};
            }

            Eigen::MatrixXf cost_matrix = distance_metric(tracks, detections, _track_indices, _detection_indices);
            cost_matrix = (cost_matrix.array() > max_distance).select(max_distance + 1e-5f, cost_matrix);

            auto assignments = linearAssignment(cost_matrix);

            std::vector<std::pair<int, int>> matches;
            std::vector<char> track_matched(_track_indices.size(), false);
            std::vector<char> detection_matched(_detection_indices.size(), false);

            for (const auto &[i, j] : assignments)
            {
                if (cost_matrix(i, j) <= max_distance)
                {
                    matches.emplace_back(_track_indices[i], _detection_indices[j]);
                    track_matched[i] = true;
                    detection_matched[j] = true;
                }
            }

            std::vector<int> unmatched_tracks;
            for (size_t i = 0; i < _track_indices.size(); ++i)
            {
                if (!track_matched[i])
                {
                    unmatched_tracks.push_back(_track_indices[i]);
                }
            }

            std::vector<int> unmatched_detections;
            for (size_t j = 0; j < _detection_indices.size(); ++j)
            {
                if (!detection_matched[j])
                {
                    unmatched_detections.push_back(_detection_indices[j]);
                }
            }

            return std::make_tuple(matches, unmatched_tracks, unmatched_detections);
        }

    } // namespace matching
} // namespace boatcount
