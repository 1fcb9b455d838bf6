#include "casa/tracking/Associator.hpp"

#include <algorithm>

#include "casa/core/Errors.hpp"
#include "casa/core/Logger.hpp"

namespace casa {

namespace {

struct CandidatePair_t {
  double distance;
  std::size_t row;
  std::size_t col;
};

AssociationResult_t allUnmatched(const std::vector<TrackAnchor_t>& anchors, const PointList& detections) {
  AssociationResult_t result;
  for (const auto& anchor : anchors) {
    result.missedTrackIds.push_back(anchor.trackId);
  }
  for (std::size_t j = 0; j < detections.size(); ++j) {
    result.unmatchedDetections.push_back(j);
  }
  return result;
}

} // namespace

Matrix distanceMatrix(const std::vector<TrackAnchor_t>& anchors, const PointList& detections) {
  Matrix distances(static_cast<Eigen::Index>(anchors.size()), static_cast<Eigen::Index>(detections.size()));
  for (std::size_t i = 0; i < anchors.size(); ++i) {
    for (std::size_t j = 0; j < detections.size(); ++j) {
      distances(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) =
          (anchors[i].position - detections[j]).norm();
    }
  }
  return distances;
}

GreedyAssociator::GreedyAssociator(double maxDistanceInput) : maxDistance(maxDistanceInput) {
  if (!(maxDistance > 0.0)) {
    throw ConfigError("maxDistance", "must be positive");
  }
}

AssociationResult_t GreedyAssociator::associate(const std::vector<TrackAnchor_t>& anchors,
                                                const PointList& detections) const {
  if (anchors.empty() || detections.empty()) {
    return allUnmatched(anchors, detections);
  }

  const Matrix distances = distanceMatrix(anchors, detections);
  std::vector<CandidatePair_t> pairs;
  pairs.reserve(anchors.size() * detections.size());
  for (std::size_t i = 0; i < anchors.size(); ++i) {
    for (std::size_t j = 0; j < detections.size(); ++j) {
      pairs.push_back({distances(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)), i, j});
    }
  }
  // Equal distances keep row-major order, so the earlier track wins.
  std::stable_sort(pairs.begin(), pairs.end(),
                   [](const CandidatePair_t& a, const CandidatePair_t& b) { return a.distance < b.distance; });

  std::vector<bool> rowClaimed(anchors.size(), false);
  std::vector<bool> colClaimed(detections.size(), false);
  AssociationResult_t result;
  for (const auto& pair : pairs) {
    if (pair.distance > maxDistance) {
      break;
    }
    if (rowClaimed[pair.row] || colClaimed[pair.col]) {
      continue;
    }
    rowClaimed[pair.row] = true;
    colClaimed[pair.col] = true;
    result.assignments.push_back({anchors[pair.row].trackId, pair.col, pair.distance});
  }

  for (std::size_t i = 0; i < anchors.size(); ++i) {
    if (!rowClaimed[i]) {
      result.missedTrackIds.push_back(anchors[i].trackId);
    }
  }
  for (std::size_t j = 0; j < detections.size(); ++j) {
    if (!colClaimed[j]) {
      result.unmatchedDetections.push_back(j);
    }
  }
  return result;
}

std::shared_ptr<IAssociator> createAssociator(const TrackerConfig_t& config) {
  if (config.assignment == AssignmentMethod_e::kOptimal) {
    if (auto logger = Logger::GetClass("Associator")) {
      logger->info("Using optimal assignment, gate {:.2f} px", config.maxDistance);
    }
    return std::make_shared<OptimalAssociator>(config.maxDistance);
  }
  if (auto logger = Logger::GetClass("Associator")) {
    logger->info("Using greedy assignment, gate {:.2f} px", config.maxDistance);
  }
  return std::make_shared<GreedyAssociator>(config.maxDistance);
}

} // namespace casa
