#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "casa/core/Config.hpp"
#include "casa/core/Types.hpp"

namespace casa {

// Last known position of an active track.
struct TrackAnchor_t {
  int trackId = -1;
  Point2d position = Point2d::Zero();
};

struct Assignment_t {
  int trackId = -1;
  std::size_t detectionIndex = 0;
  double distance = 0.0;
};

struct AssociationResult_t {
  std::vector<Assignment_t> assignments;
  std::vector<int> missedTrackIds;
  std::vector<std::size_t> unmatchedDetections;
};

// Matches one frame's detections against active track anchors.
// No pair farther apart than the gate distance is ever assigned.
class IAssociator {
public:
  virtual ~IAssociator() = default;
  virtual AssociationResult_t associate(const std::vector<TrackAnchor_t>& anchors,
                                        const PointList& detections) const = 0;
};

// Greedy nearest-neighbour matching over the distance-sorted pair list.
class GreedyAssociator : public IAssociator {
public:
  explicit GreedyAssociator(double maxDistance);

  AssociationResult_t associate(const std::vector<TrackAnchor_t>& anchors,
                                const PointList& detections) const override;

private:
  double maxDistance;
};

// Minimum total distance assignment (Hungarian method) with the same gate.
class OptimalAssociator : public IAssociator {
public:
  explicit OptimalAssociator(double maxDistance);

  AssociationResult_t associate(const std::vector<TrackAnchor_t>& anchors,
                                const PointList& detections) const override;

private:
  double maxDistance;
};

// Rows follow anchors, columns follow detections.
Matrix distanceMatrix(const std::vector<TrackAnchor_t>& anchors, const PointList& detections);

std::shared_ptr<IAssociator> createAssociator(const TrackerConfig_t& config);

} // namespace casa
