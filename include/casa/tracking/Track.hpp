#pragma once

#include <cstddef>
#include <vector>

#include "casa/core/Types.hpp"

namespace casa {

// Persistent identity assembled from per-frame detections.
struct Track_t {
  int id = -1;
  PointList positions;
  std::vector<int> frameIndices;
  // Step length per elapsed frame; one fewer entry than positions.
  std::vector<double> velocities;
  int disappearedCount = 0;

  std::size_t length() const { return positions.size(); }
  bool empty() const { return positions.empty(); }
  const Point2d& lastPosition() const { return positions.back(); }
  int firstFrame() const { return frameIndices.front(); }
  int lastFrame() const { return frameIndices.back(); }

  // Appends an observation. Returns false and leaves the track untouched when
  // frameIndex does not follow the last recorded frame.
  bool append(const Point2d& position, int frameIndex);
};

Track_t makeTrack(int id, const Point2d& position, int frameIndex);

// Path length in pixels.
double totalDistance(const Track_t& track);
// Distance between first and last position in pixels.
double straightLineDistance(const Track_t& track);
// straightLineDistance / totalDistance, 0 for a track that never moved.
double linearity(const Track_t& track);
double meanStepVelocity(const Track_t& track);

} // namespace casa
