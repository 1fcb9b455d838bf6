#include "casa/tracking/Track.hpp"

#include <numeric>

namespace casa {

bool Track_t::append(const Point2d& position, int frameIndex) {
  if (!frameIndices.empty()) {
    const int framesElapsed = frameIndex - frameIndices.back();
    if (framesElapsed <= 0) {
      return false;
    }
    velocities.push_back((position - positions.back()).norm() / framesElapsed);
  }
  positions.push_back(position);
  frameIndices.push_back(frameIndex);
  return true;
}

Track_t makeTrack(int id, const Point2d& position, int frameIndex) {
  Track_t track;
  track.id = id;
  track.positions.push_back(position);
  track.frameIndices.push_back(frameIndex);
  return track;
}

double totalDistance(const Track_t& track) {
  double distance = 0.0;
  for (std::size_t i = 1; i < track.positions.size(); ++i) {
    distance += (track.positions[i] - track.positions[i - 1]).norm();
  }
  return distance;
}

double straightLineDistance(const Track_t& track) {
  if (track.positions.size() < 2) {
    return 0.0;
  }
  return (track.positions.back() - track.positions.front()).norm();
}

double linearity(const Track_t& track) {
  const double total = totalDistance(track);
  if (total <= 0.0) {
    return 0.0;
  }
  return straightLineDistance(track) / total;
}

double meanStepVelocity(const Track_t& track) {
  if (track.velocities.empty()) {
    return 0.0;
  }
  return std::accumulate(track.velocities.begin(), track.velocities.end(), 0.0) /
         static_cast<double>(track.velocities.size());
}

} // namespace casa
