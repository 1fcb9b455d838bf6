#pragma once

#include <vector>

#include <Eigen/Dense>

namespace casa {
// Pixel coordinate (x, y) in mask space.
using Point2d = Eigen::Vector2d;
using Matrix = Eigen::MatrixXd;
using PointList = std::vector<Point2d>;
} // namespace casa
