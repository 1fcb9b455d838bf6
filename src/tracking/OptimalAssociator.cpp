#include "casa/tracking/Associator.hpp"

#include <algorithm>
#include <cstddef>
#include <limits>
#include <map>
#include <numeric>
#include <vector>

#include "casa/core/Errors.hpp"

namespace casa {

namespace {

// Cost of pairing a track with a detection outside the gate.
constexpr double kForbiddenCost = 1e12;
// Keeps a pair at exactly the gate distance cheaper than leaving both unmatched.
constexpr double kGateSlack = 1e-6;

// Hungarian method with row/column potentials on a square cost matrix.
// Returns the column assigned to each row.
std::vector<int> solveSquareAssignment(const Matrix& cost) {
  const int n = static_cast<int>(cost.rows());
  const double inf = std::numeric_limits<double>::infinity();
  std::vector<double> u(n + 1, 0.0);
  std::vector<double> v(n + 1, 0.0);
  std::vector<int> p(n + 1, 0);
  std::vector<int> way(n + 1, 0);

  for (int i = 1; i <= n; ++i) {
    p[0] = i;
    int j0 = 0;
    std::vector<double> minv(n + 1, inf);
    std::vector<bool> used(n + 1, false);
    do {
      used[j0] = true;
      const int i0 = p[j0];
      double delta = inf;
      int j1 = 0;
      for (int j = 1; j <= n; ++j) {
        if (used[j]) {
          continue;
        }
        const double reduced = cost(i0 - 1, j - 1) - u[i0] - v[j];
        if (reduced < minv[j]) {
          minv[j] = reduced;
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
    do {
      const int j1 = way[j0];
      p[j0] = p[j1];
      j0 = j1;
    } while (j0 != 0);
  }

  std::vector<int> rowToCol(n, -1);
  for (int j = 1; j <= n; ++j) {
    if (p[j] != 0) {
      rowToCol[p[j] - 1] = j - 1;
    }
  }
  return rowToCol;
}

// Union-find over tracks and detections.
class DisjointSets {
public:
  explicit DisjointSets(std::size_t count) : parent(count) { std::iota(parent.begin(), parent.end(), std::size_t{0}); }

  std::size_t find(std::size_t node) {
    while (parent[node] != node) {
      parent[node] = parent[parent[node]];
      node = parent[node];
    }
    return node;
  }

  void unite(std::size_t a, std::size_t b) {
    a = find(a);
    b = find(b);
    if (a != b) {
      parent[std::max(a, b)] = std::min(a, b);
    }
  }

private:
  std::vector<std::size_t> parent;
};

struct Component_t {
  std::vector<Eigen::Index> rows;
  std::vector<Eigen::Index> cols;
};

// Solves one component padded to a square of size r + c. Each track may fall
// into its own dummy column and each detection into its own dummy row at half
// the gate, so a real pair is only worth taking when it lies within the gate.
// Returns the local column for each local row; values >= c mean unmatched.
std::vector<int> solveGated(const Matrix& distances, const Component_t& group, double maxDistance, double halfGate) {
  const Eigen::Index r = static_cast<Eigen::Index>(group.rows.size());
  const Eigen::Index c = static_cast<Eigen::Index>(group.cols.size());
  Matrix cost = Matrix::Constant(r + c, r + c, kForbiddenCost);
  for (Eigen::Index a = 0; a < r; ++a) {
    for (Eigen::Index b = 0; b < c; ++b) {
      const double d = distances(group.rows[static_cast<std::size_t>(a)], group.cols[static_cast<std::size_t>(b)]);
      if (d <= maxDistance) {
        cost(a, b) = d;
      }
    }
    cost(a, c + a) = halfGate;
  }
  for (Eigen::Index b = 0; b < c; ++b) {
    cost(r + b, b) = halfGate;
  }
  cost.bottomRightCorner(c, r).setZero();
  return solveSquareAssignment(cost);
}

} // namespace

OptimalAssociator::OptimalAssociator(double maxDistanceInput) : maxDistance(maxDistanceInput) {
  if (!(maxDistance > 0.0)) {
    throw ConfigError("maxDistance", "must be positive");
  }
}

AssociationResult_t OptimalAssociator::associate(const std::vector<TrackAnchor_t>& anchors,
                                                 const PointList& detections) const {
  const Eigen::Index rows = static_cast<Eigen::Index>(anchors.size());
  const Eigen::Index cols = static_cast<Eigen::Index>(detections.size());
  const Matrix distances = distanceMatrix(anchors, detections);

  // Tracks and detections linked by a pair within the gate form independent
  // subproblems. Nodes [0, rows) are tracks, [rows, rows + cols) detections.
  DisjointSets components(static_cast<std::size_t>(rows + cols));
  for (Eigen::Index i = 0; i < rows; ++i) {
    for (Eigen::Index j = 0; j < cols; ++j) {
      if (distances(i, j) <= maxDistance) {
        components.unite(static_cast<std::size_t>(i), static_cast<std::size_t>(rows + j));
      }
    }
  }
  std::map<std::size_t, Component_t> groups;
  for (Eigen::Index i = 0; i < rows; ++i) {
    groups[components.find(static_cast<std::size_t>(i))].rows.push_back(i);
  }
  for (Eigen::Index j = 0; j < cols; ++j) {
    groups[components.find(static_cast<std::size_t>(rows + j))].cols.push_back(j);
  }

  std::vector<Eigen::Index> assignedCol(anchors.size(), -1);
  const double halfGate = 0.5 * maxDistance + kGateSlack;
  for (const auto& entry : groups) {
    const Component_t& group = entry.second;
    if (group.rows.empty() || group.cols.empty()) {
      continue;
    }
    const std::vector<int> rowToCol = solveGated(distances, group, maxDistance, halfGate);
    for (std::size_t r = 0; r < group.rows.size(); ++r) {
      const int local = rowToCol[r];
      if (local >= 0 && local < static_cast<int>(group.cols.size())) {
        assignedCol[static_cast<std::size_t>(group.rows[r])] = group.cols[static_cast<std::size_t>(local)];
      }
    }
  }

  AssociationResult_t result;
  std::vector<bool> colClaimed(detections.size(), false);
  for (Eigen::Index i = 0; i < rows; ++i) {
    const Eigen::Index j = assignedCol[static_cast<std::size_t>(i)];
    if (j >= 0 && distances(i, j) <= maxDistance) {
      colClaimed[static_cast<std::size_t>(j)] = true;
      result.assignments.push_back({anchors[static_cast<std::size_t>(i)].trackId, static_cast<std::size_t>(j),
                                    distances(i, j)});
    } else {
      result.missedTrackIds.push_back(anchors[static_cast<std::size_t>(i)].trackId);
    }
  }
  for (std::size_t j = 0; j < detections.size(); ++j) {
    if (!colClaimed[j]) {
      result.unmatchedDetections.push_back(j);
    }
  }
  return result;
}

} // namespace casa
