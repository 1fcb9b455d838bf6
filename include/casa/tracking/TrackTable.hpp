#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <vector>

#include "casa/tracking/Track.hpp"

namespace casa {

// Arena of active tracks: contiguous slots, a free-slot list and an id index.
// Ids increase monotonically and are never reused; slots are.
class TrackTable {
public:
  Track_t& create(const Point2d& position, int frameIndex);

  Track_t* find(int id);
  const Track_t* find(int id) const;
  bool contains(int id) const { return index.count(id) > 0; }

  // Removes the track and returns it; empty when the id is not active.
  std::optional<Track_t> remove(int id);
  void clear();

  std::size_t size() const { return index.size(); }
  bool empty() const { return index.empty(); }
  std::size_t capacity() const { return slots.size(); }
  int nextId() const { return nextTrackId; }

  // Active ids in ascending order.
  std::vector<int> ids() const;

  template <typename Fn>
  void forEach(Fn&& fn) const {
    for (const auto& entry : index) {
      fn(*slots[entry.second]);
    }
  }

private:
  std::vector<std::optional<Track_t>> slots;
  std::vector<std::size_t> freeSlots;
  std::map<int, std::size_t> index;
  int nextTrackId = 0;
};

} // namespace casa
