#include "casa/tracking/TrackTable.hpp"

#include <utility>

namespace casa {

Track_t& TrackTable::create(const Point2d& position, int frameIndex) {
  const int id = nextTrackId++;
  std::size_t slot = 0;
  if (!freeSlots.empty()) {
    slot = freeSlots.back();
    freeSlots.pop_back();
    slots[slot] = makeTrack(id, position, frameIndex);
  } else {
    slot = slots.size();
    slots.emplace_back(makeTrack(id, position, frameIndex));
  }
  index.emplace(id, slot);
  return *slots[slot];
}

Track_t* TrackTable::find(int id) {
  auto it = index.find(id);
  if (it == index.end()) {
    return nullptr;
  }
  return &*slots[it->second];
}

const Track_t* TrackTable::find(int id) const {
  auto it = index.find(id);
  if (it == index.end()) {
    return nullptr;
  }
  return &*slots[it->second];
}

std::optional<Track_t> TrackTable::remove(int id) {
  auto it = index.find(id);
  if (it == index.end()) {
    return std::nullopt;
  }
  const std::size_t slot = it->second;
  index.erase(it);
  std::optional<Track_t> removed = std::move(slots[slot]);
  slots[slot].reset();
  freeSlots.push_back(slot);
  return removed;
}

void TrackTable::clear() {
  slots.clear();
  freeSlots.clear();
  index.clear();
}

std::vector<int> TrackTable::ids() const {
  std::vector<int> result;
  result.reserve(index.size());
  for (const auto& entry : index) {
    result.push_back(entry.first);
  }
  return result;
}

} // namespace casa
