#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include "casa/data/FrameSource.hpp"

namespace casa {

// Yields frames already held in memory, in insertion order.
class MemoryFrameSource : public IFrameSource {
public:
  MemoryFrameSource() = default;
  explicit MemoryFrameSource(std::vector<FrameRecord_t> frames) : frames(std::move(frames)) {}

  void push(FrameRecord_t frame) { frames.push_back(std::move(frame)); }

  bool next(FrameRecord_t& out) override {
    if (cursor >= frames.size()) {
      return false;
    }
    out = frames[cursor++];
    return true;
  }

  std::size_t consumed() const { return cursor; }

private:
  std::vector<FrameRecord_t> frames;
  std::size_t cursor = 0;
};

} // namespace casa
