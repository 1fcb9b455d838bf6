#pragma once

#include "casa/data/FrameRecord.hpp"

namespace casa {

// Ordered, single-pass frame stream.
class IFrameSource {
public:
  virtual ~IFrameSource() = default;
  virtual bool next(FrameRecord_t& out) = 0;
};

} // namespace casa
