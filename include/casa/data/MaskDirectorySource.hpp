#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "casa/data/FrameSource.hpp"

namespace casa {

// Reads binary mask images from a directory, ordered by file name with
// embedded numbers compared by value (frame_2 before frame_10).
// The frame index is the ordinal of the file in that order.
class MaskDirectorySource : public IFrameSource {
public:
  explicit MaskDirectorySource(const std::string& directory);

  bool next(FrameRecord_t& out) override;
  bool good() const { return isGood; }
  std::size_t frameCount() const { return files.size(); }

private:
  std::vector<std::string> files;
  std::size_t cursor = 0;
  bool isGood = false;
};

} // namespace casa
