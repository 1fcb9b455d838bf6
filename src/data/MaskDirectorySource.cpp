#include "casa/data/MaskDirectorySource.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <filesystem>
#include <string>

#include <opencv2/imgcodecs.hpp>

#include "casa/core/Logger.hpp"

namespace casa {

namespace {

bool isImageFile(const std::filesystem::path& path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
  return ext == ".png" || ext == ".bmp" || ext == ".pgm" || ext == ".tif" || ext == ".tiff" || ext == ".jpg" ||
         ext == ".jpeg";
}

std::size_t digitRunEnd(const std::string& text, std::size_t pos) {
  while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
    ++pos;
  }
  return pos;
}

// Orders names with embedded numbers by value, so frame_2 precedes frame_10.
bool naturalLess(const std::string& a, const std::string& b) {
  std::size_t i = 0;
  std::size_t j = 0;
  while (i < a.size() && j < b.size()) {
    const bool aDigit = std::isdigit(static_cast<unsigned char>(a[i])) != 0;
    const bool bDigit = std::isdigit(static_cast<unsigned char>(b[j])) != 0;
    if (aDigit && bDigit) {
      const std::size_t aEnd = digitRunEnd(a, i);
      const std::size_t bEnd = digitRunEnd(b, j);
      std::size_t aStart = i;
      std::size_t bStart = j;
      while (aStart + 1 < aEnd && a[aStart] == '0') {
        ++aStart;
      }
      while (bStart + 1 < bEnd && b[bStart] == '0') {
        ++bStart;
      }
      const std::size_t aLen = aEnd - aStart;
      const std::size_t bLen = bEnd - bStart;
      if (aLen != bLen) {
        return aLen < bLen;
      }
      const int cmp = a.compare(aStart, aLen, b, bStart, bLen);
      if (cmp != 0) {
        return cmp < 0;
      }
      i = aEnd;
      j = bEnd;
      continue;
    }
    if (a[i] != b[j]) {
      return a[i] < b[j];
    }
    ++i;
    ++j;
  }
  if (i != a.size() || j != b.size()) {
    return j < b.size();
  }
  // Equal up to zero padding; fall back to plain order for a stable result.
  return a < b;
}

} // namespace

MaskDirectorySource::MaskDirectorySource(const std::string& directory) {
  std::error_code ec;
  std::filesystem::directory_iterator it(directory, ec);
  if (ec) {
    if (auto logger = Logger::GetClass("MaskDirectorySource")) {
      logger->error("Cannot open mask directory {}: {}", directory, ec.message());
    }
    return;
  }
  for (const auto& entry : it) {
    if (entry.is_regular_file(ec) && isImageFile(entry.path())) {
      files.push_back(entry.path().string());
    }
  }
  std::sort(files.begin(), files.end(), [](const std::string& a, const std::string& b) {
    return naturalLess(std::filesystem::path(a).filename().string(), std::filesystem::path(b).filename().string());
  });
  isGood = true;
  if (auto logger = Logger::GetClass("MaskDirectorySource")) {
    logger->info("MaskDirectorySource {} holds {} mask images", directory, files.size());
  }
}

bool MaskDirectorySource::next(FrameRecord_t& out) {
  if (cursor >= files.size()) {
    return false;
  }
  const std::string& path = files[cursor];
  out.frameIndex = static_cast<int>(cursor);
  ++cursor;
  // An unreadable file leaves the mask empty; the engine skips such frames.
  out.binaryMask = cv::imread(path, cv::IMREAD_GRAYSCALE);
  out.original = out.binaryMask;
  if (out.binaryMask.empty()) {
    if (auto logger = Logger::GetClass("MaskDirectorySource")) {
      logger->warn("Failed to read mask image {}", path);
    }
  }
  return true;
}

} // namespace casa
