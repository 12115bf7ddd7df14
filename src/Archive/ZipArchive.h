#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "Config/Options.h"

// One central-directory record. Sizes are as declared by the archive.
struct ZipEntry {
  std::string path;
  uint32_t index = 0;  // position in the miniz central directory
  uint32_t crc32 = 0;
  uint64_t compressedSize = 0;
  uint64_t uncompressedSize = 0;
  bool encrypted = false;
  bool supported = true;

  bool isDirectory() const { return !path.empty() && path.back() == '/'; }
};

// -----------------------------------------------------------------------------
// Read-only view of a zip package held in memory, backed by miniz.
// -----------------------------------------------------------------------------
//
// open() validates the container before anything is inflated:
//   - entry count <= maxEntries
//   - running sum of compressed sizes <= 2 * maxTotalUnzippedBytes
//   - no duplicate paths
// The compressed-size check is a cheap heuristic. The hard ceilings
// (maxEntrySize per part, maxTotalUnzippedBytes across parts) are enforced
// while inflating in readPart(). Zip64 packages are read like any other.
//
// Throws ArchiveError on any violation.
class ZipArchive {
public:
  static ZipArchive open(std::string bytes, const ResourceLimits& limits);

  ZipArchive(ZipArchive&&) noexcept;
  ZipArchive& operator=(ZipArchive&&) noexcept;
  ~ZipArchive();

  // Inflates the named part. nullopt when the package has no such entry.
  std::optional<std::string> readPart(std::string_view path);

  bool contains(std::string_view path) const;
  const ZipEntry* find(std::string_view path) const;

  const std::vector<ZipEntry>& entries() const { return entries_; }
  std::vector<std::string> paths() const;

  uint64_t compressedTotal() const { return compressedTotal_; }
  uint64_t inflatedTotal() const { return inflatedTotal_; }

private:
  // Owns the package bytes and the miniz reader that points into them.
  // Kept behind a pointer so both stay put when the archive moves.
  struct Reader;

  ZipArchive(std::string bytes, const ResourceLimits& limits);

  void readCentralDirectory();

  std::unique_ptr<Reader> reader_;
  ResourceLimits limits_;
  std::vector<ZipEntry> entries_;
  std::unordered_map<std::string, size_t> index_;
  uint64_t compressedTotal_ = 0;
  uint64_t inflatedTotal_ = 0;
};
