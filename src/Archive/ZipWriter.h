#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_set>

#include <miniz.h>

// Builds a zip package in memory with the miniz heap writer.
// Entries keep insertion order.
class ZipWriter {
public:
  enum class Compression { Store, Deflate };

  ZipWriter();
  ~ZipWriter();
  ZipWriter(const ZipWriter&) = delete;
  ZipWriter& operator=(const ZipWriter&) = delete;

  // Throws ArchiveError on a duplicate path.
  void add(const std::string& path, std::string_view data,
           Compression compression = Compression::Deflate);

  // Appends the central directory and returns the finished package.
  // The writer is empty afterwards.
  std::string finish();

  size_t entryCount() const { return paths_.size(); }

private:
  void start();

  mz_zip_archive zip_{};
  bool live_ = false;
  std::unordered_set<std::string> paths_;
};
