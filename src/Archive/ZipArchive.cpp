#include "ZipArchive.h"

#include <algorithm>
#include <limits>
#include <miniz.h>

#include "Engine/Errors.h"

using namespace std;

struct ZipArchive::Reader {
  string bytes;
  mz_zip_archive zip{};
  bool live = false;

  explicit Reader(string b) : bytes(std::move(b)) {}
  ~Reader() {
    if (live) mz_zip_reader_end(&zip);
  }
  Reader(const Reader&) = delete;
  Reader& operator=(const Reader&) = delete;

  string lastError() {
    return mz_zip_get_error_string(mz_zip_get_last_error(&zip));
  }
};

namespace {
// Frees a miniz extraction iterator on every exit path. finish() reports
// whether miniz saw the whole entry with a matching size and CRC.
class ExtractIter {
public:
  ExtractIter(mz_zip_archive* zip, uint32_t index)
      : state_(mz_zip_reader_extract_iter_new(zip, index, 0)) {}
  ~ExtractIter() {
    if (state_) mz_zip_reader_extract_iter_free(state_);
  }
  ExtractIter(const ExtractIter&) = delete;
  ExtractIter& operator=(const ExtractIter&) = delete;

  bool ok() const { return state_ != nullptr; }
  size_t read(char* buf, size_t size) { return mz_zip_reader_extract_iter_read(state_, buf, size); }
  bool finish() {
    bool done = mz_zip_reader_extract_iter_free(state_) != MZ_FALSE;
    state_ = nullptr;
    return done;
  }

private:
  mz_zip_reader_extract_iter_state* state_;
};
}  // namespace

// total > 2 * cap, without computing 2 * cap
static bool exceedsTwice(uint64_t total, uint64_t cap) {
  return total > cap && total - cap > cap;
}

static uint64_t saturatingAdd(uint64_t a, uint64_t b) {
  return b > numeric_limits<uint64_t>::max() - a ? numeric_limits<uint64_t>::max() : a + b;
}

ZipArchive::ZipArchive(string bytes, const ResourceLimits& limits)
    : reader_(make_unique<Reader>(std::move(bytes))), limits_(limits) {}

ZipArchive::ZipArchive(ZipArchive&&) noexcept = default;
ZipArchive& ZipArchive::operator=(ZipArchive&&) noexcept = default;
ZipArchive::~ZipArchive() = default;

ZipArchive ZipArchive::open(string bytes, const ResourceLimits& limits) {
  ZipArchive archive(std::move(bytes), limits);
  archive.readCentralDirectory();
  return archive;
}

void ZipArchive::readCentralDirectory() {
  Reader& r = *reader_;
  if (!mz_zip_reader_init_mem(&r.zip, r.bytes.data(), r.bytes.size(), 0)) {
    throw ArchiveError("not a zip package (" + r.lastError() + ")");
  }
  r.live = true;

  const mz_uint count = mz_zip_reader_get_num_files(&r.zip);
  if (count > limits_.maxEntries) {
    throw ArchiveError("package has too many entries (" + to_string(count) +
                       " > " + to_string(limits_.maxEntries) + ")");
  }

  entries_.reserve(count);
  for (mz_uint i = 0; i < count; i++) {
    mz_zip_archive_file_stat stat;
    if (!mz_zip_reader_file_stat(&r.zip, i, &stat)) {
      throw ArchiveError("corrupt central directory record " + to_string(i) + " (" +
                         r.lastError() + ")");
    }
    ZipEntry e;
    e.path = stat.m_filename;
    e.index = i;
    e.crc32 = stat.m_crc32;
    e.compressedSize = stat.m_comp_size;
    e.uncompressedSize = stat.m_uncomp_size;
    e.encrypted = stat.m_is_encrypted;
    e.supported = stat.m_is_supported;

    compressedTotal_ = saturatingAdd(compressedTotal_, e.compressedSize);
    if (exceedsTwice(compressedTotal_, limits_.maxTotalUnzippedBytes)) {
      throw ArchiveError("package likely exceeds the unzip cap (" +
                         to_string(compressedTotal_) + " compressed bytes)");
    }
    if (!index_.emplace(e.path, entries_.size()).second) {
      throw ArchiveError("duplicate entry " + e.path);
    }
    entries_.push_back(std::move(e));
  }
}

bool ZipArchive::contains(string_view path) const {
  return find(path) != nullptr;
}

const ZipEntry* ZipArchive::find(string_view path) const {
  auto it = index_.find(string(path));
  if (it == index_.end()) return nullptr;
  return &entries_[it->second];
}

vector<string> ZipArchive::paths() const {
  vector<string> out;
  out.reserve(entries_.size());
  for (const auto& e : entries_) out.push_back(e.path);
  return out;
}

optional<string> ZipArchive::readPart(string_view path) {
  const ZipEntry* found = find(path);
  if (!found) return nullopt;
  const ZipEntry& e = *found;

  if (e.encrypted) {
    throw ArchiveError("encrypted entry " + e.path);
  }
  if (!e.supported) {
    throw ArchiveError("unsupported compression for " + e.path);
  }
  if (e.uncompressedSize > limits_.maxEntrySize) {
    throw ArchiveError("part " + e.path + " exceeds the per-entry cap (" +
                       to_string(e.uncompressedSize) + " > " +
                       to_string(limits_.maxEntrySize) + ")");
  }
  uint64_t remaining = limits_.maxTotalUnzippedBytes > inflatedTotal_
                           ? limits_.maxTotalUnzippedBytes - inflatedTotal_
                           : 0;
  uint64_t cap = min(limits_.maxEntrySize, remaining);

  // The declared size can lie, so the cap is also checked per buffer.
  ExtractIter iter(&reader_->zip, e.index);
  if (!iter.ok()) {
    throw ArchiveError("can't read " + e.path + " (" + reader_->lastError() + ")");
  }
  string out;
  char buf[16384];
  for (size_t n; (n = iter.read(buf, sizeof(buf))) > 0;) {
    if (out.size() + n > cap) {
      throw ArchiveError("part " + e.path + " inflates past the configured size cap");
    }
    out.append(buf, n);
  }
  if (!iter.finish()) {
    throw ArchiveError("corrupt data for " + e.path + " (" + reader_->lastError() + ")");
  }

  if (out.size() != e.uncompressedSize) {
    throw ArchiveError("size mismatch for " + e.path);
  }
  mz_ulong crc = mz_crc32(MZ_CRC32_INIT, reinterpret_cast<const unsigned char*>(out.data()),
                          out.size());
  if (static_cast<uint32_t>(crc) != e.crc32) {
    throw ArchiveError("CRC mismatch for " + e.path);
  }

  inflatedTotal_ += out.size();
  return out;
}
