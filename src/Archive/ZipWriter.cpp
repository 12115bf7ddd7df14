#include "ZipWriter.h"

#include "Engine/Errors.h"

using namespace std;

static string writerError(mz_zip_archive& zip) {
  return mz_zip_get_error_string(mz_zip_get_last_error(&zip));
}

ZipWriter::ZipWriter() {
  start();
}

ZipWriter::~ZipWriter() {
  if (live_) mz_zip_writer_end(&zip_);
}

void ZipWriter::start() {
  zip_ = mz_zip_archive{};
  if (!mz_zip_writer_init_heap(&zip_, 0, 0)) {
    throw ArchiveError("can't start zip writer (" + writerError(zip_) + ")");
  }
  live_ = true;
}

void ZipWriter::add(const string& path, string_view data, Compression compression) {
  if (!paths_.insert(path).second) {
    throw ArchiveError("duplicate entry " + path);
  }
  mz_uint level = compression == Compression::Deflate ? MZ_DEFAULT_LEVEL : MZ_NO_COMPRESSION;
  if (!mz_zip_writer_add_mem(&zip_, path.c_str(), data.data(), data.size(), level)) {
    throw ArchiveError("can't add " + path + " (" + writerError(zip_) + ")");
  }
}

string ZipWriter::finish() {
  void* buf = nullptr;
  size_t size = 0;
  if (!mz_zip_writer_finalize_heap_archive(&zip_, &buf, &size)) {
    throw ArchiveError("can't finish zip package (" + writerError(zip_) + ")");
  }
  string out(static_cast<const char*>(buf), size);
  mz_free(buf);
  mz_zip_writer_end(&zip_);
  live_ = false;
  paths_.clear();
  start();
  return out;
}
