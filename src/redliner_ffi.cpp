// src/redliner_ffi.cpp

#include "redliner_ffi.h"

#include <string>
#include <vector>

#include "Config/Options.h"
#include "Engine/Errors.h"
#include "Engine/Redliner.h"
#include "Utils/Debug.h"

// Global storage for the last run. Hosts call in from one thread.
static std::string g_output;
static std::vector<std::string> g_warnings;
static std::string g_last_error;

static Options to_options(const RedlinerOptionsFFI &ffi) {
  Options o = Options::defaults();
  o.granularity = ffi.granularity == REDLINER_CHAR ? Granularity::Char : Granularity::Word;
  o.suppressWhitespaceOnly = ffi.suppress_whitespace_only != 0;
  o.includeLists = ffi.include_lists != 0;
  o.includeTables = ffi.include_tables != 0;
  o.includeTextBoxes = ffi.include_text_boxes != 0;
  o.includeHeadersFooters = ffi.include_headers_footers != 0;
  o.existingTrackedRevisionsPolicy = ffi.fail_on_existing_revisions
                                         ? TrackedRevisionsPolicy::Fail
                                         : TrackedRevisionsPolicy::Ignore;
  o.workerThreads = ffi.worker_threads;
  o.limits.maxTotalUnzippedBytes = ffi.limits.max_total_unzipped_bytes;
  o.limits.maxEntries = ffi.limits.max_entries;
  o.limits.maxEntrySize = ffi.limits.max_entry_size;
  o.limits.maxTokensPerParagraph = static_cast<size_t>(ffi.limits.max_tokens_per_paragraph);
  return o;
}

static int fail(int status, const std::string &message) {
  g_last_error = message;
  return status;
}

extern "C" {

RedlinerOptionsFFI redliner_default_options(void) {
  const Options d = Options::defaults();
  RedlinerOptionsFFI ffi{};
  ffi.granularity = d.granularity == Granularity::Char ? REDLINER_CHAR : REDLINER_WORD;
  ffi.suppress_whitespace_only = d.suppressWhitespaceOnly;
  ffi.include_lists = d.includeLists;
  ffi.include_tables = d.includeTables;
  ffi.include_text_boxes = d.includeTextBoxes;
  ffi.include_headers_footers = d.includeHeadersFooters;
  ffi.fail_on_existing_revisions =
      d.existingTrackedRevisionsPolicy == TrackedRevisionsPolicy::Fail;
  ffi.worker_threads = d.workerThreads;
  ffi.limits.max_total_unzipped_bytes = d.limits.maxTotalUnzippedBytes;
  ffi.limits.max_entries = d.limits.maxEntries;
  ffi.limits.max_entry_size = d.limits.maxEntrySize;
  ffi.limits.max_tokens_per_paragraph = d.limits.maxTokensPerParagraph;
  return ffi;
}

int redliner_run(const unsigned char *base, size_t base_len,
                 const unsigned char *revised, size_t revised_len,
                 const char *author, const RedlinerOptionsFFI *options) {
  g_output.clear();
  g_warnings.clear();
  g_last_error.clear();

  if (!base || !revised) {
    return fail(REDLINER_INVALID_ARGUMENT, "base and revised buffers are required");
  }

  RedlineRequest request;
  request.base.assign(reinterpret_cast<const char *>(base), base_len);
  request.revised.assign(reinterpret_cast<const char *>(revised), revised_len);
  request.author = author && *author ? author : DEFAULT_AUTHOR;
  request.options = options ? to_options(*options) : Options::defaults();

  try {
    RedlineResult result = redline(std::move(request));
    g_output = std::move(result.document);
    g_warnings = std::move(result.warnings);
    return REDLINER_OK;
  } catch (const ArchiveError &e) {
    return fail(REDLINER_ARCHIVE_ERROR, e.what());
  } catch (const MissingPartError &e) {
    return fail(REDLINER_MISSING_PART, e.what());
  } catch (const PolicyViolationError &e) {
    return fail(REDLINER_POLICY_VIOLATION, e.what());
  } catch (const std::exception &e) {
    return fail(REDLINER_INTERNAL_ERROR, e.what());
  }
}

const unsigned char *redliner_output(size_t *len) {
  if (len) *len = g_output.size();
  return reinterpret_cast<const unsigned char *>(g_output.data());
}

size_t redliner_warning_count(void) { return g_warnings.size(); }

const char *redliner_warning(size_t index) {
  if (index >= g_warnings.size())
    return nullptr;
  return g_warnings[index].c_str();
}

const char *redliner_last_error(void) { return g_last_error.c_str(); }

const char *redliner_get_debug(void) {
  static std::string debug_storage;
  debug_storage = take_debug_output();
  return debug_storage.c_str();
}
}
