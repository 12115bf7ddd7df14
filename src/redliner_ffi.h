#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

enum RedlinerStatus {
  REDLINER_OK = 0,
  REDLINER_ARCHIVE_ERROR = 1,
  REDLINER_MISSING_PART = 2,
  REDLINER_POLICY_VIOLATION = 3,
  REDLINER_INVALID_ARGUMENT = 4,
  REDLINER_INTERNAL_ERROR = 5,
};

enum RedlinerGranularity {
  REDLINER_WORD = 0,
  REDLINER_CHAR = 1,
};

typedef struct {
  uint64_t max_total_unzipped_bytes;
  uint64_t max_entries;
  uint64_t max_entry_size;
  uint64_t max_tokens_per_paragraph;
} RedlinerLimitsFFI;

typedef struct {
  int granularity;  // RedlinerGranularity
  int suppress_whitespace_only;
  int include_lists;
  int include_tables;
  int include_text_boxes;
  int include_headers_footers;
  int fail_on_existing_revisions;
  unsigned worker_threads;
  RedlinerLimitsFFI limits;
} RedlinerOptionsFFI;

RedlinerOptionsFFI redliner_default_options(void);

// Runs one redline. author may be NULL (default author); options may be NULL
// (defaults). Output, warnings and error text stay valid until the next call.
int redliner_run(const unsigned char* base, size_t base_len,
                 const unsigned char* revised, size_t revised_len,
                 const char* author, const RedlinerOptionsFFI* options);

const unsigned char* redliner_output(size_t* len);
size_t redliner_warning_count(void);
const char* redliner_warning(size_t index);
const char* redliner_last_error(void);
const char* redliner_get_debug(void);

#ifdef __cplusplus
}
#endif
