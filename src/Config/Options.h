#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

inline constexpr const char* DEFAULT_AUTHOR = "AutoDiff";

enum class Granularity { Word, Char };

enum class TrackedRevisionsPolicy { Ignore, Fail };

// -----------------------------------------------------------------------------
// Resource caps on the input packages and on per-paragraph diff cost
// -----------------------------------------------------------------------------
struct ResourceLimits {
  uint64_t maxTotalUnzippedBytes = 50ull * 1024 * 1024;
  uint64_t maxEntries            = 2000;
  uint64_t maxEntrySize          = 5ull * 1024 * 1024;
  size_t   maxTokensPerParagraph = 4000;

  ResourceLimits() = default;
  ResourceLimits(uint64_t totalUnzipped, uint64_t entries, uint64_t entrySize,
                 size_t tokensPerParagraph)
      : maxTotalUnzippedBytes(totalUnzipped), maxEntries(entries),
        maxEntrySize(entrySize), maxTokensPerParagraph(tokensPerParagraph) {}
};

struct Options {
  Granularity granularity = Granularity::Word;
  bool suppressWhitespaceOnly = true;

  // Which paragraphs enter the aligned sequence
  bool includeLists          = true;
  bool includeTables         = true;
  bool includeTextBoxes      = true;
  bool includeHeadersFooters = false;

  TrackedRevisionsPolicy existingTrackedRevisionsPolicy = TrackedRevisionsPolicy::Ignore;
  ResourceLimits limits{};

  // 0 = one worker per hardware thread, 1 = everything on the calling thread.
  // Each worker holds an LCS table of up to (maxTokensPerParagraph + 1)^2
  // uint32 cells, about 64 MiB at the default cap, so the count is lowered
  // to keep all tables within DIFF_MEMORY_BUDGET (ParagraphAligner.h).
  unsigned workerThreads = 0;

  // Fixed w:date stamp for reproducible output. Current UTC time when unset.
  std::optional<std::string> timestamp;

  static Options defaults();
  static Options strict();
  static Options characterLevel();
};

const char* to_string(Granularity g);
const char* to_string(TrackedRevisionsPolicy p);

std::optional<Granularity> parseGranularity(std::string_view s);
std::optional<TrackedRevisionsPolicy> parseTrackedRevisionsPolicy(std::string_view s);
