#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "Config/Options.h"
#include "Diff/ParagraphAligner.h"

// What the host hands in: two .docx byte buffers, an author, options.
struct RedlineRequest {
  std::string base;
  std::string revised;
  std::string author = DEFAULT_AUTHOR;
  Options options = Options::defaults();
};

// What it gets back: the output .docx and any non-fatal warnings.
struct RedlineResult {
  std::string document;
  std::vector<std::string> warnings;
  AlignerStats stats;
};

// -----------------------------------------------------------------------------
// One redline invocation
// -----------------------------------------------------------------------------
//
//   open both packages (concurrently)  -> ArchiveError
//   read + parse word/document.xml     -> MissingPartError / warning on bad XML
//   revised has tracked changes?       -> PolicyViolationError under Fail
//   strip tracked changes from both
//   collect paragraphs, align by index, diff each pair
//   assemble the four-part output package
//
// Fatal errors propagate as RedlinerError subclasses; nothing is returned
// with them. No state outlives the call.
RedlineResult redline(RedlineRequest request);

// "2024-05-01T12:00:00Z"
std::string isoTimestamp(std::chrono::system_clock::time_point when);
