#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "Config/Options.h"
#include "Diff/RunSynthesizer.h"
#include "Diff/SequenceDiffer.h"
#include "Xml/Node.h"

enum class Alignment { Both, BaseOnly, RevisedOnly };

// Position i of the aligned sequence. Either side may be null, never both.
struct AlignedPair {
  size_t index;
  const Node* base;
  const Node* revised;

  Alignment kind() const {
    if (base && revised) return Alignment::Both;
    return base ? Alignment::BaseOnly : Alignment::RevisedOnly;
  }
};

// Strictly positional: base[i] pairs with revised[i]; the longer side's tail
// pairs with nothing. No move detection.
std::vector<AlignedPair> alignByIndex(const std::vector<const Node*>& base,
                                      const std::vector<const Node*>& revised);

// Ceiling on LCS table memory held at once by all diff workers together.
inline constexpr uint64_t DIFF_MEMORY_BUDGET = 256ull * 1024 * 1024;

// Threads for the token-diff phase: `requested` (0 = one per hardware
// thread), at most one per pair, and at most DIFF_MEMORY_BUDGET /
// largestTableBytes. Never less than 1.
unsigned diffWorkerCount(unsigned requested, size_t pairs, uint64_t largestTableBytes);

struct AlignerStats {
  size_t diffed = 0;       // Both, token-diffed
  size_t suppressed = 0;   // Both, whitespace-only difference
  size_t opaque = 0;       // Both, over the token cap
  size_t inserted = 0;     // RevisedOnly
  size_t deleted = 0;      // BaseOnly
  size_t scrubbed = 0;     // elements dropped for dangling relationship ids
};

// -----------------------------------------------------------------------------
// Rewrites two aligned paragraph sequences into one tracked-change sequence
// -----------------------------------------------------------------------------
//
//   Both         tokenize + Lcs::diff + synthesize, inside the revised
//                paragraph's shell (pPr, bookmarks, ... kept)
//   BaseOnly     base shell, one deletion run, paragraph mark deleted
//   RevisedOnly  revised shell, one insertion run, paragraph mark inserted
//
// With suppressWhitespaceOnly, a Both pair whose texts match once whitespace
// runs are collapsed and the ends trimmed is emitted as the revised text in a
// single plain run.
//
// A Both pair where either side needs more than maxTokensPerParagraph tokens
// is diffed as one opaque unit: unchanged -> one plain run, changed -> the
// whole base text deleted then the whole revised text inserted.
//
// Token diffs of different pairs run on up to diffWorkerCount() threads;
// runs are synthesized afterwards in index order so revision ids and output
// order do not depend on scheduling.
class ParagraphAligner {
public:
  ParagraphAligner(const Options& options, RunSynthesizer& synthesizer)
      : options_(options), synthesizer_(synthesizer) {}

  std::vector<Node> rewrite(const std::vector<const Node*>& base,
                            const std::vector<const Node*>& revised,
                            std::vector<std::string>& warnings);

  const AlignerStats& stats() const { return stats_; }

private:
  struct PairPlan {
    AlignedPair pair;
    std::string baseText;
    std::string revisedText;
    bool suppressed = false;
    bool opaque = false;
    EditScript script;  // views into baseText / revisedText
  };

  void planPair(PairPlan& plan) const;
  void planAll(std::vector<PairPlan>& plans) const;
  Node emit(const PairPlan& plan, std::vector<std::string>& warnings);

  const Options& options_;
  RunSynthesizer& synthesizer_;
  AlignerStats stats_;
};
