#include "ParagraphAligner.h"

#include <algorithm>
#include <future>
#include <thread>

#include "Document/Paragraph.h"
#include "Document/Runs.h"
#include "Utils/Debug.h"
#include "Utils/StringUtils.h"

using namespace std;

vector<AlignedPair> alignByIndex(const vector<const Node*>& base,
                                 const vector<const Node*>& revised) {
  const size_t count = max(base.size(), revised.size());
  vector<AlignedPair> out;
  out.reserve(count);
  for (size_t i = 0; i < count; i++) {
    out.push_back(AlignedPair{i, i < base.size() ? base[i] : nullptr,
                              i < revised.size() ? revised[i] : nullptr});
  }
  return out;
}

// =============================================================================
// Planning (pure, safe to run concurrently per pair)
// =============================================================================

static EditScript opaqueScript(const string& a, const string& b) {
  EditScript script;
  if (a == b) {
    if (!a.empty()) script.push_back({EditKind::Equal, a});
    return script;
  }
  if (!a.empty()) script.push_back({EditKind::Delete, a});
  if (!b.empty()) script.push_back({EditKind::Insert, b});
  return script;
}

void ParagraphAligner::planPair(PairPlan& plan) const {
  if (plan.pair.kind() != Alignment::Both) return;

  if (options_.suppressWhitespaceOnly &&
      collapseWhitespace(plan.baseText) == collapseWhitespace(plan.revisedText)) {
    plan.suppressed = true;
    return;
  }

  const size_t cap = options_.limits.maxTokensPerParagraph;
  auto a = tokenizeBounded(plan.baseText, options_.granularity, cap);
  auto b = a ? tokenizeBounded(plan.revisedText, options_.granularity, cap) : nullopt;
  if (!a || !b) {
    plan.opaque = true;
    plan.script = opaqueScript(plan.baseText, plan.revisedText);
    return;
  }
  plan.script = Lcs::diff(*a, *b);
}

unsigned diffWorkerCount(unsigned requested, size_t pairs, uint64_t largestTableBytes) {
  uint64_t workers = requested;
  if (workers == 0) workers = max(1u, thread::hardware_concurrency());
  workers = min<uint64_t>(workers, pairs);
  if (largestTableBytes > 0) {
    workers = min<uint64_t>(workers, DIFF_MEMORY_BUDGET / largestTableBytes);
  }
  return static_cast<unsigned>(max<uint64_t>(workers, 1));
}

// Upper bound on the LCS table for a pair: a token is at least one byte and
// tokenizing stops at the cap.
static uint64_t tableBytesBound(const string& a, const string& b, size_t cap) {
  uint64_t m = min<uint64_t>(a.size(), cap) + 1;
  uint64_t n = min<uint64_t>(b.size(), cap) + 1;
  return m * n * sizeof(uint32_t);
}

void ParagraphAligner::planAll(vector<PairPlan>& plans) const {
  uint64_t largest = 0;
  for (const auto& plan : plans) {
    if (plan.pair.kind() != Alignment::Both) continue;
    largest = max(largest, tableBytesBound(plan.baseText, plan.revisedText,
                                           options_.limits.maxTokensPerParagraph));
  }
  const unsigned workers = diffWorkerCount(options_.workerThreads, plans.size(), largest);
  debug("diffing", plans.size(), "pairs on", workers, "worker(s)");

  if (workers <= 1) {
    for (auto& plan : plans) planPair(plan);
    return;
  }

  // Strided split: neighbouring paragraphs tend to be similar in size.
  vector<future<void>> tasks;
  tasks.reserve(workers);
  for (unsigned w = 0; w < workers; w++) {
    tasks.push_back(async(launch::async, [this, &plans, w, workers]() {
      for (size_t i = w; i < plans.size(); i += workers) planPair(plans[i]);
    }));
  }
  for (auto& t : tasks) t.get();
}

// =============================================================================
// Emission (sequential, index order)
// =============================================================================

Node ParagraphAligner::emit(const PairPlan& plan, vector<string>& warnings) {
  const AlignedPair& pair = plan.pair;
  Node out;

  switch (pair.kind()) {
    case Alignment::Both:
      if (plan.suppressed) {
        stats_.suppressed++;
        debug("paragraph", pair.index, "whitespace-only change, suppressed");
        out = Runs::withRuns(*pair.revised, {Runs::plain(plan.revisedText)});
        break;
      }
      if (plan.opaque) {
        stats_.opaque++;
        debug("paragraph", pair.index, "over the token cap, diffed whole");
        warnings.push_back("paragraph " + to_string(pair.index + 1) +
                           " exceeds " + to_string(options_.limits.maxTokensPerParagraph) +
                           " tokens; diffed as a single unit");
      } else {
        stats_.diffed++;
      }
      out = Runs::withRuns(*pair.revised, synthesizer_.synthesize(plan.script));
      break;

    case Alignment::BaseOnly: {
      stats_.deleted++;
      debug("paragraph", pair.index, "deleted");
      vector<Node> runs;
      if (!plan.baseText.empty()) runs.push_back(synthesizer_.deletion(plan.baseText));
      out = Runs::withRuns(*pair.base, std::move(runs));
      synthesizer_.markParagraph(out, RevisionKind::Deleted);
      break;
    }

    case Alignment::RevisedOnly: {
      stats_.inserted++;
      debug("paragraph", pair.index, "inserted");
      vector<Node> runs;
      if (!plan.revisedText.empty()) runs.push_back(synthesizer_.insertion(plan.revisedText));
      out = Runs::withRuns(*pair.revised, std::move(runs));
      synthesizer_.markParagraph(out, RevisionKind::Inserted);
      break;
    }
  }

  stats_.scrubbed += Runs::scrubRelationshipReferences(out);
  return out;
}

vector<Node> ParagraphAligner::rewrite(const vector<const Node*>& base,
                                       const vector<const Node*>& revised,
                                       vector<string>& warnings) {
  vector<AlignedPair> pairs = alignByIndex(base, revised);

  // Texts are filled before any script takes views into them; the vector is
  // not resized afterwards.
  vector<PairPlan> plans(pairs.size());
  for (size_t i = 0; i < pairs.size(); i++) {
    plans[i].pair = pairs[i];
    if (pairs[i].base) plans[i].baseText = Paragraphs::textOf(*pairs[i].base);
    if (pairs[i].revised) plans[i].revisedText = Paragraphs::textOf(*pairs[i].revised);
  }
  debug("aligning", base.size(), "base and", revised.size(), "revised paragraphs");

  planAll(plans);

  vector<Node> out;
  out.reserve(plans.size());
  for (const auto& plan : plans) {
    out.push_back(emit(plan, warnings));
  }
  return out;
}
