#include "Redliner.h"

#include <ctime>
#include <future>
#include <optional>
#include <utility>

#include "Archive/ZipArchive.h"
#include "Diff/RunSynthesizer.h"
#include "Document/Paragraph.h"
#include "Document/RevisionStripper.h"
#include "Document/Runs.h"
#include "Engine/Errors.h"
#include "Package/PackageAssembler.h"
#include "Package/PartNames.h"
#include "Utils/Debug.h"
#include "Utils/StringUtils.h"
#include "Xml/PartCodec.h"

using namespace std;

string isoTimestamp(chrono::system_clock::time_point when) {
  time_t t = chrono::system_clock::to_time_t(when);
  tm utc{};
  gmtime_r(&t, &utc);
  char buf[32];
  strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return buf;
}

// =============================================================================
// Loading
// =============================================================================

static ZipArchive openPackage(string bytes, const ResourceLimits& limits, const char* label) {
  try {
    return ZipArchive::open(std::move(bytes), limits);
  } catch (const ArchiveError& e) {
    throw ArchiveError(string("Failed to read ") + label + " DOCX: " + e.what());
  }
}

// Both loads are independent reads; run them side by side unless the caller
// asked for a single thread.
static pair<ZipArchive, ZipArchive> openBoth(RedlineRequest& request) {
  const ResourceLimits& limits = request.options.limits;
  if (request.options.workerThreads == 1) {
    ZipArchive base = openPackage(std::move(request.base), limits, "base");
    ZipArchive revised = openPackage(std::move(request.revised), limits, "revised");
    return {std::move(base), std::move(revised)};
  }
  auto revisedTask = async(launch::async, openPackage, std::move(request.revised), limits,
                           "revised");
  ZipArchive base = openPackage(std::move(request.base), limits, "base");
  ZipArchive revised = revisedTask.get();
  return {std::move(base), std::move(revised)};
}

static Node placeholderDocument() {
  Node document = Node::element("document");
  document.append(Node::element("body"));
  return document;
}

static Node loadDocument(ZipArchive& zip, const char* label, vector<string>& warnings) {
  optional<string> xml;
  try {
    xml = zip.readPart(PartNames::DOCUMENT);
  } catch (const ArchiveError& e) {
    throw ArchiveError(string("Failed to read ") + label + " DOCX: " + e.what());
  }
  if (!xml) {
    throw MissingPartError(string("Missing ") + PartNames::DOCUMENT + " in the " + label +
                           " DOCX");
  }

  try {
    Node document = PartCodec::parse(*xml);
    if (!Paragraphs::bodyOf(document)) {
      warnings.push_back(string(PartNames::DOCUMENT) + " in the " + label +
                         " DOCX has no body; treated as empty");
    }
    return document;
  } catch (const PartParseError& e) {
    debug("fallback for", label, PartNames::DOCUMENT);
    warnings.push_back(string("Malformed ") + PartNames::DOCUMENT + " in the " + label +
                       " DOCX (" + e.what() + "); used an empty document");
    return placeholderDocument();
  }
}

static void reportHeadersFooters(const ZipArchive& revised, vector<string>& warnings) {
  for (const auto& path : revised.paths()) {
    if (!startsWith(path, "word/") || !endsWith(path, ".xml")) continue;
    string_view file = string_view(path).substr(5);
    if (startsWith(file, "header") || startsWith(file, "footer")) {
      warnings.push_back("Header/footer part " + path + " is not carried into the output");
    }
  }
}

// Body-level sectPr of the revised document, if any
static optional<Node> sectionProperties(const Node& document) {
  const Node* body = Paragraphs::bodyOf(document);
  if (!body) return nullopt;
  const Node* found = nullptr;
  for (const auto& c : body->children) {
    if (c.is("sectPr")) found = &c;
  }
  if (!found) return nullopt;
  return *found;
}

// =============================================================================
// Main API
// =============================================================================

RedlineResult redline(RedlineRequest request) {
  RedlineResult result;
  vector<string>& warnings = result.warnings;
  const Options options = request.options;
  const string author = request.author.empty() ? string(DEFAULT_AUTHOR) : request.author;
  const string date = options.timestamp.value_or(isoTimestamp(chrono::system_clock::now()));

  auto [baseZip, revisedZip] = openBoth(request);
  debug("base:", baseZip.entries().size(), "entries,", baseZip.compressedTotal(), "compressed bytes");
  debug("revised:", revisedZip.entries().size(), "entries,", revisedZip.compressedTotal(),
        "compressed bytes");

  Node baseDoc = loadDocument(baseZip, "base", warnings);
  Node revisedDoc = loadDocument(revisedZip, "revised", warnings);

  if (options.existingTrackedRevisionsPolicy == TrackedRevisionsPolicy::Fail &&
      Revisions::hasTrackedChanges(revisedDoc)) {
    throw PolicyViolationError("Revised document contains tracked revisions (" +
                               to_string(Revisions::countTrackedChanges(revisedDoc)) +
                               " found)");
  }
  if (options.includeHeadersFooters) {
    reportHeadersFooters(revisedZip, warnings);
  }

  const Node cleanBase = Revisions::strip(baseDoc);
  const Node cleanRevised = Revisions::strip(revisedDoc);

  const ParagraphFilter filter = ParagraphFilter::from(options);
  vector<const Node*> baseParas = Paragraphs::paragraphsOf(cleanBase, filter);
  vector<const Node*> revisedParas = Paragraphs::paragraphsOf(cleanRevised, filter);
  debug("paragraphs: base", baseParas.size(), "revised", revisedParas.size());

  RunSynthesizer synthesizer(author, date);
  ParagraphAligner aligner(options, synthesizer);
  vector<Node> paragraphs = aligner.rewrite(baseParas, revisedParas, warnings);
  result.stats = aligner.stats();

  optional<Node> sectPr = sectionProperties(cleanRevised);
  size_t scrubbed = result.stats.scrubbed;
  if (sectPr) scrubbed += Runs::scrubRelationshipReferences(*sectPr);
  if (scrubbed > 0) {
    warnings.push_back("Removed " + to_string(scrubbed) +
                       " element(s) referencing package relationships not carried into the output");
  }

  Node document = PackageAssembler::buildDocument(std::move(paragraphs), std::move(sectPr));
  result.document = PackageAssembler::assemble(document);
  debug("redline done:", result.warnings.size(), "warnings");
  return result;
}
