// End-to-end: two in-memory .docx packages in, one tracked-change .docx out.

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "Archive/ZipArchive.h"
#include "Document/RevisionStripper.h"
#include "Engine/Errors.h"
#include "Engine/Redliner.h"
#include "Package/PartNames.h"
#include "Utils/TestUtils.h"

using namespace std;

class RedlinerTest : public ::testing::Test {
protected:
  RedlineRequest request(const string& base, const string& revised) {
    RedlineRequest r;
    r.base = base;
    r.revised = revised;
    r.author = "Tester";
    r.options.timestamp = "2024-05-01T12:00:00Z";
    return r;
  }

  RedlineResult run(const vector<string>& base, const vector<string>& revised) {
    return redline(request(docxOf(base), docxOf(revised)));
  }

  static vector<string> described(const RedlineResult& result) {
    Node doc = readOutputDocument(result.document);
    vector<string> out;
    for (const Node* p : bodyParagraphs(doc)) out.push_back(describe(*p));
    return out;
  }
};

// =============================================================================
// Properties of the output
// =============================================================================

TEST_F(RedlinerTest, IdenticalInputsProduceNoRevisions) {
  RedlineResult result = run({"Alpha", "Beta gamma."}, {"Alpha", "Beta gamma."});
  Node doc = readOutputDocument(result.document);
  EXPECT_FALSE(Revisions::hasTrackedChanges(doc));
  EXPECT_EQ(described(result), (vector<string>{"Alpha", "Beta gamma."}));
  EXPECT_TRUE(result.warnings.empty());
}

TEST_F(RedlinerTest, AppendedParagraphIsOneInsertion) {
  RedlineResult result = run({"Alpha"}, {"Alpha", "Beta"});
  EXPECT_EQ(described(result), (vector<string>{"Alpha", "[+Beta+]"}));
  EXPECT_EQ(result.stats.inserted, 1u);
}

TEST_F(RedlinerTest, RemovedParagraphIsOneDeletion) {
  RedlineResult result = run({"Alpha", "Beta"}, {"Alpha"});
  EXPECT_EQ(described(result), (vector<string>{"Alpha", "[-Beta-]"}));
  EXPECT_EQ(result.stats.deleted, 1u);
}

TEST_F(RedlinerTest, AcceptAllGivesRevisedRejectAllGivesBase) {
  const vector<string> base = {"The quick brown fox", "jumps over", "the lazy dog"};
  const vector<string> revised = {"The quick red fox", "leaps over", "the dog", "Fin."};
  RedlineResult result = run(base, revised);
  Node doc = readOutputDocument(result.document);
  auto paras = bodyParagraphs(doc);
  ASSERT_EQ(paras.size(), 4u);
  for (size_t i = 0; i < 3; i++) {
    EXPECT_EQ(acceptAll(*paras[i]), revised[i]);
    EXPECT_EQ(rejectAll(*paras[i]), base[i]);
  }
  EXPECT_EQ(acceptAll(*paras[3]), "Fin.");
  EXPECT_EQ(rejectAll(*paras[3]), "");
}

TEST_F(RedlinerTest, WhitespaceOnlyEditLeavesNoMarkup) {
  RedlineResult result = run({"Hello  world"}, {"Hello world"});
  Node doc = readOutputDocument(result.document);
  EXPECT_FALSE(Revisions::hasTrackedChanges(doc));
  EXPECT_EQ(described(result), (vector<string>{"Hello world"}));
  EXPECT_EQ(result.stats.suppressed, 1u);
}

TEST_F(RedlinerTest, RevisionIdsComeFromOneDocumentWideCounter) {
  RedlineResult result = run({"a b", "c d"}, {"a x", "c y", "e"});
  vector<int> ids = revisionIds(readOutputDocument(result.document));
  // two del/ins pairs, then one insertion run and its paragraph mark
  ASSERT_EQ(ids.size(), 6u);
  EXPECT_EQ(vector<int>(ids.begin(), ids.begin() + 4), (vector<int>{1, 2, 3, 4}));
  sort(ids.begin(), ids.end());
  EXPECT_EQ(ids, (vector<int>{1, 2, 3, 4, 5, 6}));
}

TEST_F(RedlinerTest, StampsUseAuthorAndTimestamp) {
  RedlineResult result = run({"old"}, {"new"});
  Node doc = readOutputDocument(result.document);
  const Node* ins = doc.findDescendant("ins");
  ASSERT_NE(ins, nullptr);
  EXPECT_EQ(*ins->attr("author"), "Tester");
  EXPECT_EQ(*ins->attr("date"), "2024-05-01T12:00:00Z");
}

TEST_F(RedlinerTest, EmptyAuthorFallsBackToDefault) {
  RedlineRequest r = request(docxOf({"old"}), docxOf({"new"}));
  r.author = "";
  Node doc = readOutputDocument(redline(r).document);
  EXPECT_EQ(*doc.findDescendant("del")->attr("author"), DEFAULT_AUTHOR);
}

TEST_F(RedlinerTest, OutputIsTheFourPartPackage) {
  RedlineRequest r = request(docxOf({"x"}),
                             makeDocx(nullptr, {{PartNames::DOCUMENT, documentXml({"x"})},
                                                {"word/media/image1.png", "PNG"},
                                                {"word/styles.xml", "<w:styles/>"}}));
  ZipArchive zip = ZipArchive::open(redline(r).document, ResourceLimits());
  EXPECT_EQ(zip.paths(), (vector<string>{PartNames::CONTENT_TYPES, PartNames::ROOT_RELS,
                                         PartNames::DOCUMENT, PartNames::SETTINGS}));
}

TEST_F(RedlinerTest, IsoTimestampFormat) {
  auto epoch = chrono::system_clock::time_point{};
  EXPECT_EQ(isoTimestamp(epoch), "1970-01-01T00:00:00Z");
  EXPECT_EQ(isoTimestamp(epoch + chrono::seconds(86400 + 3661)), "1970-01-02T01:01:01Z");
}

// =============================================================================
// Existing tracked changes
// =============================================================================

static const string TRACKED_BODY =
    "<w:p><w:r><w:t xml:space=\"preserve\">keep </w:t></w:r>"
    "<w:ins w:id=\"1\" w:author=\"Old\"><w:r><w:t>added</w:t></w:r></w:ins>"
    "<w:del w:id=\"2\" w:author=\"Old\"><w:r><w:delText>removed</w:delText></w:r></w:del></w:p>";

TEST_F(RedlinerTest, ExistingRevisionsAreFlattenedUnderIgnore) {
  RedlineResult result = redline(request(docxOf({"keep added"}),
                                         makeDocx(documentXmlRaw(TRACKED_BODY))));
  EXPECT_EQ(described(result), (vector<string>{"keep added"}));
}

TEST_F(RedlinerTest, ExistingRevisionsFailUnderStrict) {
  RedlineRequest r = request(docxOf({"keep"}), makeDocx(documentXmlRaw(TRACKED_BODY)));
  r.options = Options::strict();
  try {
    redline(r);
    FAIL() << "expected PolicyViolationError";
  } catch (const PolicyViolationError& e) {
    EXPECT_NE(string(e.what()).find("2 found"), string::npos) << e.what();
  }
}

TEST_F(RedlinerTest, StrictAcceptsCleanRevised) {
  RedlineRequest r = request(docxOf({"a"}), docxOf({"b"}));
  r.options = Options::strict();
  r.options.timestamp = "2024-05-01T12:00:00Z";
  EXPECT_NO_THROW(redline(r));
}

// =============================================================================
// Failures and warnings
// =============================================================================

TEST_F(RedlinerTest, NotAZipIsArchiveError) {
  EXPECT_THROW(redline(request("garbage", docxOf({"x"}))), ArchiveError);
  try {
    redline(request(docxOf({"x"}), "garbage"));
    FAIL() << "expected ArchiveError";
  } catch (const ArchiveError& e) {
    EXPECT_NE(string(e.what()).find("revised"), string::npos) << e.what();
  }
}

TEST_F(RedlinerTest, MissingDocumentPartIsMissingPartError) {
  EXPECT_THROW(redline(request(docxOf({"x"}), makeDocx(nullptr))), MissingPartError);
  EXPECT_THROW(redline(request(makeDocx(nullptr), docxOf({"x"}))), MissingPartError);
}

TEST_F(RedlinerTest, TooManyEntriesIsArchiveError) {
  RedlineRequest r = request(docxOf({"x"}), docxOf({"y"}));
  r.options.limits.maxEntries = 2;
  EXPECT_THROW(redline(r), ArchiveError);
}

TEST_F(RedlinerTest, MalformedRevisedDocumentWarnsAndDeletesEverything) {
  RedlineResult result = redline(request(docxOf({"one", "two"}),
                                         makeDocx(string("<w:document><w:body>"))));
  EXPECT_EQ(described(result), (vector<string>{"[-one-]", "[-two-]"}));
  ASSERT_EQ(result.warnings.size(), 1u);
  EXPECT_NE(result.warnings[0].find("Malformed"), string::npos);
  EXPECT_NE(result.warnings[0].find("revised"), string::npos);
}

TEST_F(RedlinerTest, TokenCapFallsBackToWholeParagraph) {
  RedlineRequest r = request(docxOf({"one two three"}), docxOf({"one two four"}));
  r.options.limits.maxTokensPerParagraph = 2;
  RedlineResult result = redline(r);
  EXPECT_EQ(described(result), (vector<string>{"[-one two three-][+one two four+]"}));
  EXPECT_EQ(result.warnings.size(), 1u);
}

TEST_F(RedlinerTest, HeadersAndFootersAreReportedWhenRequested) {
  RedlineRequest r = request(docxOf({"x"}),
                             makeDocx(nullptr, {{PartNames::DOCUMENT, documentXml({"x"})},
                                                {"word/header1.xml", "<w:hdr/>"},
                                                {"word/footer1.xml", "<w:ftr/>"}}));
  EXPECT_TRUE(redline(r).warnings.empty());

  r = request(r.base, r.revised);
  r.options.includeHeadersFooters = true;
  RedlineResult result = redline(r);
  ASSERT_EQ(result.warnings.size(), 2u);
  EXPECT_NE(result.warnings[0].find("word/header1.xml"), string::npos);
}

TEST_F(RedlinerTest, SectionPropertiesComeFromRevised) {
  const string sect = "<w:sectPr><w:pgSz w:w=\"11906\" w:h=\"16838\"/></w:sectPr>";
  RedlineResult result = redline(request(docxOf({"x"}),
                                         makeDocx(documentXmlRaw(paragraphXml("x") + sect))));
  Node doc = readOutputDocument(result.document);
  const Node* pgSz = doc.child("body")->children.back().child("pgSz");
  ASSERT_NE(pgSz, nullptr);
  EXPECT_EQ(*pgSz->attr("w"), "11906");
}

TEST_F(RedlinerTest, DanglingRelationshipReferencesAreReported) {
  const string body =
      "<w:p><w:r><w:t>x</w:t></w:r></w:p>"
      "<w:sectPr xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\">"
      "<w:headerReference w:type=\"default\" r:id=\"rId3\"/></w:sectPr>";
  RedlineResult result = redline(request(docxOf({"x"}), makeDocx(documentXmlRaw(body))));
  ASSERT_EQ(result.warnings.size(), 1u);
  EXPECT_NE(result.warnings[0].find("Removed 1 element"), string::npos);
  Node doc = readOutputDocument(result.document);
  EXPECT_EQ(countNamed(doc, "headerReference"), 0u);
}
