#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "Diff/RunSynthesizer.h"
#include "Utils/TestUtils.h"

using namespace std;

class RunSynthesizerTest : public ::testing::Test {
protected:
  RunSynthesizer synth{"Reviewer", "2024-05-01T12:00:00Z"};

  // Wraps runs in a paragraph so the test helpers can render them.
  static Node paragraphOf(vector<Node> runs) {
    Node p = Node::element("p");
    for (auto& r : runs) p.append(std::move(r));
    return p;
  }
};

// =============================================================================
// Coalescing
// =============================================================================

TEST_F(RunSynthesizerTest, EqualRunsMergeIntoOnePlainRun) {
  EditScript script = {{EditKind::Equal, "Hello"}, {EditKind::Equal, " "},
                       {EditKind::Equal, "world"}};
  vector<Node> runs = synth.synthesize(script);
  ASSERT_EQ(runs.size(), 1u);
  EXPECT_EQ(describe(paragraphOf(std::move(runs))), "Hello world");
  EXPECT_EQ(synth.nextId(), 1);
}

TEST_F(RunSynthesizerTest, ChangesBetweenEqualsCoalesceDeletionFirst) {
  // Interleaved edits still produce one del and one ins
  EditScript script = {{EditKind::Equal, "a"},   {EditKind::Insert, "X"},
                       {EditKind::Delete, "b"},  {EditKind::Insert, "Y"},
                       {EditKind::Delete, "c"},  {EditKind::Equal, "d"}};
  Node p = paragraphOf(synth.synthesize(script));
  EXPECT_EQ(describe(p), "a[-bc-][+XY+]d");
  EXPECT_EQ(acceptAll(p), "aXYd");
  EXPECT_EQ(rejectAll(p), "abcd");
}

TEST_F(RunSynthesizerTest, EmptyScriptYieldsOneEmptyRun) {
  vector<Node> runs = synth.synthesize({});
  ASSERT_EQ(runs.size(), 1u);
  EXPECT_TRUE(runs[0].is("r"));
  EXPECT_EQ(describe(paragraphOf(std::move(runs))), "");
}

TEST_F(RunSynthesizerTest, WhitespaceIsPreservedInRuns) {
  vector<Node> runs = synth.synthesize({{EditKind::Equal, "  x  "}});
  const Node* t = runs[0].child("t");
  ASSERT_NE(t, nullptr);
  EXPECT_EQ(t->textSlot(), "  x  ");
  ASSERT_NE(t->attr("space"), nullptr);
  EXPECT_EQ(*t->attr("space"), "preserve");
}

// =============================================================================
// Revision stamps
// =============================================================================

TEST_F(RunSynthesizerTest, IdsIncreaseAcrossCalls) {
  Node first = paragraphOf(synth.synthesize({{EditKind::Delete, "a"}, {EditKind::Insert, "b"}}));
  Node second = paragraphOf(synth.synthesize({{EditKind::Insert, "c"}}));
  Node mark = Node::element("p");
  synth.markParagraph(mark, RevisionKind::Inserted);

  EXPECT_EQ(revisionIds(first), (vector<int>{1, 2}));
  EXPECT_EQ(revisionIds(second), (vector<int>{3}));
  EXPECT_EQ(revisionIds(mark), (vector<int>{4}));
  EXPECT_EQ(synth.nextId(), 5);
}

TEST_F(RunSynthesizerTest, StampsCarryAuthorAndDate) {
  Node ins = synth.insertion("new");
  ASSERT_TRUE(ins.is("ins"));
  EXPECT_EQ(*ins.attr("author"), "Reviewer");
  EXPECT_EQ(*ins.attr("date"), "2024-05-01T12:00:00Z");

  Node del = synth.deletion("old");
  ASSERT_TRUE(del.is("del"));
  EXPECT_NE(del.findDescendant("delText"), nullptr);
  EXPECT_EQ(del.findDescendant("t"), nullptr);
}

TEST_F(RunSynthesizerTest, ParagraphMarkGoesUnderPprRpr) {
  Node p = Node::element("p");
  Node pPr = Node::element("pPr");
  pPr.append(Node::element("jc"));
  pPr.append(Node::element("sectPr"));
  p.append(std::move(pPr));

  synth.markParagraph(p, RevisionKind::Deleted);
  const Node* props = p.child("pPr");
  ASSERT_EQ(props->children.size(), 3u);
  EXPECT_TRUE(props->children[0].is("jc"));
  EXPECT_TRUE(props->children[1].is("rPr"));
  EXPECT_TRUE(props->children[2].is("sectPr"));
  EXPECT_TRUE(props->children[1].children.at(0).is("del"));
}
