#include "Paragraph.h"

#include "Utils/Debug.h"

using namespace std;

namespace Paragraphs {

const Node* bodyOf(const Node& documentRoot) {
  if (documentRoot.is("body")) return &documentRoot;
  return documentRoot.child("body");
}

bool isInlineRunContainer(const Node& node) {
  return node.is("hyperlink") || node.is("smartTag") || node.is("fldSimple") ||
         node.is("customXml") || node.is("sdt") || node.is("sdtContent");
}

bool isListParagraph(const Node& paragraph) {
  const Node* pPr = paragraph.child("pPr");
  return pPr && pPr->child("numPr");
}

static void collectRuns(const Node& container, vector<const Node*>& out) {
  for (const auto& c : container.children) {
    if (c.is("r")) {
      out.push_back(&c);
    } else if (isInlineRunContainer(c)) {
      collectRuns(c, out);
    }
  }
}

vector<const Node*> runsOf(const Node& paragraph) {
  vector<const Node*> out;
  collectRuns(paragraph, out);
  return out;
}

string textOf(const Node& paragraph) {
  string out;
  for (const Node* r : runsOf(paragraph)) {
    for (const auto& c : r->children) {
      if (c.is("t")) out += c.textSlot();
    }
  }
  return out;
}

// =============================================================================
// Collection
// =============================================================================

namespace {

class Collector {
public:
  Collector(const ParagraphFilter& filter, vector<const Node*>& out)
      : filter_(filter), out_(out) {}

  // Block-level content: body, table cells, text-box content, block sdt.
  void blocks(const Node& container) {
    for (const auto& c : container.children) {
      if (c.is("p")) {
        paragraph(c);
      } else if (c.is("tbl")) {
        if (filter_.includeTables) table(c);
      } else if (c.is("sdt")) {
        if (const Node* content = c.child("sdtContent")) blocks(*content);
      } else if (c.is("customXml")) {
        blocks(c);
      }
    }
  }

private:
  void paragraph(const Node& p) {
    if (filter_.includeLists || !isListParagraph(p)) {
      out_.push_back(&p);
    }
    if (filter_.includeTextBoxes) textBoxes(p);
  }

  void table(const Node& tbl) {
    for (const Node* tr : tbl.childrenNamed("tr")) {
      for (const Node* tc : tr->childrenNamed("tc")) {
        blocks(*tc);
      }
    }
  }

  // mc:Fallback repeats the mc:Choice content (VML copy of the same box).
  void textBoxes(const Node& n) {
    for (const auto& c : n.children) {
      if (!c.isElement()) continue;
      if (c.is("Fallback")) continue;
      if (c.is("txbxContent")) {
        blocks(c);
      } else {
        textBoxes(c);
      }
    }
  }

  const ParagraphFilter& filter_;
  vector<const Node*>& out_;
};

}  // namespace

vector<const Node*> paragraphsOf(const Node& documentRoot, const ParagraphFilter& filter) {
  vector<const Node*> out;
  const Node* body = bodyOf(documentRoot);
  if (!body) return out;
  Collector(filter, out).blocks(*body);
  debug("collected", out.size(), "paragraphs");
  return out;
}

}  // namespace Paragraphs
