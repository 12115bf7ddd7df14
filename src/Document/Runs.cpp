#include "Runs.h"

#include <algorithm>

#include "Document/Paragraph.h"

using namespace std;

namespace Runs {

static Node textElement(const char* tag, string_view text) {
  Node t = Node::element(tag);
  t.setAttr("space", "preserve", Ns::XML);
  t.setText(string(text));
  return t;
}

static Node stamped(const char* tag, const RevisionStamp& stamp) {
  Node n = Node::element(tag);
  n.setAttr("id", to_string(stamp.id));
  n.setAttr("author", stamp.author);
  n.setAttr("date", stamp.date);
  return n;
}

Node plain(string_view text) {
  Node r = Node::element("r");
  r.append(textElement("t", text));
  return r;
}

Node insertion(string_view text, const RevisionStamp& stamp) {
  Node ins = stamped("ins", stamp);
  ins.append(plain(text));
  return ins;
}

Node deletion(string_view text, const RevisionStamp& stamp) {
  Node r = Node::element("r");
  r.append(textElement("delText", text));
  Node del = stamped("del", stamp);
  del.append(std::move(r));
  return del;
}

void markParagraph(Node& paragraph, RevisionKind kind, const RevisionStamp& stamp) {
  Node* pPr = paragraph.child("pPr");
  if (!pPr) {
    paragraph.children.insert(paragraph.children.begin(), Node::element("pPr"));
    pPr = &paragraph.children.front();
  }

  Node* rPr = pPr->child("rPr");
  if (!rPr) {
    // rPr precedes sectPr and pPrChange inside pPr
    auto pos = find_if(pPr->children.begin(), pPr->children.end(), [](const Node& c) {
      return c.is("sectPr") || c.is("pPrChange");
    });
    rPr = &*pPr->children.insert(pos, Node::element("rPr"));
  }

  // ins/del lead CT_ParaRPr
  Node mark = stamped(kind == RevisionKind::Inserted ? "ins" : "del", stamp);
  rPr->children.insert(rPr->children.begin(), std::move(mark));
}

Node withRuns(const Node& paragraph, vector<Node> runs) {
  Node out = Node::element(paragraph.name, paragraph.ns);
  out.attributes = paragraph.attributes;

  size_t insertAt = string::npos;
  for (const auto& c : paragraph.children) {
    if (c.is("r") || Paragraphs::isInlineRunContainer(c)) {
      if (insertAt == string::npos) insertAt = out.children.size();
      continue;
    }
    out.children.push_back(c);
  }
  if (insertAt == string::npos) insertAt = out.children.size();

  out.children.insert(out.children.begin() + static_cast<ptrdiff_t>(insertAt),
                      make_move_iterator(runs.begin()), make_move_iterator(runs.end()));
  return out;
}

static bool referencesRelationship(const Node& n) {
  return any_of(n.attributes.begin(), n.attributes.end(),
                [](const Attribute& a) { return a.ns == Ns::R; });
}

size_t scrubRelationshipReferences(Node& node) {
  size_t removed = 0;
  auto& kids = node.children;
  for (auto it = kids.begin(); it != kids.end();) {
    if (it->isElement() && referencesRelationship(*it)) {
      it = kids.erase(it);
      removed++;
    } else {
      removed += scrubRelationshipReferences(*it);
      ++it;
    }
  }
  return removed;
}

}  // namespace Runs
