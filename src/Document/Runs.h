#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "Xml/Node.h"

// id/author/date carried by every tracked-change element
struct RevisionStamp {
  int id = 0;
  std::string author;
  std::string date;
};

enum class RevisionKind { Inserted, Deleted };

namespace Runs {

// <w:r><w:t xml:space="preserve">text</w:t></w:r>
Node plain(std::string_view text);

// <w:ins id author date><w:r><w:t>text</w:t></w:r></w:ins>
Node insertion(std::string_view text, const RevisionStamp& stamp);

// <w:del id author date><w:r><w:delText>text</w:delText></w:r></w:del>
Node deletion(std::string_view text, const RevisionStamp& stamp);

// Marks the paragraph mark itself (pPr/rPr/ins or del), so the whole
// paragraph is accepted or rejected as one unit.
void markParagraph(Node& paragraph, RevisionKind kind, const RevisionStamp& stamp);

// Copy of `paragraph` whose runs (and inline run containers) are replaced by
// `runs`, placed where the first original run was. Other children (pPr,
// bookmarks, ...) keep their order.
Node withRuns(const Node& paragraph, std::vector<Node> runs);

// Removes every descendant element carrying an attribute in the
// relationships namespace (r:id, r:embed, ...). Returns how many were removed.
size_t scrubRelationshipReferences(Node& node);

}  // namespace Runs
