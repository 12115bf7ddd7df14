#pragma once

#include <string>
#include <vector>

#include "Config/Options.h"
#include "Xml/Node.h"

// Which paragraphs of a body enter the aligned sequence.
struct ParagraphFilter {
  bool includeLists     = true;
  bool includeTables    = true;
  bool includeTextBoxes = true;

  static ParagraphFilter from(const Options& options) {
    ParagraphFilter f;
    f.includeLists = options.includeLists;
    f.includeTables = options.includeTables;
    f.includeTextBoxes = options.includeTextBoxes;
    return f;
  }
};

namespace Paragraphs {

// document/body, or nullptr
const Node* bodyOf(const Node& documentRoot);

// Paragraphs of the body in document order. Pointers are non-owning and stay
// valid while `documentRoot` is alive and unmodified. Body paragraphs always
// count; table-cell paragraphs, text-box paragraphs (listed right after the
// paragraph that anchors the box) and list paragraphs follow `filter`.
std::vector<const Node*> paragraphsOf(const Node& documentRoot,
                                      const ParagraphFilter& filter = {});

// hyperlink, smartTag, fldSimple, customXml, sdt: inline wrappers whose runs
// belong to the enclosing paragraph
bool isInlineRunContainer(const Node& node);

// Runs of a paragraph in order, looking through inline run containers.
std::vector<const Node*> runsOf(const Node& paragraph);

// Concatenated w:t text of runsOf(paragraph). Expects tracked changes to have
// been stripped already.
std::string textOf(const Node& paragraph);

// pPr/numPr present
bool isListParagraph(const Node& paragraph);

}  // namespace Paragraphs
