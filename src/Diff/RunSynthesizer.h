#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "Diff/SequenceDiffer.h"
#include "Document/Runs.h"
#include "Xml/Node.h"

// Turns edit scripts into run nodes.
//
// Revision ids come from one counter owned by the synthesizer and never
// reset, so sharing one instance across a document gives document-wide
// unique, increasing ids. Every ins/del element it creates (runs and
// paragraph marks) takes the next id.
class RunSynthesizer {
public:
  RunSynthesizer(std::string author, std::string date, int firstId = 1)
      : author_(std::move(author)), date_(std::move(date)), nextId_(firstId) {}

  // Between two Equal runs, all Deletes coalesce into one deletion run and
  // all Inserts into one insertion run, deletion first. Each maximal run of
  // Equals becomes one plain run. An empty script yields one empty plain run.
  std::vector<Node> synthesize(const EditScript& script);

  Node insertion(std::string_view text) { return Runs::insertion(text, stamp()); }
  Node deletion(std::string_view text) { return Runs::deletion(text, stamp()); }
  void markParagraph(Node& paragraph, RevisionKind kind) {
    Runs::markParagraph(paragraph, kind, stamp());
  }

  int nextId() const { return nextId_; }
  const std::string& author() const { return author_; }
  const std::string& date() const { return date_; }

private:
  RevisionStamp stamp() { return RevisionStamp{nextId_++, author_, date_}; }

  std::string author_;
  std::string date_;
  int nextId_;
};
