#include "RevisionStripper.h"

#include <array>
#include <string_view>

using namespace std;

namespace Revisions {

static constexpr array<string_view, 4> WRAPPERS = {"ins", "del", "moveFrom", "moveTo"};

bool isRevisionWrapper(const Node& node) {
  if (!node.isElement()) return false;
  for (string_view tag : WRAPPERS) {
    if (node.name == tag) return true;
  }
  return false;
}

static void appendStripped(Node& parent, const Node& child) {
  if (isRevisionWrapper(child)) {
    // Wrapper content may itself hold wrappers (ins inside moveTo, ...)
    for (const auto& grandchild : child.children) {
      appendStripped(parent, grandchild);
    }
    return;
  }
  parent.append(strip(child));
}

Node strip(const Node& root) {
  if (root.isText()) return root;

  Node out = Node::element(root.name, root.ns);
  out.attributes = root.attributes;
  out.children.reserve(root.children.size());
  for (const auto& c : root.children) {
    appendStripped(out, c);
  }
  return out;
}

size_t countTrackedChanges(const Node& root) {
  size_t count = 0;
  for (const auto& c : root.children) {
    if (isRevisionWrapper(c)) count++;
    count += countTrackedChanges(c);
  }
  return count;
}

bool hasTrackedChanges(const Node& root) {
  for (const auto& c : root.children) {
    if (isRevisionWrapper(c) || hasTrackedChanges(c)) return true;
  }
  return false;
}

}  // namespace Revisions
