#pragma once

#include "Xml/Node.h"

// Tracked-change wrappers: ins, del, moveFrom, moveTo (matched by local name).
namespace Revisions {

bool isRevisionWrapper(const Node& node);

// Pure rewrite. Every wrapper below `root` is replaced by its own children,
// promoted into the wrapper's parent at the wrapper's position; everything
// else is copied in order. `root` itself is always kept.
Node strip(const Node& root);

// True when any descendant of `root` is a tracked-change wrapper.
bool hasTrackedChanges(const Node& root);

// Number of wrappers below `root`.
size_t countTrackedChanges(const Node& root);

}  // namespace Revisions
