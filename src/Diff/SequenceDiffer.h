#pragma once

#include <ostream>
#include <vector>

#include "Diff/Tokenizer.h"

enum class EditKind { Equal, Insert, Delete };

struct EditOp {
  EditKind kind;
  Token token;

  bool operator==(const EditOp&) const = default;
};

// Equal + Delete tokens rebuild the base text, Equal + Insert the revised text.
using EditScript = std::vector<EditOp>;

std::ostream& operator<<(std::ostream& os, const EditOp& op);

namespace Lcs {

// Exact longest-common-subsequence alignment.
//
// dp[i][j] = LCS length of a[i:] and b[j:], filled bottom-up in O(|a|*|b|)
// time and space. Backtracking from (0,0):
//   - a[i] == b[j]                -> Equal, advance both
//   - dp[i+1][j] >= dp[i][j+1]    -> Delete a[i]   (ties go to Delete)
//   - otherwise                   -> Insert b[j]
// then the tail of a as Deletes and the tail of b as Inserts.
//
// Ties resolving to Delete put "remove old" before "add new" at every
// replace point, e.g. [A,B] vs [A,C] -> Equal A, Delete B, Insert C.
// Callers bound |a| and |b| (see ResourceLimits::maxTokensPerParagraph).
EditScript diff(const std::vector<Token>& a, const std::vector<Token>& b);

// Number of Equal ops in a script
size_t commonLength(const EditScript& script);

}  // namespace Lcs
