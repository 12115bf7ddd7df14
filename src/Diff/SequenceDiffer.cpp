#include "SequenceDiffer.h"

#include <cstdint>

#include "Utils/StringUtils.h"

using namespace std;

ostream& operator<<(ostream& os, const EditOp& op) {
  switch (op.kind) {
    case EditKind::Equal:  os << "="; break;
    case EditKind::Insert: os << "+"; break;
    case EditKind::Delete: os << "-"; break;
  }
  return os << '"' << makePrintable(op.token) << '"';
}

namespace Lcs {

EditScript diff(const vector<Token>& a, const vector<Token>& b) {
  EditScript ops;
  ops.reserve(a.size() + b.size());

  // A shared prefix is exactly what the backtrack below would emit first.
  size_t prefix = 0;
  while (prefix < a.size() && prefix < b.size() && a[prefix] == b[prefix]) {
    ops.push_back({EditKind::Equal, a[prefix]});
    prefix++;
  }

  const size_t m = a.size() - prefix;
  const size_t n = b.size() - prefix;
  auto A = [&](size_t i) { return a[prefix + i]; };
  auto B = [&](size_t j) { return b[prefix + j]; };

  // Row-major (m+1) x (n+1); row m and column n stay 0.
  const size_t width = n + 1;
  vector<uint32_t> dp((m + 1) * width, 0);
  auto at = [&](size_t i, size_t j) -> uint32_t& { return dp[i * width + j]; };

  for (size_t i = m; i-- > 0;) {
    for (size_t j = n; j-- > 0;) {
      if (A(i) == B(j)) {
        at(i, j) = at(i + 1, j + 1) + 1;
      } else {
        at(i, j) = max(at(i + 1, j), at(i, j + 1));
      }
    }
  }

  size_t i = 0, j = 0;
  while (i < m && j < n) {
    if (A(i) == B(j)) {
      ops.push_back({EditKind::Equal, A(i)});
      i++;
      j++;
    } else if (at(i + 1, j) >= at(i, j + 1)) {
      ops.push_back({EditKind::Delete, A(i)});
      i++;
    } else {
      ops.push_back({EditKind::Insert, B(j)});
      j++;
    }
  }
  while (i < m) ops.push_back({EditKind::Delete, A(i++)});
  while (j < n) ops.push_back({EditKind::Insert, B(j++)});

  return ops;
}

size_t commonLength(const EditScript& script) {
  size_t count = 0;
  for (const auto& op : script) {
    if (op.kind == EditKind::Equal) count++;
  }
  return count;
}

}  // namespace Lcs
