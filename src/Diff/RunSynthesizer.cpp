#include "RunSynthesizer.h"

using namespace std;

vector<Node> RunSynthesizer::synthesize(const EditScript& script) {
  vector<Node> runs;
  string equalBuf;
  string delBuf;
  string insBuf;

  auto flushChanges = [&]() {
    if (!delBuf.empty()) {
      runs.push_back(deletion(delBuf));
      delBuf.clear();
    }
    if (!insBuf.empty()) {
      runs.push_back(insertion(insBuf));
      insBuf.clear();
    }
  };
  auto flushEqual = [&]() {
    if (!equalBuf.empty()) {
      runs.push_back(Runs::plain(equalBuf));
      equalBuf.clear();
    }
  };

  for (const auto& op : script) {
    switch (op.kind) {
      case EditKind::Equal:
        flushChanges();
        equalBuf += op.token;
        break;
      case EditKind::Delete:
        flushEqual();
        delBuf += op.token;
        break;
      case EditKind::Insert:
        flushEqual();
        insBuf += op.token;
        break;
    }
  }
  flushEqual();
  flushChanges();

  if (runs.empty()) runs.push_back(Runs::plain(""));
  return runs;
}
