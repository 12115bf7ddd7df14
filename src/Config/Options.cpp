#include "Options.h"

using namespace std;

Options Options::defaults() {
  return Options{};
}

Options Options::strict() {
  Options o;
  o.existingTrackedRevisionsPolicy = TrackedRevisionsPolicy::Fail;
  return o;
}

Options Options::characterLevel() {
  Options o;
  o.granularity = Granularity::Char;
  return o;
}

const char* to_string(Granularity g) {
  switch (g) {
    case Granularity::Word: return "word";
    case Granularity::Char: return "char";
  }
  return "word";
}

const char* to_string(TrackedRevisionsPolicy p) {
  switch (p) {
    case TrackedRevisionsPolicy::Ignore: return "ignore";
    case TrackedRevisionsPolicy::Fail:   return "fail";
  }
  return "ignore";
}

optional<Granularity> parseGranularity(string_view s) {
  if (s == "word") return Granularity::Word;
  if (s == "char") return Granularity::Char;
  return nullopt;
}

optional<TrackedRevisionsPolicy> parseTrackedRevisionsPolicy(string_view s) {
  if (s == "ignore") return TrackedRevisionsPolicy::Ignore;
  if (s == "fail")   return TrackedRevisionsPolicy::Fail;
  return nullopt;
}
