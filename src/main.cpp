#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include "Config/Options.h"
#include "Engine/Errors.h"
#include "Engine/Redliner.h"
#include "Utils/Debug.h"

using namespace std;
namespace fs = std::filesystem;

static string readFile(const fs::path& path) {
  ifstream fin(path, ios::binary);
  if (!fin) {
    throw runtime_error("Can't read " + path.string());
  }
  ostringstream ss;
  ss << fin.rdbuf();
  return ss.str();
}

static void writeFile(const fs::path& path, const string& bytes) {
  ofstream fout(path, ios::binary | ios::trunc);
  if (!fout || !fout.write(bytes.data(), static_cast<streamsize>(bytes.size()))) {
    throw runtime_error("Can't write " + path.string());
  }
}

int main(int argc, char* argv[]) {
  if (argc < 4 || argc > 6) {
    cerr << "usage: redliner <base.docx> <revised.docx> <out.docx> [author] [word|char]\n";
    return 1;
  }

  fs::path basePath = argv[1];
  fs::path revisedPath = argv[2];
  fs::path outPath = argv[3];

  RedlineRequest request;
  if (argc >= 5) request.author = argv[4];
  if (argc >= 6) {
    auto g = parseGranularity(argv[5]);
    if (!g) {
      cerr << "unknown granularity '" << argv[5] << "' (expected word or char)\n";
      return 1;
    }
    request.options.granularity = *g;
  }

  try {
    request.base = readFile(basePath);
    request.revised = readFile(revisedPath);

    RedlineResult result = redline(std::move(request));
    for (const auto& w : result.warnings) {
      cerr << "warning: " << w << "\n";
    }
    writeFile(outPath, result.document);

    cout << outPath.string() << ": " << result.stats.diffed << " diffed, "
         << result.stats.inserted << " inserted, " << result.stats.deleted << " deleted, "
         << result.stats.suppressed << " unchanged (whitespace)" << endl;
  } catch (const ArchiveError& e) {
    cerr << e.what() << "\n";
    return 2;
  } catch (const MissingPartError& e) {
    cerr << e.what() << "\n";
    return 3;
  } catch (const PolicyViolationError& e) {
    cerr << e.what() << "\n";
    return 4;
  } catch (const exception& e) {
    cerr << e.what() << "\n";
    return 1;
  }

  if (DEBUG_ENABLED) {
    cerr << take_debug_output();
  }
  return 0;
}
