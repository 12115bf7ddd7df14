// Debug.h

#pragma once
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

#ifdef REDLINER_DEBUG
constexpr bool DEBUG_ENABLED = true;
#else
constexpr bool DEBUG_ENABLED = false;
#endif

namespace DebugLog {

struct Buffer {
  std::mutex lock;
  std::ostringstream stream;
};

inline Buffer& buffer() {
  static Buffer b;
  return b;
}

}  // namespace DebugLog

// Space between elements, and new line. One line is formatted locally and
// appended under the lock, so lines from worker threads never interleave.
template<typename... Args>
inline void debug([[maybe_unused]] Args&&... args){
  if constexpr(DEBUG_ENABLED){
    std::ostringstream line;
    const char* sep = "";
    ((line<<sep<<std::forward<Args>(args), sep=" "), ...);
    line<<'\n';

    auto& b = DebugLog::buffer();
    std::lock_guard<std::mutex> guard(b.lock);
    b.stream<<line.str();
  }
}

// Read and reset in one step
inline std::string take_debug_output() {
  auto& b = DebugLog::buffer();
  std::lock_guard<std::mutex> guard(b.lock);
  std::string out = b.stream.str();
  b.stream.str("");
  b.stream.clear();
  return out;
}
