// -----------------------------------------------------------------------------
// line_splitter.cpp - chunked bytes → '\n'-terminated lines
//
// API: see include/cecbridge/line_splitter.hpp
// -----------------------------------------------------------------------------
#include "cecbridge/line_splitter.hpp"

#include <utility>

namespace cecbridge {

LineSplitter::LineSplitter(LineFn on_line) : on_line_(std::move(on_line)) {}

void LineSplitter::emit(std::string line) {
  if (!line.empty() && line.back() == '\r') line.pop_back();  // CRLF adapters
  if (on_line_) on_line_(line);
}

size_t LineSplitter::feed(const char* data, size_t len) {
  if (finished_ || !data || len == 0) return 0;

  backlog_.append(data, len);

  size_t emitted = 0;
  size_t start = 0;
  for (size_t nl = backlog_.find('\n', start); nl != std::string::npos;
       nl = backlog_.find('\n', start)) {
    emit(backlog_.substr(start, nl - start));
    start = nl + 1;
    ++emitted;
  }
  if (start) backlog_.erase(0, start);   // keep only the unterminated tail
  return emitted;
}

size_t LineSplitter::finish() {
  if (finished_) return 0;
  finished_ = true;
  if (backlog_.empty()) return 0;

  std::string last;
  last.swap(backlog_);
  emit(std::move(last));
  return 1;
}

} // namespace cecbridge
