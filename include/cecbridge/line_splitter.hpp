/**
 * @file line_splitter.hpp
 * @brief Byte stream → complete text lines.
 *
 * @details
 * The adapter's stdout arrives in whatever chunks the pipe hands us: half a
 * line, three lines and a bit, one byte. LineSplitter keeps one growable
 * backlog and emits a line each time a '\n' shows up, terminator stripped
 * (a '\r' right before it goes too). At end of stream, finish() emits what
 * is left as a last line even without a terminator.
 *
 * For any way of chunking the same byte stream, the emitted lines are the
 * same. There is no reset; build a new splitter for a new stream.
 *
 * @code
 *   cecbridge::LineSplitter split([&](const std::string& l){ monitor.process_line(l); });
 *   split.feed(buf, n);   // as often as bytes arrive
 *   split.finish();       // on EOF
 * @endcode
 */
#ifndef CECBRIDGE_LINE_SPLITTER_HPP
#define CECBRIDGE_LINE_SPLITTER_HPP

#include <stddef.h>
#include <functional>
#include <string>

namespace cecbridge {

class LineSplitter {
public:
  using LineFn = std::function<void(const std::string&)>;

  explicit LineSplitter(LineFn on_line);

  /**
   * @brief Append a chunk and emit every line it completes.
   * @return Number of lines emitted by this call.
   */
  size_t feed(const char* data, size_t len);
  size_t feed(const std::string& chunk) { return feed(chunk.data(), chunk.size()); }

  /**
   * @brief End of stream: emit a non-empty backlog as the final line.
   * @return 1 if a line was emitted, else 0. Later calls do nothing.
   */
  size_t finish();

  /// Bytes waiting for a terminator.
  size_t backlog_size() const { return backlog_.size(); }

  bool finished() const { return finished_; }

private:
  void emit(std::string line);

  std::string backlog_;
  LineFn      on_line_;
  bool        finished_{false};
};

} // namespace cecbridge

#endif // CECBRIDGE_LINE_SPLITTER_HPP
