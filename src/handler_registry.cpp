// -----------------------------------------------------------------------------
// handler_registry.cpp - line tests + callbacks, all matches run
// -----------------------------------------------------------------------------
#include "cecbridge/handler_registry.hpp"

#include <utility>

namespace cecbridge {

bool HandlerRegistry::Entry::matches(const std::string& line) const {
  switch (kind) {
    case MatchKind::Contains:  return line.find(needle) != std::string::npos;
    case MatchKind::Pattern:   return boost::regex_search(line, pattern);
    case MatchKind::Predicate: return predicate && predicate(line);
  }
  return false;
}

void HandlerRegistry::add(Entry entry) {
  entries_.push_back(std::move(entry));
}

void HandlerRegistry::add_contains(const std::string& needle, Callback cb) {
  Entry e;
  e.kind = MatchKind::Contains;
  e.needle = needle;
  e.callback = std::move(cb);
  add(std::move(e));
}

void HandlerRegistry::add_pattern(const boost::regex& pattern, Callback cb) {
  Entry e;
  e.kind = MatchKind::Pattern;
  e.pattern = pattern;
  e.callback = std::move(cb);
  add(std::move(e));
}

void HandlerRegistry::add_predicate(Predicate pred, Callback cb) {
  Entry e;
  e.kind = MatchKind::Predicate;
  e.predicate = std::move(pred);
  e.callback = std::move(cb);
  add(std::move(e));
}

size_t HandlerRegistry::dispatch(const std::string& line) const {
  const size_t n = entries_.size();   // entries added by a callback wait for the next line
  size_t fired = 0;
  for (size_t i = 0; i < n; ++i) {
    if (!entries_[i].matches(line)) continue;
    Callback cb = entries_[i].callback;  // entries_ may grow under us
    if (cb) {
      cb(line);
      ++fired;
    }
  }
  return fired;
}

} // namespace cecbridge
