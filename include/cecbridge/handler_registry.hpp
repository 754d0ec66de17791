/**
 * @file handler_registry.hpp
 * @brief Ordered list of (line test, callback) pairs run against each adapter line.
 *
 * @details
 * Three kinds of test:
 * - **contains**  - substring search.
 * - **pattern**   - `boost::regex_search`, at least one match anywhere in the line.
 * - **predicate** - any `bool(const std::string&)`.
 *
 * dispatch() runs *every* entry whose test passes; there is no first-match
 * rule and order implies no priority. One line can feed several handlers
 * (e.g. a debug line the Remote decodes while a diagnostic predicate logs it).
 *
 * Pattern tests are stateless: each call does its own regex_search, nothing
 * is remembered between lines.
 */
#ifndef CECBRIDGE_HANDLER_REGISTRY_HPP
#define CECBRIDGE_HANDLER_REGISTRY_HPP

#include <stdint.h>
#include <stddef.h>
#include <functional>
#include <boost/regex.hpp>
#include <string>
#include <vector>

namespace cecbridge {

class HandlerRegistry {
public:
  using Callback  = std::function<void(const std::string&)>;
  using Predicate = std::function<bool(const std::string&)>;

  enum class MatchKind : uint8_t { Contains, Pattern, Predicate };

  struct Entry {
    MatchKind    kind{MatchKind::Contains};
    std::string  needle;      ///< Contains
    boost::regex pattern;     ///< Pattern
    Predicate    predicate;   ///< Predicate
    Callback     callback;

    bool matches(const std::string& line) const;
  };

  /// Append any entry. O(1) amortized.
  void add(Entry entry);

  void add_contains(const std::string& needle, Callback cb);
  void add_pattern(const boost::regex& pattern, Callback cb);
  void add_predicate(Predicate pred, Callback cb);

  /**
   * @brief Run every matching entry's callback with @p line.
   * @return Number of callbacks invoked (0 = line not understood).
   *
   * Entries appended by a callback during dispatch() take part from the
   * next line on.
   */
  size_t dispatch(const std::string& line) const;

  size_t size() const { return entries_.size(); }

private:
  std::vector<Entry> entries_;
};

} // namespace cecbridge

#endif // CECBRIDGE_HANDLER_REGISTRY_HPP
