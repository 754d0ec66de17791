/**
 * @file parse_number.hpp
 * @brief Numeric form of the code names typed on the command line and in
 *        the config file: decimal ("10"), or hex after a 0x prefix ("0xa").
 *
 * A leading zero does not mean octal: "010" is ten. Signs and blanks are
 * rejected so that a name lookup gets its turn.
 */
#ifndef CECBRIDGE_PARSE_NUMBER_HPP
#define CECBRIDGE_PARSE_NUMBER_HPP

#include <cctype>
#include <cstdlib>
#include <string>

namespace cecbridge {

inline bool parse_number(const std::string& text, long& out) {
  const char* s = text.c_str();
  int base = 10;
  if (text.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
    s += 2;
    base = 16;
  }
  if (!std::isxdigit(static_cast<unsigned char>(*s))) return false;

  char* e = nullptr;
  const long v = std::strtol(s, &e, base);
  if (e == s || *e != '\0') return false;
  out = v;
  return true;
}

} // namespace cecbridge

#endif // CECBRIDGE_PARSE_NUMBER_HPP
