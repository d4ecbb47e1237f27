/* @file LogEvent.cpp
 * @brief CSV rendering of campaign events
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <sstream>

// pledge headers
#include "core/LogEvent.hpp"

using namespace pledge::core;

namespace {
  /// Wraps \p field in quotes, doubling embedded ones.
  std::string quoted(const std::string& field) {
    std::string out;
    out.reserve(field.size() + 2);
    out += '"';
    for (char c : field) {
      if (c == '"')
        out += '"';
      out += c;
    }
    out += '"';
    return out;
  }

  bool needsQuoting(const std::string& field) {
    return field.find_first_of(",\"\r\n") != std::string::npos;
  }
} // namespace

std::string LogEvent::toCsv() const {
  // detail is always quoted; identities only when they carry separators or quotes
  std::ostringstream os;
  os << toMillis(when) << ',' << campaign << ',' << toString(kind) << ','
     << (needsQuoting(subject) ? quoted(subject) : subject) << ',' << amount << ','
     << quoted(detail) << '\n';
  return os.str();
}
