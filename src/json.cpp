#include "json.hpp"
#include <boost/format.hpp>
#include <boost/locale/utf.hpp>
#include <cmath>
#include <limits>
#include <type_traits>

namespace featherlog {
std::ostream &write_json(std::ostream &os, const std::string &str) {
  using utf = boost::locale::utf::utf_traits<char>;
  os << '"';
  for (auto it = str.begin(); it != str.end();) {
    auto start = it;
    boost::locale::utf::code_point c = utf::decode(it, str.end());
    if (c == boost::locale::utf::illegal ||
        c == boost::locale::utf::incomplete) {
      // Bytes that are not UTF-8 are replaced one by one
      os << "\\ufffd";
      it = start + 1;
      continue;
    }
    switch (c) {
    case '"':
      os << "\\\"";
      break;
    case '\\':
      os << "\\\\";
      break;
    case '\n':
      os << "\\n";
      break;
    case '\r':
      os << "\\r";
      break;
    case '\t':
      os << "\\t";
      break;
    default:
      if (c < 0x20) {
        os << boost::format("\\u%04x") % c;
      } else {
        os.write(&*start, it - start);
      }
    }
  }
  os << '"';
  return os;
}

std::ostream &write_json(std::ostream &os, const Row &row) {
  os << "[";
  for (size_t col = 0; col < row.size(); ++col) {
    if (col > 0) {
      os << ", ";
    }
    std::visit(
        [&os](auto &&arg) {
          using T = std::decay_t<decltype(arg)>;
          if constexpr (std::is_same_v<T, std::string>) {
            write_json(os, arg);
          } else if constexpr (std::is_same_v<T, double>) {
            if (std::isfinite(arg)) {
              std::streamsize precision = os.precision();
              os.precision(std::numeric_limits<double>::max_digits10);
              os << arg;
              os.precision(precision);
            } else {
              os << "null";
            }
          } else {
            os << arg;
          }
        },
        row[col]);
  }
  os << "]";
  return os;
}
} // namespace featherlog
