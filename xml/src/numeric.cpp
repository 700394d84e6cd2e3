#include "kintree/xml/numeric.hpp"

#include "kintree/core/common/logger.hpp"

#include <cctype>
#include <charconv>
#include <limits>
#include <string>
#include <system_error>
#include <vector>

namespace kintree::xml {
namespace {

using kintree::core::LogLevel;
using kintree::core::LogLine;
using kintree::core::VecX;

bool isSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Locale-independent: always '.' as the decimal point, whatever LC_NUMERIC says.
// Hex floats are not accepted in the general format.
bool parseToken(std::string_view tok, double* out) {
  bool negative = false;
  if (!tok.empty() && (tok.front() == '+' || tok.front() == '-')) {
    negative = tok.front() == '-';
    tok.remove_prefix(1);
  }
  if (tok.empty() || tok.front() == '+' || tok.front() == '-') return false;

  const char* first = tok.data();
  const char* last = tok.data() + tok.size();
  double v = 0.0;
  const auto [ptr, ec] = std::from_chars(first, last, v, std::chars_format::general);
  if (ptr != last) return false;
  if (ec == std::errc::result_out_of_range) {
    // out of double range: overflow reads as inf, underflow as zero
    const auto e = tok.find_first_of("eE");
    const bool underflow = e != std::string_view::npos && e + 1 < tok.size() && tok[e + 1] == '-';
    v = underflow ? 0.0 : std::numeric_limits<double>::infinity();
  } else if (ec != std::errc()) {
    return false;
  }
  *out = negative ? -v : v;
  return true;
}

std::size_t coerceRecursive(Element* e) {
  std::size_t converted = 0;
  for (auto& kv : e->attributes) {
    VecX numbers;
    if (parseNumbers(kv.second.text, &numbers)) {
      kv.second.numbers = std::move(numbers);
      ++converted;
    }
  }
  for (auto& c : e->children) converted += coerceRecursive(&c);
  return converted;
}

}  // namespace

bool parseNumbers(std::string_view text, VecX* out) {
  if (!out) return false;

  std::vector<double> values;
  std::size_t i = 0;
  while (i < text.size()) {
    while (i < text.size() && isSpace(text[i])) ++i;
    if (i == text.size()) break;

    std::size_t j = i;
    while (j < text.size() && !isSpace(text[j])) ++j;

    double v = 0.0;
    if (!parseToken(text.substr(i, j - i), &v)) return false;
    values.push_back(v);
    i = j;
  }
  if (values.empty()) return false;

  *out = Eigen::Map<const VecX>(values.data(), static_cast<Eigen::Index>(values.size()));
  return true;
}

void coerceNumericAttributes(Element* root) {
  if (!root) return;
  const std::size_t n = coerceRecursive(root);
  LogLine(LogLevel::Debug) << "numeric coercion converted " << n << " attribute values";
}

}  // namespace kintree::xml
