#include "step_chunker/element_policy.hpp"
#include <cctype>
#include <system_error>
#include <fast_float/fast_float.h>

namespace sc {

static bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

std::optional<double> ElementPolicy::parse_number(std::string_view s) const {
  if (s.empty()) return std::nullopt;
  double out;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

std::optional<bool> ElementPolicy::parse_bool(std::string_view s) const {
  for (const auto& t : bools.true_tokens) {
    if (bools.case_sensitive ? (s == t) : ieq(s, t)) return true;
  }
  for (const auto& f : bools.false_tokens) {
    if (bools.case_sensitive ? (s == f) : ieq(s, f)) return false;
  }
  return std::nullopt;
}

bool ElementPolicy::is_null_token(std::string_view s) const {
  for (const auto& n : null_tokens) if (s == n) return true;
  return false;
}

ElementKind ElementPolicy::classify(std::string_view s) const {
  if (detect_nulls && is_null_token(s)) return ElementKind::Null;
  if (parse_number(s)) return ElementKind::Number;
  if (detect_bools && parse_bool(s)) return ElementKind::Bool;
  return ElementKind::String;
}

}
