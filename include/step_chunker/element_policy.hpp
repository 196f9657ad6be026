#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sc {

enum class ElementKind { Null, Bool, Number, String };

struct BoolPolicy {
  std::vector<std::string> true_tokens  = {"true","1","TRUE","True"};
  std::vector<std::string> false_tokens = {"false","0","FALSE","False"};
  bool case_sensitive = false;
};

// Decides how textual elements are rendered in typed output.
struct ElementPolicy {
  BoolPolicy bools;
  std::vector<std::string> null_tokens = {"null","NULL","NaN","NA",""};
  bool detect_bools = true;
  bool detect_nulls = true;

  // Whole-string numeric parse (fast_float).
  std::optional<double> parse_number(std::string_view s) const;

  std::optional<bool> parse_bool(std::string_view s) const;

  bool is_null_token(std::string_view s) const;

  // Null wins over Number ("NaN"), Number over Bool ("1").
  ElementKind classify(std::string_view s) const;
};

}
