#pragma once
#include <cstddef>
#include <optional>
#include <utility>
#include <string>

namespace sc {

// Which field of a record a field cursor yields: by name, or by zero-based index.
struct FieldSelector {
  std::string name;
  std::optional<std::size_t> index;

  static FieldSelector by_name(std::string n) { return FieldSelector{std::move(n), std::nullopt}; }
  static FieldSelector by_index(std::size_t i) { return FieldSelector{std::string{}, i}; }
};

}
