#include "step_chunker/jsonl_fields.hpp"
#include "step_chunker/line_reader.hpp"

#include <simdjson.h>
#include <string>
#include <string_view>
#include <utility>

namespace sc {

static std::string copy_capped(std::string_view s, size_t cap) {
  if (s.size() <= cap) return std::string(s);
  if (cap <= 3) return std::string(s.substr(0, cap));
  std::string out; out.reserve(cap);
  out.append(s.substr(0, cap - 3));
  out.append("...");
  return out;
}

static std::string_view trim_ws(std::string_view s) {
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n'))
    s.remove_suffix(1);
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  return s;
}

// Text of a value as an element.
static std::string value_text(simdjson::ondemand::value& v, size_t cap) {
  switch (v.type().value()) {
    case simdjson::ondemand::json_type::string: {
      std::string_view s = v.get_string().value();
      return std::string(s);
    }
    case simdjson::ondemand::json_type::null:
      return std::string{};
    case simdjson::ondemand::json_type::number:
    case simdjson::ondemand::json_type::boolean:
      return std::string(trim_ws(v.raw_json_token()));
    default: {
      // arrays/objects: raw JSON, capped
      std::string_view tok = v.raw_json().value();
      return copy_capped(trim_ws(tok), cap);
    }
  }
}

// Text of a scalar document (a line that is a bare string, number, bool or null).
static std::string scalar_text(simdjson::ondemand::document& doc, simdjson::ondemand::json_type t) {
  switch (t) {
    case simdjson::ondemand::json_type::string:
      return std::string(doc.get_string().value());
    case simdjson::ondemand::json_type::null:
      return std::string{};
    default:
      return std::string(trim_ws(doc.raw_json_token().value()));
  }
}

struct JsonlFieldCursor::Impl {
  LineReader& lines;
  JsonlConfig cfg;
  FieldSelector sel;
  simdjson::ondemand::parser parser;
  std::string line;
  std::string scratch;
  bool failed{false};

  Impl(LineReader& l, const JsonlConfig& c, FieldSelector s)
    : lines(l), cfg(c), sel(std::move(s)) {}
};

JsonlFieldCursor::JsonlFieldCursor(LineReader& lines, const JsonlConfig& cfg, FieldSelector sel)
  : p_(new Impl(lines, cfg, std::move(sel))) {}

JsonlFieldCursor::~JsonlFieldCursor() { delete p_; }

bool JsonlFieldCursor::next(std::string& out) {
  if (p_->failed) return false;

  while (p_->lines.next(p_->line)) {
    if (trim_ws(p_->line).empty()) continue;

    auto& scratch = p_->scratch;
    scratch.assign(p_->line);
    scratch.resize(p_->line.size() + simdjson::SIMDJSON_PADDING, '\0');
    simdjson::padded_string_view view(scratch.data(), p_->line.size(), scratch.size());

    try {
      simdjson::ondemand::document doc = p_->parser.iterate(view);
      const auto t = doc.type().value();

      if (t == simdjson::ondemand::json_type::object) {
        simdjson::ondemand::object obj = doc.get_object();
        out.clear();
        std::size_t i = 0;
        for (auto res : obj) {
          simdjson::ondemand::field field = std::move(res);
          std::string_view k = field.unescaped_key().value();
          const bool hit = p_->sel.index ? (i == *p_->sel.index) : (k == p_->sel.name);
          if (hit) {
            out = value_text(field.value(), p_->cfg.cap_nested_value_bytes);
            break;
          }
          ++i;
        }
        ++records_;
        return true;
      }

      if (p_->cfg.strict) {
        err_ = "JSONL strict mode: non-object line " + std::to_string(p_->lines.lines_read());
        p_->failed = true;
        return false;
      }

      // lenient: the scalar/array line itself is the element.
      // get_value() refuses scalar documents, so those are read off the document.
      if (t == simdjson::ondemand::json_type::array) {
        simdjson::ondemand::value root = doc.get_value();
        out = value_text(root, p_->cfg.cap_nested_value_bytes);
      } else {
        out = scalar_text(doc, t);
      }
      ++records_;
      return true;

    } catch (const simdjson::simdjson_error& e) {
      err_ = std::string("JSONL parse error at line ") + std::to_string(p_->lines.lines_read()) + ": " + e.what();
      p_->failed = true;
      return false;
    }
  }

  if (!p_->lines.ok()) {
    err_ = "read error (errno " + std::to_string(p_->lines.last_error()) + ")";
    p_->failed = true;
  }
  return false;
}

}
