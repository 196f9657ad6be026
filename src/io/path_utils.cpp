#include "step_chunker/path_utils.hpp"
#include <algorithm>
#include <cctype>
#include <system_error>

namespace sc {

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent, ec)) return true;
  return std::filesystem::create_directories(parent, ec) || !ec;
}

FileFormat detect_format(std::string_view path) {
  auto ext = std::filesystem::path(std::string(path)).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  if (ext == ".csv") return FileFormat::CSV;
  if (ext == ".jsonl" || ext == ".ndjson") return FileFormat::JSONL;
  return FileFormat::Text;
}

bool parse_format(std::string_view name, FileFormat* out) {
  if (name == "text")  { *out = FileFormat::Text;  return true; }
  if (name == "csv")   { *out = FileFormat::CSV;   return true; }
  if (name == "jsonl") { *out = FileFormat::JSONL; return true; }
  return false;
}

const char* content_type(FileFormat f) {
  switch (f) {
    case FileFormat::CSV:   return "text/csv";
    case FileFormat::JSONL: return "application/x-ndjson";
    case FileFormat::Text:  return "text/plain";
  }
  return "text/plain";
}

}
