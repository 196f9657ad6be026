#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace sc {

enum class FileFormat { Text, CSV, JSONL };

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// Guess format from extension (.csv | .jsonl | .ndjson); anything else is text.
FileFormat detect_format(std::string_view path);

// Parses "auto|text|csv|jsonl"; "auto" and unknown names return false.
bool parse_format(std::string_view name, FileFormat* out);

const char* content_type(FileFormat f);

}
