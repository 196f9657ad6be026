#pragma once
#include "step_chunker/chunk_params.hpp"
#include "step_chunker/metrics.hpp"

#include <string>

namespace sc {

struct RunReport {
  RunStats stats;
  ChunkWindow params;

  std::string strategy;       // "indexed" | "cursor"
  bool verified = false;      // both strategies ran and agreed
  std::string filename;
  std::string content_type;
};

class RunReportWriter {
public:
  // Serialize the report to a single JSON object.
  static std::string to_json(const RunReport& r);

  // Writes to_json(r) to `path`, creating parent directories.
  static bool write_file(const RunReport& r, const std::string& path, std::string* err_out = nullptr);
};

}
