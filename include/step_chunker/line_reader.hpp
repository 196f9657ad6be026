#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <string>
#include <string_view>

namespace sc {

// One-pass, block-buffered reader of file lines. Satisfies the cursor
// capability (value_type + next()), so it can feed CursorChunker directly.
class LineReader {
public:
  using value_type = std::string;

  struct Config {
    std::size_t block_bytes      = 512 * 1024;      // 512 KiB
    std::size_t max_record_bytes = 8 * 1024 * 1024; // 8 MiB guard per line
    bool        strip_cr         = true;            // trim trailing '\r' (CRLF)
    bool        drop_oversize    = true;            // drop lines exceeding guard, else truncate
  };

  explicit LineReader(std::string path);      // uses default Config{}
  LineReader(std::string path, Config cfg);
  // Borrows an open stream (e.g. stdin); it is not closed on destruction.
  LineReader(std::FILE* stream, Config cfg);

  ~LineReader();
  LineReader(const LineReader&) = delete;
  LineReader& operator=(const LineReader&) = delete;
  LineReader(LineReader&& other) noexcept;
  LineReader& operator=(LineReader&& other) noexcept;

  // Next line without its terminator; false at EOF or on error.
  bool next(std::string& out);

  using LineCallback = std::function<bool(std::string_view)>;

  // Feeds the remaining lines to `cb` until it returns false.
  // Returns false only on an I/O error.
  bool for_each_line(const LineCallback& cb);

  bool ok() const noexcept;
  int  last_error() const noexcept;
  std::uint64_t bytes_read() const noexcept;
  std::uint64_t lines_read() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
