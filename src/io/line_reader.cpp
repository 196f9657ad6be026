#include "step_chunker/line_reader.hpp"
#include <cerrno>
#include <cstring>
#include <utility>
#include <vector>

namespace sc {

struct LineReader::Impl {
  std::string path;
  Config cfg;
  std::FILE* f{nullptr};
  bool owns{false};
  bool opened{false};
  bool eof{false};
  int last_errno{0};
  std::uint64_t bytes{0};
  std::uint64_t lines{0};

  std::vector<char> buf;
  std::size_t head{0}, tail{0};   // unread bytes are buf[head, tail)
  bool skipping_oversize{false};   // drop until next newline

  ~Impl() { if (f && owns) std::fclose(f); }

  bool open() {
    opened = true;
    if (!f) {
      f = std::fopen(path.c_str(), "rb");
      if (!f) { last_errno = errno; return false; }
      owns = true;
    }
    buf.assign(cfg.block_bytes ? cfg.block_bytes : 1, 0);
    return true;
  }

  // Refill the block; false at EOF or on error.
  bool fill() {
    if (eof) return false;
    std::size_t n = std::fread(buf.data(), 1, buf.size(), f);
    if (n == 0) {
      if (std::ferror(f)) last_errno = errno ? errno : EIO;
      eof = true;
      return false;
    }
    bytes += n;
    head = 0; tail = n;
    return true;
  }

  void finish_line(std::string& out) {
    if (cfg.strip_cr && !out.empty() && out.back() == '\r') out.pop_back();
    ++lines;
  }

  bool next(std::string& out) {
    if (!opened && !open()) return false;
    if (last_errno != 0) return false;
    out.clear();
    bool have_any = false;

    while (true) {
      if (head == tail && !fill()) break;
      const char* s = buf.data() + head;
      const std::size_t avail = tail - head;
      const void* hit = std::memchr(s, '\n', avail);
      const std::size_t take = hit ? static_cast<std::size_t>(static_cast<const char*>(hit) - s) : avail;
      head += hit ? take + 1 : take;

      if (skipping_oversize) {
        if (hit) skipping_oversize = false;
        continue;
      }

      if (out.size() + take > cfg.max_record_bytes) {
        if (cfg.drop_oversize) {
          out.clear();
          have_any = false;
          if (!hit) skipping_oversize = true;
          continue;
        }
        // truncate and emit as best-effort; the rest of the line is dropped
        out.append(s, cfg.max_record_bytes - out.size());
        if (!hit) skipping_oversize = true;
        finish_line(out);
        return true;
      }

      out.append(s, take);
      have_any = true;
      if (hit) { finish_line(out); return true; }
    }

    if (last_errno != 0) return false;
    if (have_any && !out.empty()) { finish_line(out); return true; }
    return false;
  }
};

LineReader::LineReader(std::string path)
  : LineReader(std::move(path), Config{}) {}

LineReader::LineReader(std::string path, Config cfg)
  : p_(new Impl{}) {
  p_->path = std::move(path);
  p_->cfg = cfg;
}

LineReader::LineReader(std::FILE* stream, Config cfg)
  : p_(new Impl{}) {
  p_->path = "<stream>";
  p_->cfg = cfg;
  p_->f = stream;
}

LineReader::~LineReader() { delete p_; }

LineReader::LineReader(LineReader&& other) noexcept : p_(other.p_) { other.p_ = nullptr; }

LineReader& LineReader::operator=(LineReader&& other) noexcept {
  if (this != &other) { delete p_; p_ = other.p_; other.p_ = nullptr; }
  return *this;
}

bool LineReader::next(std::string& out) { return p_->next(out); }

bool LineReader::for_each_line(const LineCallback& cb) {
  std::string line;
  while (p_->next(line)) {
    if (!cb(line)) break;
  }
  return p_->last_errno == 0;
}

bool LineReader::ok() const noexcept { return p_->last_errno == 0; }
int  LineReader::last_error() const noexcept { return p_->last_errno; }
std::uint64_t LineReader::bytes_read() const noexcept { return p_->bytes; }
std::uint64_t LineReader::lines_read() const noexcept { return p_->lines; }

}
