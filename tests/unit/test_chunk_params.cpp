#include "step_chunker/chunk_params.hpp"
#include "step_chunker/chunker.hpp"

#include <iostream>
#include <string>
#include <vector>

static int failures = 0;

static void check(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

static bool throws_invalid(const sc::ChunkParams& p, const std::string& needle) {
  try {
    (void)sc::normalize(p);
  } catch (const sc::InvalidParameter& e) {
    return std::string(e.what()).find(needle) != std::string::npos;
  }
  return false;
}

int main() {
  // defaults
  {
    sc::ChunkParams p;
    p.chunk_size = 4;
    sc::ChunkWindow w = sc::normalize(p);
    check(w.chunk_size == 4, "chunk_size kept");
    check(w.chunk_step == 4, "chunk_step defaults to chunk_size");
    check(w.start_at == 0, "start_at defaults to 0");
    check(!w.stop_at, "stop_at unbounded by default");
    check(!w.return_tail, "return_tail defaults to false");
    check(w.resolve_stop(10) == 10, "unbounded stop resolves to length");
  }

  // stop clamps to the source length
  {
    sc::ChunkParams p;
    p.chunk_size = 2;
    p.stop_at = 20;
    sc::ChunkWindow w = sc::normalize(p);
    check(w.resolve_stop(16) == 16, "stop_at clamped to length");
    check(w.resolve_stop(30) == 20, "stop_at kept below length");
  }

  // malformed parameters
  {
    sc::ChunkParams p;
    p.chunk_size = 0;
    check(throws_invalid(p, "chunk_size"), "chunk_size 0 rejected");
    p.chunk_size = -3;
    check(throws_invalid(p, "chunk_size"), "negative chunk_size rejected");

    p.chunk_size = 3;
    p.chunk_step = 0;
    check(throws_invalid(p, "chunk_step"), "chunk_step 0 rejected");
    p.chunk_step = -1;
    check(throws_invalid(p, "chunk_step"), "negative chunk_step rejected");

    p.chunk_step = 1;
    p.start_at = -1;
    check(throws_invalid(p, "start_at"), "negative start_at rejected");
    p.start_at = 0;
    p.stop_at = -2;
    check(throws_invalid(p, "stop_at"), "negative stop_at rejected");
  }

  // non-throwing form
  {
    sc::ChunkParams p;
    p.chunk_size = 0;
    sc::ChunkWindow w;
    std::string err;
    check(!sc::try_normalize(p, &w, &err), "try_normalize fails on chunk_size 0");
    check(err.find("chunk_size") != std::string::npos, "try_normalize reports the parameter");
    p.chunk_size = 5;
    check(sc::try_normalize(p, &w, &err) && w.chunk_step == 5, "try_normalize succeeds");
  }

  // chunk() validates before building a stream, for both strategies
  {
    std::vector<int> v = {1, 2, 3};
    sc::ChunkParams p;
    p.chunk_size = 2;
    p.chunk_step = 0;
    bool a = false, b = false;
    try { (void)sc::chunk(v, p); } catch (const sc::InvalidParameter&) { a = true; }
    try { (void)sc::chunk(v.begin(), v.end(), p); } catch (const sc::InvalidParameter&) { b = true; }
    check(a && b, "chunk() throws InvalidParameter for both strategies");
  }

  check(sc::describe(sc::normalize(sc::ChunkParams{3, 1, 2, 5, true})) == "size=3 step=1 start=2 stop=5 tail=yes",
        "describe()");

  if (failures) { std::cerr << "[FAIL] " << failures << " parameter check(s)\n"; return 1; }
  std::cout << "[PASS] chunk parameters\n";
  return 0;
}
