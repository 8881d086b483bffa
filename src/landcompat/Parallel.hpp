#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <thread>
#include <vector>

namespace landcompat {

// Map a requested worker count onto something sensible for `items` units of work.
//
// - 1: single thread.
// - >1: up to that many workers.
// - <=0: auto (std::thread::hardware_concurrency()).
//
// Never returns more workers than items, and never less than 1.
inline int ResolveThreadCount(int requested, std::size_t items)
{
  int threads = requested;
  if (threads <= 0) {
    threads = static_cast<int>(std::thread::hardware_concurrency());
    if (threads <= 0) threads = 1;
  }
  if (items < static_cast<std::size_t>(threads)) threads = static_cast<int>(items);
  return std::max(1, threads);
}

// Run fn(worker, i) for every i in [0, count).
//
// Items are handed out through an atomic counter, so the item -> worker assignment is not
// deterministic. Callers must write results into per-item slots (or per-worker scratch merged
// with an order-independent reduction) to keep outputs deterministic.
template <typename Fn>
void ParallelFor(std::size_t count, int threads, Fn&& fn)
{
  if (count == 0) return;

  if (threads <= 1) {
    for (std::size_t i = 0; i < count; ++i) fn(0, i);
    return;
  }

  std::atomic<std::size_t> next{0};
  std::vector<std::thread> pool;
  pool.reserve(static_cast<std::size_t>(threads));

  for (int t = 0; t < threads; ++t) {
    pool.emplace_back([&, t]() {
      for (;;) {
        const std::size_t i = next.fetch_add(1);
        if (i >= count) break;
        fn(t, i);
      }
    });
  }
  for (auto& th : pool) th.join();
}

// Same as ParallelFor but hands out contiguous [begin, end) ranges of at most `chunk` items,
// for loops whose per-item work is too small to pay for an atomic increment each.
template <typename Fn>
void ParallelForChunks(std::size_t count, std::size_t chunk, int threads, Fn&& fn)
{
  if (count == 0) return;
  if (chunk == 0) chunk = 1;

  const std::size_t chunks = (count + chunk - 1) / chunk;
  ParallelFor(chunks, threads, [&](int worker, std::size_t c) {
    const std::size_t begin = c * chunk;
    const std::size_t end = std::min(count, begin + chunk);
    fn(worker, begin, end);
  });
}

} // namespace landcompat
