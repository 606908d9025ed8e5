#pragma once
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#include "jsonl_resumable/jsonl_index.hpp"

namespace jr {

// Fixed-size thread pool with a FIFO task queue.
class WorkerPool {
public:
  explicit WorkerPool(std::size_t threads = 0);   // 0 -> hardware_concurrency
  ~WorkerPool();                                  // drains the queue, then joins

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  template <class F>
  auto submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
    using R = std::invoke_result_t<std::decay_t<F>>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
    std::future<R> fut = task->get_future();
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (stopping_) throw std::runtime_error("WorkerPool: submit after shutdown");
      queue_.emplace([task]{ (*task)(); });
    }
    cv_.notify_one();
    return fut;
  }

  std::size_t size() const noexcept { return threads_.size(); }

private:
  void worker_loop();

  std::mutex mu_;
  std::condition_variable cv_;
  std::queue<std::function<void()>> queue_;
  std::vector<std::thread> threads_;
  bool stopping_ = false;
};

struct StreamOptions {
  std::size_t batch_size = 100;                  // lines per offload
  std::uint64_t skip = 0;                        // lines dropped after start
  std::uint64_t limit = JsonlIndex::kUnbounded;  // max lines yielded
};

// Batched line stream. One batch is always in flight: next_batch() hands
// out the prefetched batch and schedules the following one. An empty batch
// marks the end. Batches arrive in line order.
class AsyncLineStream {
public:
  AsyncLineStream(AsyncLineStream&&) noexcept = default;
  AsyncLineStream& operator=(AsyncLineStream&&) noexcept = default;
  ~AsyncLineStream();

  std::shared_future<std::vector<Line>> next_batch();

  std::uint64_t position() const;   // next line number to be read
  std::uint64_t yielded() const;    // lines handed out so far

  // Waits for the in-flight batch and releases the file handle.
  void close();

private:
  friend class AsyncLineReader;
  struct State;
  AsyncLineStream(WorkerPool& pool, std::shared_ptr<State> st);
  void schedule();

  WorkerPool* pool_;
  std::shared_ptr<State> st_;
  std::shared_future<std::vector<Line>> pending_;
};

// Offloads index reads to a WorkerPool. The index itself stays synchronous;
// both the index and the pool must outlive the reader and its streams.
//
// Entry checks: CorruptSourceError when the data file has been deleted or
// is now smaller than the indexed size.
class AsyncLineReader {
public:
  AsyncLineReader(const JsonlIndex& index, WorkerPool& pool);

  // Splits `lines` into batches of `batch_size` reads, one task each.
  // Results follow the input order.
  std::future<std::vector<std::string>> read_many(std::vector<std::int64_t> lines,
                                                  std::size_t batch_size = 100) const;

  AsyncLineStream stream(std::int64_t start = 0, StreamOptions opts = {}) const;

private:
  void check_source() const;

  const JsonlIndex& index_;
  WorkerPool& pool_;
};

}
