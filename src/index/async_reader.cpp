#include "jsonl_resumable/async_reader.hpp"
#include "jsonl_resumable/errors.hpp"

#include <algorithm>
#include <utility>

namespace jr {

// ---------------------------------------------------------------- pool

WorkerPool::WorkerPool(std::size_t threads) {
  std::size_t n = threads ? threads : std::max(1u, std::thread::hardware_concurrency());
  threads_.reserve(n);
  for (std::size_t i = 0; i < n; ++i) threads_.emplace_back([this]{ worker_loop(); });
}

WorkerPool::~WorkerPool() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    stopping_ = true;
  }
  cv_.notify_all();
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
}

void WorkerPool::worker_loop() {
  for (;;) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lk(mu_);
      cv_.wait(lk, [this]{ return stopping_ || !queue_.empty(); });
      if (stopping_ && queue_.empty()) return;
      task = std::move(queue_.front());
      queue_.pop();
    }
    task();   // packaged_task stores exceptions in its future
  }
}

// ---------------------------------------------------------------- stream

struct AsyncLineStream::State {
  std::mutex mu;
  LineCursor cursor;
  std::size_t batch_size = 100;
  std::uint64_t yielded = 0;
  bool done = false;
  std::exception_ptr error;
};

AsyncLineStream::AsyncLineStream(WorkerPool& pool, std::shared_ptr<State> st)
  : pool_(&pool), st_(std::move(st)) {
  schedule();
}

AsyncLineStream::~AsyncLineStream() {
  if (st_) close();
}

void AsyncLineStream::schedule() {
  std::shared_future<std::vector<Line>> prev = pending_;
  std::shared_ptr<State> st = st_;
  pending_ = pool_->submit([st, prev]() -> std::vector<Line> {
    // Tasks are FIFO, so the previous batch is already running or done.
    if (prev.valid()) prev.wait();
    std::lock_guard<std::mutex> lk(st->mu);
    if (st->error) std::rethrow_exception(st->error);
    std::vector<Line> out;
    if (st->done) return out;
    out.reserve(st->batch_size);
    try {
      Line l;
      while (out.size() < st->batch_size && st->cursor.next(l)) out.push_back(std::move(l));
    } catch (...) {
      st->error = std::current_exception();
      st->done = true;
      st->cursor.close();
      throw;
    }
    if (out.size() < st->batch_size) st->done = true;
    st->yielded += out.size();
    return out;
  }).share();
}

std::shared_future<std::vector<Line>> AsyncLineStream::next_batch() {
  if (!st_) throw Error("AsyncLineStream: stream has been moved from");
  auto ready = pending_;
  schedule();
  return ready;
}

std::uint64_t AsyncLineStream::position() const {
  std::lock_guard<std::mutex> lk(st_->mu);
  return st_->cursor.position();
}

std::uint64_t AsyncLineStream::yielded() const {
  std::lock_guard<std::mutex> lk(st_->mu);
  return st_->yielded;
}

void AsyncLineStream::close() {
  if (pending_.valid()) pending_.wait();
  std::lock_guard<std::mutex> lk(st_->mu);
  st_->done = true;
  st_->cursor.close();
}

// ---------------------------------------------------------------- reader

AsyncLineReader::AsyncLineReader(const JsonlIndex& index, WorkerPool& pool)
  : index_(index), pool_(pool) {}

void AsyncLineReader::check_source() const {
  const FileIdentity live = index_.live_identity();   // throws if deleted
  const FileIdentity indexed = index_.identity();
  if (live.size < indexed.size) {
    throw CorruptSourceError(index_.source_path(),
                             "truncated to " + std::to_string(live.size) + " bytes (indexed " +
                             std::to_string(indexed.size) + ")");
  }
}

std::future<std::vector<std::string>> AsyncLineReader::read_many(std::vector<std::int64_t> lines,
                                                                 std::size_t batch_size) const {
  if (batch_size == 0) throw Error("batch_size must be > 0");
  check_source();

  const JsonlIndex* idx = &index_;
  std::vector<std::future<std::vector<std::string>>> parts;
  parts.reserve(lines.size() / batch_size + 1);
  for (std::size_t i = 0; i < lines.size(); i += batch_size) {
    const std::size_t j = std::min(lines.size(), i + batch_size);
    std::vector<std::int64_t> batch(lines.begin() + i, lines.begin() + j);
    parts.push_back(pool_.submit([idx, batch = std::move(batch)]{ return idx->read_many(batch); }));
  }

  // Deferred: gathers on the caller's thread, never blocks a worker.
  return std::async(std::launch::deferred, [parts = std::move(parts)]() mutable {
    std::vector<std::string> out;
    for (auto& f : parts) {
      auto part = f.get();
      for (auto& s : part) out.push_back(std::move(s));
    }
    return out;
  });
}

AsyncLineStream AsyncLineReader::stream(std::int64_t start, StreamOptions opts) const {
  if (opts.batch_size == 0) throw Error("batch_size must be > 0");
  check_source();

  if (start < 0) start = 0;
  const std::uint64_t first = static_cast<std::uint64_t>(start) + opts.skip;
  auto st = std::make_shared<AsyncLineStream::State>();
  st->batch_size = opts.batch_size;
  st->cursor = index_.iterate_from(static_cast<std::int64_t>(first), opts.limit);
  return AsyncLineStream(pool_, std::move(st));
}

}
