#pragma once

#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace promptgate {

// Appends lines to a single file from a background thread. Producers never
// block: when the queue is full the line is dropped and counted.
class AsyncFileWriter {
 public:
  explicit AsyncFileWriter(std::filesystem::path path,
                           std::size_t max_queue_depth = 1024);
  ~AsyncFileWriter();

  AsyncFileWriter(const AsyncFileWriter&) = delete;
  AsyncFileWriter& operator=(const AsyncFileWriter&) = delete;

  // False when the file could not be opened for appending.
  bool IsOpen() const { return open_; }

  // Queues `line` (a trailing newline is added). Returns false when the
  // writer is stopped, closed or the queue is full.
  bool TryAppend(std::string line);

  // Blocks until every queued line has been written and flushed.
  void Flush();

  // Drains the queue and joins the worker. Idempotent.
  void Stop();

  std::uint64_t Dropped() const;
  std::uint64_t Written() const;

 private:
  void Worker();

  std::filesystem::path path_;
  std::ofstream out_;
  bool open_{false};
  std::thread worker_;
  std::queue<std::string> lines_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable drained_cv_;
  bool stop_{false};
  bool writing_{false};
  std::size_t max_queue_depth_;
  std::uint64_t dropped_{0};
  std::uint64_t written_{0};
};

}  // namespace promptgate
