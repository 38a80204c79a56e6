#include "io/async_file_writer.h"

#include "server/logging/logger.h"

namespace promptgate {

AsyncFileWriter::AsyncFileWriter(std::filesystem::path path,
                                 std::size_t max_queue_depth)
    : path_(std::move(path)),
      max_queue_depth_(max_queue_depth == 0 ? 1 : max_queue_depth) {
  if (path_.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path_.parent_path(), ec);
  }
  out_.open(path_, std::ios::binary | std::ios::app);
  open_ = out_.good();
  if (!open_) {
    log::Warn("audit", "Unable to open log file for appending", path_.string());
    return;
  }
  worker_ = std::thread(&AsyncFileWriter::Worker, this);
}

AsyncFileWriter::~AsyncFileWriter() { Stop(); }

bool AsyncFileWriter::TryAppend(std::string line) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_ || stop_ || lines_.size() >= max_queue_depth_) {
      ++dropped_;
      return false;
    }
    lines_.push(std::move(line));
  }
  cv_.notify_one();
  return true;
}

void AsyncFileWriter::Flush() {
  std::unique_lock<std::mutex> lock(mutex_);
  drained_cv_.wait(lock, [&] { return !open_ || stop_ || (lines_.empty() && !writing_); });
}

void AsyncFileWriter::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
  drained_cv_.notify_all();
}

std::uint64_t AsyncFileWriter::Dropped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

std::uint64_t AsyncFileWriter::Written() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return written_;
}

void AsyncFileWriter::Worker() {
  while (true) {
    std::queue<std::string> batch;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [&] { return stop_ || !lines_.empty(); });
      if (stop_ && lines_.empty()) {
        return;
      }
      std::swap(batch, lines_);
      writing_ = true;
    }
    std::uint64_t count = 0;
    while (!batch.empty()) {
      out_ << batch.front() << '\n';
      batch.pop();
      ++count;
    }
    out_.flush();
    bool failed = !out_.good();
    if (failed) {
      out_.clear();
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      writing_ = false;
      if (failed) {
        dropped_ += count;
      } else {
        written_ += count;
      }
    }
    if (failed) {
      log::Warn("audit", "Write to log file failed", path_.string());
    }
    drained_cv_.notify_all();
  }
}

}  // namespace promptgate
