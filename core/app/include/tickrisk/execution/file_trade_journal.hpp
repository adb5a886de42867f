#pragma once

#include "tickrisk/concurrent/thread_safe_queue.hpp"
#include "tickrisk/execution/i_trade_journal.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>

namespace tickrisk {

// -----------------------------------------------------------------------------
// FileTradeJournal — JSON-lines journal on local disk
// -----------------------------------------------------------------------------
//
// @details
// One JSON object per line:
//   {"op":"enq","trade":{...}}     see domain::toJson(QueuedTrade)
//   {"op":"done","id":"TRD-17"}
//
// replay() reads the whole file, skipping (and logging) malformed lines,
// then compacts it: the file is rewritten to hold only the surviving
// enqueue records, so it does not grow without bound across restarts.
//
// recordEnqueued() and recordFinished() only format the line and hand it to
// a writer thread, which appends and flushes in hand-off order. They are
// called under the trade queue's lock on the trigger path and never touch
// the file themselves. Records still in the hand-off queue when the process
// dies are lost; on restart that trade is either absent (enqueue lost) or
// replayed once more (finish lost), and closes are idempotent in the store.
//
// flush() blocks until every handed-off record is on disk. replay() flushes
// first. The destructor writes whatever is still queued, then joins.
//
// Thread model:
//   Any thread may record. File access is serialized on an internal mutex.
// -----------------------------------------------------------------------------
class FileTradeJournal final : public ITradeJournal {
 public:
  explicit FileTradeJournal(std::string path);

  ~FileTradeJournal() override;

  FileTradeJournal(const FileTradeJournal&) = delete;
  FileTradeJournal& operator=(const FileTradeJournal&) = delete;

  void recordEnqueued(const domain::QueuedTrade& trade) override;
  void recordFinished(const std::string& trade_id) override;
  std::vector<domain::QueuedTrade> replay() override;

  void flush();

 private:
  void submit(std::string line);
  void writerLoop();
  void appendLocked(const std::string& line);

  std::string path_;
  std::mutex mutex_;
  std::ofstream out_;

  ThreadSafeQueue<std::string> lines_;
  std::mutex progress_mutex_;
  std::condition_variable progress_cv_;
  std::uint64_t submitted_{0};
  std::uint64_t written_{0};

  std::atomic<bool> running_{true};
  std::thread writer_;
};

}  // namespace tickrisk
