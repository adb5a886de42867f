#include "tickrisk/execution/file_trade_journal.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <unordered_map>
#include <utility>

namespace tickrisk {

FileTradeJournal::FileTradeJournal(std::string path) : path_(std::move(path)) {
  out_.open(path_, std::ios::app);
  if (!out_) {
    std::cerr << "[TradeJournal] ERROR: cannot open " << path_
              << " for append; queue is not durable.\n";
  }
  writer_ = std::thread([this] { writerLoop(); });
}

// -----------------------------------------------------------------------------
// Destructor: write what is queued, then join
// -----------------------------------------------------------------------------
FileTradeJournal::~FileTradeJournal() {
  running_.store(false);
  if (writer_.joinable()) {
    writer_.join();
  }
}

void FileTradeJournal::recordEnqueued(const domain::QueuedTrade& trade) {
  submit(nlohmann::json{{"op", "enq"}, {"trade", domain::toJson(trade)}}.dump());
}

void FileTradeJournal::recordFinished(const std::string& trade_id) {
  submit(nlohmann::json{{"op", "done"}, {"id", trade_id}}.dump());
}

void FileTradeJournal::flush() {
  std::unique_lock lock(progress_mutex_);
  progress_cv_.wait(lock, [this] { return written_ >= submitted_; });
}

void FileTradeJournal::submit(std::string line) {
  {
    std::lock_guard lock(progress_mutex_);
    ++submitted_;
  }
  lines_.push(std::move(line));
}

// -----------------------------------------------------------------------------
// writerLoop(): drain hand-offs to disk until stopped and empty
// -----------------------------------------------------------------------------
void FileTradeJournal::writerLoop() {
  while (running_.load() || !lines_.empty()) {
    auto line = lines_.pop_for(std::chrono::milliseconds(50));
    if (!line) {
      continue;
    }
    {
      std::lock_guard lock(mutex_);
      appendLocked(*line);
    }
    {
      std::lock_guard lock(progress_mutex_);
      ++written_;
    }
    progress_cv_.notify_all();
  }
}

void FileTradeJournal::appendLocked(const std::string& line) {
  if (!out_) {
    return;
  }
  out_ << line << '\n';
  out_.flush();
}

// -----------------------------------------------------------------------------
// replay(): fold the log into the pending set, then compact the file
// -----------------------------------------------------------------------------
std::vector<domain::QueuedTrade> FileTradeJournal::replay() {
  flush();
  std::lock_guard lock(mutex_);

  std::vector<std::string> order;
  std::unordered_map<std::string, domain::QueuedTrade> pending;

  std::ifstream in(path_);
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) {
      continue;
    }
    try {
      auto j = nlohmann::json::parse(line);
      const std::string op = j.at("op").get<std::string>();
      if (op == "enq") {
        auto trade = domain::queuedTradeFromJson(j.at("trade"));
        if (!trade) {
          std::cerr << "[TradeJournal] line " << line_no
                    << ": unknown trade action, skipped.\n";
          continue;
        }
        if (pending.count(trade->id) == 0) {
          order.push_back(trade->id);
        }
        pending[trade->id] = std::move(*trade);
      } else if (op == "done") {
        pending.erase(j.at("id").get<std::string>());
      }
    } catch (const nlohmann::json::exception& e) {
      std::cerr << "[TradeJournal] line " << line_no
                << ": malformed record skipped: " << e.what() << "\n";
    }
  }
  in.close();

  std::vector<domain::QueuedTrade> out;
  for (const auto& id : order) {
    auto it = pending.find(id);
    if (it != pending.end()) {
      out.push_back(std::move(it->second));
      pending.erase(it);
    }
  }

  out_.close();
  out_.open(path_, std::ios::trunc);
  for (const auto& trade : out) {
    appendLocked(nlohmann::json{{"op", "enq"}, {"trade", domain::toJson(trade)}}
                     .dump());
  }
  out_.close();
  out_.open(path_, std::ios::app);

  std::cout << "[TradeJournal] replayed " << out.size()
            << " pending trades from " << path_ << "\n";
  return out;
}

}  // namespace tickrisk
