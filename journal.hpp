#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <variant>

#include <sqlite3.h>

#include "alarm_aggregator.hpp"

namespace mvs {

// ============================================================
// Journal: append-only SQLite record of what the process did.
// Writes happen on a background thread; callers only enqueue.
// A failed write is logged to stderr and dropped, and so is an
// event that finds the queue full.
// ============================================================
class Journal {
public:
  struct AuthEvent {
    int64_t ts_ms;
    std::string identity;
    std::string event;      // login, otp_sent, otp_verify, restore, logout
    bool ok;
    std::string detail;
  };

  struct CommandEvent {
    int64_t ts_ms;
    std::string installation;
    std::string command;    // arm_away, arm_home, arm_night, disarm
    bool ok;
    std::string detail;     // status token on failure
  };

  struct PanelEvent {
    int64_t ts_ms;
    std::string installation;
    std::string mode;
    uint32_t active_count;
    std::string summary;
  };

  using Event = std::variant<AuthEvent, CommandEvent, PanelEvent>;

  explicit Journal(size_t max_queue = 4096);
  ~Journal();

  Journal(const Journal&) = delete;
  Journal& operator=(const Journal&) = delete;

  // Open DB + create tables; schema_sql_file (optional) is applied on top.
  // throws std::runtime_error
  void start(const std::string& db_path, const std::string& schema_sql_file = "");

  // drains the queue, then closes the DB
  void stop();

  bool running() const { return running_; }
  uint64_t dropped() const { return dropped_; }

  // non-blocking; dropped when not running or the queue is full
  void enqueue(Event ev);

  void log_auth(std::string identity, std::string event, bool ok, std::string detail);
  void log_command(std::string installation, std::string command, bool ok, std::string detail);
  void log_panel(std::string installation, const PanelState& st);

private:
  void worker_main();
  void apply_schema_from_file(const std::string& path);
  void exec_sql(const std::string& sql);
  void prepare_statements();
  void finalize_statements();

  void handle(const AuthEvent& e);
  void handle(const CommandEvent& e);
  void handle(const PanelEvent& e);

  sqlite3* db_{nullptr};

  sqlite3_stmt* st_auth_{nullptr};
  sqlite3_stmt* st_command_{nullptr};
  sqlite3_stmt* st_panel_{nullptr};

  std::thread th_;
  std::mutex mu_;
  std::condition_variable cv_;
  std::deque<Event> q_;
  const size_t max_queue_;
  std::atomic<uint64_t> dropped_{0};
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
};

} // namespace mvs
