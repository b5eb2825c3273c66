#include "journal.hpp"
#include "session.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace mvs {

static const char* kSchema =
  "CREATE TABLE IF NOT EXISTS auth_events("
  "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
  "  ts_ms INTEGER NOT NULL,"
  "  identity TEXT NOT NULL,"
  "  event TEXT NOT NULL,"
  "  ok INTEGER NOT NULL,"
  "  detail TEXT);"
  "CREATE TABLE IF NOT EXISTS commands("
  "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
  "  ts_ms INTEGER NOT NULL,"
  "  installation TEXT NOT NULL,"
  "  command TEXT NOT NULL,"
  "  ok INTEGER NOT NULL,"
  "  detail TEXT);"
  "CREATE TABLE IF NOT EXISTS panel_states("
  "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
  "  ts_ms INTEGER NOT NULL,"
  "  installation TEXT NOT NULL,"
  "  mode TEXT NOT NULL,"
  "  active_count INTEGER NOT NULL,"
  "  summary TEXT NOT NULL);";

static void check_sqlite(int rc, sqlite3* db, const char* what) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return;
  std::string msg = what;
  msg += ": ";
  msg += (db ? sqlite3_errmsg(db) : "unknown");
  throw std::runtime_error(msg);
}

Journal::Journal(size_t max_queue) : max_queue_(max_queue) {}

Journal::~Journal() {
  stop();
}

void Journal::start(const std::string& db_path, const std::string& schema_sql_file) {
  if (running_) return;

  int rc = sqlite3_open(db_path.c_str(), &db_);
  if (rc != SQLITE_OK) {
    std::string msg = "sqlite3_open failed: ";
    msg += sqlite3_errmsg(db_);
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  try {
    exec_sql("PRAGMA journal_mode = WAL;");
    exec_sql("PRAGMA synchronous = NORMAL;");
    exec_sql(kSchema);

    if (!schema_sql_file.empty()) {
      apply_schema_from_file(schema_sql_file);
    }

    prepare_statements();
  } catch (const std::exception&) {
    finalize_statements();
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }

  stop_requested_ = false;
  running_ = true;
  th_ = std::thread([this]{ worker_main(); });
  std::cout << "[JOURNAL] writing to " << db_path << "\n";
}

void Journal::stop() {
  if (!running_) return;

  {
    std::lock_guard<std::mutex> lk(mu_);
    stop_requested_ = true;
  }
  cv_.notify_all();

  if (th_.joinable()) th_.join();
  running_ = false;

  finalize_statements();

  if (db_) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

void Journal::enqueue(Event ev) {
  if (!running_) return;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (q_.size() >= max_queue_) {
      if (dropped_++ == 0) std::cerr << "[JOURNAL] queue full, dropping events\n";
      return;
    }
    q_.push_back(std::move(ev));
  }
  cv_.notify_one();
}

void Journal::log_auth(std::string identity, std::string event, bool ok, std::string detail) {
  AuthEvent e{ now_ms_utc(), std::move(identity), std::move(event), ok, std::move(detail) };
  enqueue(std::move(e));
}

void Journal::log_command(std::string installation, std::string command, bool ok, std::string detail) {
  CommandEvent e{ now_ms_utc(), std::move(installation), std::move(command), ok, std::move(detail) };
  enqueue(std::move(e));
}

void Journal::log_panel(std::string installation, const PanelState& st) {
  PanelEvent e;
  e.ts_ms = now_ms_utc();
  e.installation = std::move(installation);
  e.mode = to_string(st.mode);
  e.active_count = static_cast<uint32_t>(st.active_count);
  e.summary = st.summary();
  enqueue(std::move(e));
}

void Journal::apply_schema_from_file(const std::string& path) {
  std::ifstream f(path);
  if (!f) throw std::runtime_error("cannot open schema file: " + path);
  std::stringstream ss;
  ss << f.rdbuf();
  exec_sql(ss.str());
}

void Journal::exec_sql(const std::string& sql) {
  char* err = nullptr;
  int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = "sqlite3_exec failed: ";
    msg += (err ? err : "unknown");
    if (err) sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

void Journal::prepare_statements() {
  check_sqlite(sqlite3_prepare_v2(db_,
    "INSERT INTO auth_events(ts_ms, identity, event, ok, detail) VALUES(?,?,?,?,?);",
    -1, &st_auth_, nullptr), db_, "prepare auth_events");

  check_sqlite(sqlite3_prepare_v2(db_,
    "INSERT INTO commands(ts_ms, installation, command, ok, detail) VALUES(?,?,?,?,?);",
    -1, &st_command_, nullptr), db_, "prepare commands");

  check_sqlite(sqlite3_prepare_v2(db_,
    "INSERT INTO panel_states(ts_ms, installation, mode, active_count, summary) VALUES(?,?,?,?,?);",
    -1, &st_panel_, nullptr), db_, "prepare panel_states");
}

void Journal::finalize_statements() {
  auto fin = [](sqlite3_stmt*& st){ if(st){ sqlite3_finalize(st); st=nullptr; } };
  fin(st_auth_);
  fin(st_command_);
  fin(st_panel_);
}

void Journal::worker_main() {
  while (true) {
    Event ev;

    {
      std::unique_lock<std::mutex> lk(mu_);
      cv_.wait(lk, [&]{ return stop_requested_ || !q_.empty(); });

      if (stop_requested_ && q_.empty())
        break;

      ev = std::move(q_.front());
      q_.pop_front();
    }

    try {
      std::visit([this](auto&& x){ handle(x); }, ev);
    } catch (const std::exception& e) {
      std::cerr << "[JOURNAL] write failed: " << e.what() << "\n";
    }
  }
}

static void reset_and_clear(sqlite3_stmt* st) {
  sqlite3_reset(st);
  sqlite3_clear_bindings(st);
}

void Journal::handle(const AuthEvent& e) {
  reset_and_clear(st_auth_);
  sqlite3_bind_int64(st_auth_, 1, e.ts_ms);
  sqlite3_bind_text(st_auth_, 2, e.identity.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st_auth_, 3, e.event.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int(st_auth_, 4, e.ok ? 1 : 0);
  sqlite3_bind_text(st_auth_, 5, e.detail.c_str(), -1, SQLITE_TRANSIENT);
  check_sqlite(sqlite3_step(st_auth_), db_, "step auth_events");
}

void Journal::handle(const CommandEvent& e) {
  reset_and_clear(st_command_);
  sqlite3_bind_int64(st_command_, 1, e.ts_ms);
  sqlite3_bind_text(st_command_, 2, e.installation.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st_command_, 3, e.command.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int(st_command_, 4, e.ok ? 1 : 0);
  sqlite3_bind_text(st_command_, 5, e.detail.c_str(), -1, SQLITE_TRANSIENT);
  check_sqlite(sqlite3_step(st_command_), db_, "step commands");
}

void Journal::handle(const PanelEvent& e) {
  reset_and_clear(st_panel_);
  sqlite3_bind_int64(st_panel_, 1, e.ts_ms);
  sqlite3_bind_text(st_panel_, 2, e.installation.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st_panel_, 3, e.mode.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int(st_panel_, 4, (int)e.active_count);
  sqlite3_bind_text(st_panel_, 5, e.summary.c_str(), -1, SQLITE_TRANSIENT);
  check_sqlite(sqlite3_step(st_panel_), db_, "step panel_states");
}

} // namespace mvs
