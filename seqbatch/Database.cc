#include "seqbatch/Database.hh"

#include <cstdint>
#include <stdexcept>
#include <string>

#include "seqbatch/Macros.hh"
#include "seqbatch/Utils.hh"

namespace seqbatch {

namespace {

void random_function(sqlite3_context *context, int /*argc*/,
                     sqlite3_value ** /*argv*/) {
  auto *rng = static_cast<Rng *>(sqlite3_user_data(context));
  // Non-negative, so `seqbatch_random() % J` lands in [0, J).
  auto value = static_cast<int64_t>(rng->next() >> 1);
  sqlite3_result_int64(context, value);
}

}  // namespace

Statement::Statement(sqlite3 *db, const std::string &sql) : db_(db) {
  int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()),
                              &stmt_, nullptr);
  if (rc != SQLITE_OK) {
    throw std::runtime_error("Failed to prepare [" + sql +
                             "]: " + sqlite3_errmsg(db_));
  }
}

Statement::~Statement() {
  if (stmt_ != nullptr) {
    sqlite3_finalize(stmt_);
  }
}

Statement::Statement(Statement &&from) noexcept
    : db_(from.db_), stmt_(from.stmt_) {
  from.db_ = nullptr;
  from.stmt_ = nullptr;
}

Statement &Statement::operator=(Statement &&from) noexcept {
  if (this != &from) {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
    }
    db_ = from.db_;
    stmt_ = from.stmt_;
    from.db_ = nullptr;
    from.stmt_ = nullptr;
  }
  return *this;
}

void Statement::check(int rc, const char *what) const {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db_));
  }
}

void Statement::bind(int index, int64_t value) {
  check(sqlite3_bind_int64(stmt_, index, value), "bind");
}

void Statement::bind_blob(int index, std::string_view blob) {
  check(sqlite3_bind_blob(stmt_, index, blob.data(),
                          static_cast<int>(blob.size()), SQLITE_TRANSIENT),
        "bind_blob");
}

void Statement::bind_null(int index) {
  check(sqlite3_bind_null(stmt_, index), "bind_null");
}

bool Statement::step() {
  int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc == SQLITE_DONE) {
    return false;
  }
  throw std::runtime_error(std::string("step: ") + sqlite3_errmsg(db_));
}

void Statement::reset() {
  check(sqlite3_reset(stmt_), "reset");
  check(sqlite3_clear_bindings(stmt_), "clear_bindings");
}

int64_t Statement::column_int64(int col) const {
  return sqlite3_column_int64(stmt_, col);
}

bool Statement::column_null(int col) const {
  return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

View Statement::column_blob(int col) const {
  // Pointer first, then size, as sqlite3 documents.
  const void *data = sqlite3_column_blob(stmt_, col);
  auto size = static_cast<size_t>(sqlite3_column_bytes(stmt_, col));
  return View{const_cast<void *>(data), size};  // NOLINT
}

std::string Statement::column_text(int col) const {
  const unsigned char *text = sqlite3_column_text(stmt_, col);
  if (text == nullptr) {
    return "";
  }
  return reinterpret_cast<const char *>(text);
}

Database::Database(const std::string &path, Mode mode) : path_(path) {
  int flags = (mode == Mode::read_only)
                  ? SQLITE_OPEN_READONLY
                  : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
  int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
  if (rc != SQLITE_OK) {
    std::string message =
        (db_ != nullptr) ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    close();
    throw std::runtime_error("Failed to open database " + path + ": " +
                             message);
  }
}

Database::~Database() { close(); }

Database::Database(Database &&from) noexcept
    : db_(from.db_), path_(std::move(from.path_)) {
  from.db_ = nullptr;
}

Database &Database::operator=(Database &&from) noexcept {
  if (this != &from) {
    close();
    db_ = from.db_;
    path_ = std::move(from.path_);
    from.db_ = nullptr;
  }
  return *this;
}

void Database::close() {
  if (db_ != nullptr) {
    sqlite3_close_v2(db_);
    db_ = nullptr;
  }
}

void Database::execute(const std::string &sql) {
  char *error = nullptr;
  int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error);
  if (rc != SQLITE_OK) {
    std::string message = (error != nullptr) ? error : sqlite3_errstr(rc);
    sqlite3_free(error);
    throw std::runtime_error("Failed to execute [" + sql + "] on " + path_ +
                             ": " + message);
  }
}

Statement Database::prepare(const std::string &sql) {
  return Statement(db_, sql);
}

int64_t Database::query_int64(const std::string &sql) {
  Statement statement = prepare(sql);
  if (!statement.step()) {
    throw std::runtime_error("Query [" + sql + "] returned no rows.");
  }
  return statement.column_int64(0);
}

void Database::register_random(Rng *rng) {
  int rc = sqlite3_create_function(db_, "seqbatch_random", 0, SQLITE_UTF8,
                                   rng, &random_function, nullptr, nullptr);
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string("Failed to register random: ") +
                             sqlite3_errmsg(db_));
  }
}

Database::Transaction::Transaction(Database &db) : db_(db) {
  db_.execute("BEGIN TRANSACTION");
}

Database::Transaction::~Transaction() {
  if (!done_) {
    char *error = nullptr;
    if (sqlite3_exec(db_.db_, "ROLLBACK", nullptr, nullptr, &error) !=
        SQLITE_OK) {
      LOG(warn, "Rollback on %s failed: %s", db_.path_.c_str(),
          error != nullptr ? error : "unknown error");
    }
    sqlite3_free(error);
  }
}

void Database::Transaction::commit() {
  db_.execute("COMMIT");
  done_ = true;
}

}  // namespace seqbatch
