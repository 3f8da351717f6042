#pragma once
#include <sqlite3.h>

#include <cstdint>
#include <string>
#include <string_view>

#include "seqbatch/Types.hh"

namespace seqbatch {

class Rng;

/// Prepared statement. Finalized on destruction, so a half-consumed query
/// releases its cursor however the caller leaves.
class Statement {
 public:
  Statement(sqlite3 *db, const std::string &sql);
  ~Statement();

  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  Statement(Statement &&from) noexcept;
  Statement &operator=(Statement &&from) noexcept;

  // Parameter indices start at 1, as in sqlite3_bind_*.
  void bind(int index, int64_t value);
  void bind_blob(int index, std::string_view blob);
  void bind_null(int index);

  /// Advances to the next row. Returns false when done, throws on error.
  bool step();
  void reset();

  int64_t column_int64(int col) const;
  bool column_null(int col) const;
  View column_blob(int col) const;
  std::string column_text(int col) const;

 private:
  void check(int rc, const char *what) const;

  sqlite3 *db_ = nullptr;
  sqlite3_stmt *stmt_ = nullptr;
};

/// Owning handle on a SQLite database file.
class Database {
 public:
  enum class Mode {
    read_only,  //
    create      //
  };

  Database(const std::string &path, Mode mode);
  ~Database();

  Database(const Database &) = delete;
  Database &operator=(const Database &) = delete;

  Database(Database &&from) noexcept;
  Database &operator=(Database &&from) noexcept;

  void execute(const std::string &sql);
  Statement prepare(const std::string &sql);

  /// First column of the first row, as an integer.
  int64_t query_int64(const std::string &sql);

  /// Makes seqbatch_random() available to SQL, drawing from rng. rng must
  /// outlive this connection.
  void register_random(Rng *rng);

  const std::string &path() const { return path_; }

  /// Rolls back on destruction unless committed.
  class Transaction {
   public:
    explicit Transaction(Database &db);
    ~Transaction();

    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;

    void commit();

   private:
    Database &db_;
    bool done_ = false;
  };

 private:
  void close();

  sqlite3 *db_ = nullptr;
  std::string path_;
};

}  // namespace seqbatch
