#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "seqbatch/Database.hh"
#include "seqbatch/Store.hh"
#include "seqbatch/Types.hh"
#include "seqbatch/Utils.hh"

namespace seqbatch {

/// Records in a single SQLite table:
///
///   data(id INTEGER PRIMARY KEY AUTOINCREMENT, x BLOB NOT NULL, y BLOB,
///        x_len INTEGER, y_len INTEGER)
///
/// x and y are sequence blobs (see io::encode_words), y_len is -1 where y is
/// absent. Written once by write(), then only read.
class IndexedStore : public Store {
 public:
  struct Config {
    // NOLINTBEGIN
    // random, x_len_asc, x_len_desc, y_len_asc, y_len_desc, eq_len_rand_batch
    std::string sort_by = "random";
    size_t len_rand = 2;
    LengthPolicy lengths;
    uint64_t seed = 0;
    // NOLINTEND
  };

  IndexedStore(const std::string &path, const Config &config);

  IndexedStore(const IndexedStore &) = delete;
  IndexedStore &operator=(const IndexedStore &) = delete;

  size_t size() override;
  std::unique_ptr<RecordStream> read() override;
  bool supports_projection() const override { return true; }
  std::vector<RecordStats> stats(Column column, Order order) override;
  Records fetch(const Ids &ids) override;
  std::string path() const override { return db_.path(); }

  /// SELECT for a named ordering. Throws UnsupportedStrategyError for an
  /// unknown name or len_rand < 1.
  static std::string make_query(const std::string &sort_by, size_t len_rand);

  /// Builds a store at path from pairs, replacing whatever is there.
  static void write(const std::string &path, const SeqPairs &pairs);

 private:
  void check_schema();

  Config config_;
  std::string query_;
  // Declared before db_: the connection calls into it until closed.
  Rng rng_;
  Database db_;
};

}  // namespace seqbatch
