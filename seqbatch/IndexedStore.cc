#include "seqbatch/IndexedStore.hh"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "seqbatch/Error.hh"
#include "seqbatch/Io.hh"
#include "seqbatch/Macros.hh"

namespace seqbatch {

namespace {

// clang-format off
constexpr const char *kTableStatement =
    "CREATE TABLE IF NOT EXISTS data ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " x BLOB NOT NULL,"
    " y BLOB,"
    " x_len INTEGER,"
    " y_len INTEGER)";
// clang-format on

constexpr const char *kInsertStatement =
    "INSERT INTO data (x, y, x_len, y_len) VALUES (?, ?, ?, ?)";

constexpr const char *kCountRows = "SELECT COUNT(*) FROM data";

// Bound on the number of ids in one `IN (...)` lookup, well under
// SQLITE_MAX_VARIABLE_NUMBER.
constexpr size_t kFetchChunk = 500;

// Target length, or source length where there is no target.
constexpr const char *kTargetLength =
    "(CASE WHEN y_len < 0 THEN x_len ELSE y_len END)";

std::string length_expression(Column column) {
  return column == Column::x_len ? "x_len" : kTargetLength;
}

std::string direction(Order order) {
  return order == Order::asc ? "ASC" : "DESC";
}

// sort_key = length + (random mod J); equal keys fall back to a fresh draw.
std::string jittered(Column column, Order order, size_t len_rand) {
  return length_expression(column) + " + (seqbatch_random() % " +
         std::to_string(len_rand) + ") " + direction(order) +
         ", seqbatch_random()";
}

Record decode(const Statement &row) {
  Record record;
  record.id = row.column_int64(0);
  View x = row.column_blob(1);
  record.x = io::decode_words(x.data, x.size);
  if (!row.column_null(2)) {
    View y = row.column_blob(2);
    record.y = io::decode_words(y.data, y.size);
  }
  return record;
}

class IndexedStream : public RecordStream {
 public:
  IndexedStream(Statement statement, const LengthPolicy &lengths,
                std::string path)
      : statement_(std::move(statement)),
        lengths_(lengths),
        path_(std::move(path)) {}

  std::optional<Record> next() override {
    // Stepping a finished statement would start the query over.
    if (done_) {
      return std::nullopt;
    }
    while (statement_.step()) {
      Record record = decode(statement_);
      if (record.x.empty() || (record.y && record.y->empty())) {
        LOG(warn, "Ignoring an empty record %ld x:%zu y:%zu",
            static_cast<long>(record.id), record.x_len(), record.y_len());
        continue;
      }
      if (!lengths_.admit(record.x, record.y)) {
        LOG(debug, "Skipping long record %ld x:%zu y:%zu",
            static_cast<long>(record.id), record.x_len(), record.y_len());
        ++skipped_;
        continue;
      }
      return record;
    }

    if (!reported_ && skipped_ > 0) {
      LOG(warn, "Skipped %zu records longer than (%zu, %zu) in %s", skipped_,
          lengths_.max_src_len, lengths_.max_tgt_len, path_.c_str());
    }
    reported_ = true;
    done_ = true;
    return std::nullopt;
  }

 private:
  Statement statement_;
  LengthPolicy lengths_;
  std::string path_;
  size_t skipped_ = 0;
  bool reported_ = false;
  bool done_ = false;
};

}  // namespace

std::string IndexedStore::make_query(const std::string &sort_by,
                                     size_t len_rand) {
  if (len_rand < 1) {
    throw UnsupportedStrategyError("len_rand must be >= 1, got " +
                                   std::to_string(len_rand));
  }

  const std::string select = "SELECT id, x, y FROM data ORDER BY ";
  if (sort_by == "random") {
    return select + "seqbatch_random()";
  }

  struct Ordering {
    const char *name;
    Column column;
    Order order;
  };

  // clang-format off
  static const Ordering orderings[] = {
    {"x_len_asc",         Column::x_len, Order::asc},
    {"x_len_desc",        Column::x_len, Order::desc},
    {"y_len_asc",         Column::y_len, Order::asc},
    {"y_len_desc",        Column::y_len, Order::desc},
    {"eq_len_rand_batch", Column::y_len, Order::desc},
  };
  // clang-format on

  for (const Ordering &ordering : orderings) {
    if (sort_by == ordering.name) {
      return select + jittered(ordering.column, ordering.order, len_rand);
    }
  }

  throw UnsupportedStrategyError(
      "Unknown sort_by=" + sort_by +
      "; expected one of random, x_len_asc, x_len_desc, y_len_asc, "
      "y_len_desc, eq_len_rand_batch");
}

IndexedStore::IndexedStore(const std::string &path, const Config &config)
    : config_(config),
      query_(make_query(config.sort_by, config.len_rand)),
      rng_(config.seed),
      db_(path, Database::Mode::read_only) {
  check_schema();
  db_.register_random(&rng_);
  LOG(info, "Opened %s sort_by=%s len_rand=%zu", path.c_str(),
      config_.sort_by.c_str(), config_.len_rand);
}

void IndexedStore::check_schema() {
  const std::set<std::string> expected = {"id", "x", "y", "x_len", "y_len"};
  std::set<std::string> found;
  Statement columns = db_.prepare("PRAGMA table_info(data)");
  while (columns.step()) {
    // Columns of table_info: cid, name, type, notnull, dflt_value, pk.
    found.insert(columns.column_text(1));
  }

  if (found.empty()) {
    throw SchemaError("No table `data` in " + db_.path());
  }

  for (const std::string &name : found) {
    if (expected.count(name) == 0) {
      throw SchemaError("Unexpected column `" + name + "` in " + db_.path());
    }
  }

  for (const std::string &name : expected) {
    if (found.count(name) == 0) {
      throw SchemaError("Missing column `" + name + "` in " + db_.path());
    }
  }
}

size_t IndexedStore::size() {
  return static_cast<size_t>(db_.query_int64(kCountRows));
}

std::unique_ptr<RecordStream> IndexedStore::read() {
  return std::make_unique<IndexedStream>(db_.prepare(query_), config_.lengths,
                                         db_.path());
}

std::vector<RecordStats> IndexedStore::stats(Column column, Order order) {
  std::string query = "SELECT id, x_len, y_len FROM data ORDER BY " +
                      jittered(column, order, config_.len_rand);
  Statement rows = db_.prepare(query);

  std::vector<RecordStats> stats;
  size_t skipped = 0;
  while (rows.step()) {
    RecordStats row{rows.column_int64(0), rows.column_int64(1),
                    rows.column_int64(2)};
    if (!config_.lengths.admit(row.x_len, row.y_len)) {
      ++skipped;
      continue;
    }
    stats.push_back(row);
  }

  if (skipped > 0) {
    LOG(warn, "Skipped %zu records longer than (%zu, %zu) in %s", skipped,
        config_.lengths.max_src_len, config_.lengths.max_tgt_len,
        db_.path().c_str());
  }
  LOG(debug, "Projection of %zu records sorted on %s %s", stats.size(),
      to_string(column).c_str(), to_string(order).c_str());
  return stats;
}

Records IndexedStore::fetch(const Ids &ids) {
  std::unordered_map<Id, Record> found;
  for (size_t begin = 0; begin < ids.size(); begin += kFetchChunk) {
    size_t end = std::min(ids.size(), begin + kFetchChunk);

    std::string query = "SELECT id, x, y FROM data WHERE id IN (";
    for (size_t i = begin; i < end; i++) {
      query += (i == begin) ? "?" : ", ?";
    }
    query += ")";

    Statement rows = db_.prepare(query);
    for (size_t i = begin; i < end; i++) {
      rows.bind(static_cast<int>(i - begin + 1), ids[i]);
    }

    while (rows.step()) {
      Record record = decode(rows);
      Id id = record.id;
      found.emplace(id, std::move(record));
    }
  }

  Records records;
  records.reserve(ids.size());
  for (Id id : ids) {
    auto it = found.find(id);
    if (it == found.end()) {
      throw MissingRecordError("No record with id " + std::to_string(id) +
                               " in " + db_.path());
    }
    Record record = it->second;
    if (config_.lengths.truncate) {
      config_.lengths.clip(record.x, record.y);
    }
    records.push_back(std::move(record));
  }
  return records;
}

void IndexedStore::write(const std::string &path, const SeqPairs &pairs) {
  if (std::filesystem::exists(path)) {
    LOG(warn, "Overwriting %s with new records", path.c_str());
  }

  std::string tmp = io::temporary_path(path);
  std::filesystem::remove(tmp);
  LOG(info, "Creating %s", tmp.c_str());

  try {
    {
      Database db(tmp, Database::Mode::create);
      db.execute(kTableStatement);

      Database::Transaction transaction(db);
      Statement insert = db.prepare(kInsertStatement);
      for (const auto &[x, y] : pairs) {
        insert.bind_blob(1, io::encode_words(x));
        if (y) {
          insert.bind_blob(2, io::encode_words(*y));
        } else {
          insert.bind_null(2);
        }
        insert.bind(3, static_cast<int64_t>(x.size()));
        insert.bind(4, y ? static_cast<int64_t>(y->size()) : -1);
        insert.step();
        insert.reset();
      }
      transaction.commit();
    }
    io::replace_file(tmp, path);
  } catch (const std::exception &e) {
    std::error_code ec;
    std::filesystem::remove(tmp, ec);
    LOG(error, "Failed building %s: %s", path.c_str(), e.what());
    throw;
  }

  LOG(info, "Stored %zu rows in %s", pairs.size(), path.c_str());
}

}  // namespace seqbatch
