#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "seqbatch/Types.hh"

namespace seqbatch {

/// Truncate-or-skip policy for over-long records, applied by stores as
/// records are read.
struct LengthPolicy {
  size_t max_src_len = 512;  // NOLINT
  size_t max_tgt_len = 512;  // NOLINT
  bool truncate = false;

  /// Truncates x and y in place, or returns false if the record is too long
  /// and has to be skipped.
  bool admit(Words &x, std::optional<Words> &y) const;

  /// Truncates x and y to the maximum lengths.
  void clip(Words &x, std::optional<Words> &y) const;

  /// Same decision on lengths alone. y_len < 0 means no target.
  bool admit(int64_t &x_len, int64_t &y_len) const;
};

/// One pass over the records of a Store. Pull records with next() until it
/// returns std::nullopt. A stream owns whatever handle it reads from (file,
/// statement) and releases it when destroyed, including when abandoned
/// half-way.
class RecordStream {
 public:
  virtual ~RecordStream() = default;
  virtual std::optional<Record> next() = 0;
};

/// Streams copies of records held in memory, shared with the owner so that
/// the owner may be reshuffled for the next pass without disturbing this one.
class MemoryStream : public RecordStream {
 public:
  explicit MemoryStream(Ptr<const Records> records)
      : records_(std::move(records)) {}

  std::optional<Record> next() override {
    if (position_ == records_->size()) {
      return std::nullopt;
    }
    return (*records_)[position_++];
  }

 private:
  Ptr<const Records> records_;
  size_t position_ = 0;
};

/// Source of Records addressable by id. Backends: FlatFileStore (tab
/// separated text), IndexedStore (SQLite) and InMemoryCache (wraps either).
///
/// Not thread-safe: a store, and the streams it hands out, belong to one
/// consumer.
class Store {
 public:
  virtual ~Store() = default;

  /// Number of records.
  virtual size_t size() = 0;

  /// Starts a full pass, in whatever order the backend is configured for.
  virtual std::unique_ptr<RecordStream> read() = 0;

  /// Whether stats() and fetch() are available. Equal-length randomized
  /// batching needs both.
  virtual bool supports_projection() const { return false; }

  /// Scalar projection (id, x_len, y_len) of every record, sorted on column.
  /// Length columns of records without a target sort by the source length.
  virtual std::vector<RecordStats> stats(Column column, Order order);

  /// Records for ids, in the order asked for. Throws MissingRecordError if
  /// any id is absent.
  virtual Records fetch(const Ids &ids);

  virtual std::string path() const = 0;
};

std::string to_string(Column column);
std::string to_string(Order order);

}  // namespace seqbatch
