#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "seqbatch/Store.hh"
#include "seqbatch/Types.hh"

namespace seqbatch {

/// Every record of another Store, held in memory with an id -> position
/// index. Built once per session from a full pass over the wrapped store, or
/// restored from a snapshot written by an earlier session.
///
/// Snapshots are keyed by the source path only. A snapshot that is older
/// than its source is not detected.
class InMemoryCache : public Store {
 public:
  /// Called while materializing, with the number of records so far and the
  /// peak resident memory in kilobytes.
  using Observer = std::function<void(size_t count, size_t rss_kb)>;

  // Records between two observer calls.
  constexpr static size_t kObserveEvery = 100000;

  explicit InMemoryCache(const Ptr<Store> &source,
                         const Observer &observer = log_progress);

  size_t size() override { return records_->size(); }
  std::unique_ptr<RecordStream> read() override;
  bool supports_projection() const override { return projection_; }
  std::vector<RecordStats> stats(Column column, Order order) override;
  Records fetch(const Ids &ids) override;
  std::string path() const override { return source_path_; }

  const Records &records() const { return *records_; }

  void save(const std::string &snapshot) const;

  /// Restores a snapshot of source, or returns nullptr if the file at
  /// snapshot is from a different source or format version. Throws
  /// MalformedRecordError on a truncated or corrupt file.
  static Ptr<InMemoryCache> load(const std::string &snapshot,
                                 const Ptr<Store> &source);

  /// load() if a usable snapshot exists beside the source, otherwise
  /// materializes source and saves the snapshot.
  static Ptr<InMemoryCache> open(const Ptr<Store> &source);

  /// <dir>/<stem>.memdb.bin for a source at <dir>/<stem>.<ext>.
  static std::string snapshot_path(const std::string &source_path);

  static void log_progress(size_t count, size_t rss_kb);

 private:
  InMemoryCache(const Ptr<Store> &source, Records records);
  void index();

  Ptr<Records> records_;
  std::unordered_map<Id, size_t> positions_;
  std::string source_path_;
  bool projection_ = false;
};

}  // namespace seqbatch
