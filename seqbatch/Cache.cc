#include "seqbatch/Cache.hh"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "seqbatch/Error.hh"
#include "seqbatch/Io.hh"
#include "seqbatch/Macros.hh"
#include "seqbatch/Utils.hh"

namespace seqbatch {

namespace {

constexpr const char *kMagic = "seqbatch-memdb";
constexpr uint64_t kSnapshotVersion = 1;

// Length of a record under column, with y_len falling back to x_len where
// there is no target.
int64_t sort_length(const RecordStats &stats, Column column) {
  if (column == Column::x_len || stats.y_len < 0) {
    return stats.x_len;
  }
  return stats.y_len;
}

}  // namespace

InMemoryCache::InMemoryCache(const Ptr<Store> &source,
                             const Observer &observer)
    : records_(std::make_shared<Records>()),
      source_path_(source->path()),
      projection_(source->supports_projection()) {
  LOG(info, "Loading %s to memory", source_path_.c_str());
  std::unique_ptr<RecordStream> stream = source->read();
  while (std::optional<Record> record = stream->next()) {
    records_->push_back(std::move(*record));
    if (observer && records_->size() % kObserveEvery == 0) {
      observer(records_->size(), max_rss_kb());
    }
  }
  if (observer) {
    observer(records_->size(), max_rss_kb());
  }
  index();
}

InMemoryCache::InMemoryCache(const Ptr<Store> &source, Records records)
    : records_(std::make_shared<Records>(std::move(records))),
      source_path_(source->path()),
      projection_(source->supports_projection()) {
  index();
}

void InMemoryCache::index() {
  positions_.reserve(records_->size());
  for (size_t i = 0; i < records_->size(); i++) {
    Id id = (*records_)[i].id;
    if (!positions_.emplace(id, i).second) {
      throw DuplicateIdError("Record with id " + std::to_string(id) +
                             " is a duplicate record in " + source_path_);
    }
  }
}

void InMemoryCache::log_progress(size_t count, size_t rss_kb) {
  LOG(info, "Records=%zu; max memory used=%s", count,
      format_kb(rss_kb).c_str());
}

std::unique_ptr<RecordStream> InMemoryCache::read() {
  return std::make_unique<MemoryStream>(records_);
}

std::vector<RecordStats> InMemoryCache::stats(Column column, Order order) {
  std::vector<RecordStats> stats;
  stats.reserve(records_->size());
  for (const Record &record : *records_) {
    auto x_len = static_cast<int64_t>(record.x_len());
    int64_t y_len = record.has_y() ? static_cast<int64_t>(record.y_len()) : -1;
    stats.push_back(RecordStats{record.id, x_len, y_len});
  }

  std::stable_sort(stats.begin(), stats.end(),
                   [column, order](const RecordStats &a, const RecordStats &b) {
                     int64_t lhs = sort_length(a, column);
                     int64_t rhs = sort_length(b, column);
                     return order == Order::asc ? lhs < rhs : lhs > rhs;
                   });
  return stats;
}

Records InMemoryCache::fetch(const Ids &ids) {
  Records records;
  records.reserve(ids.size());
  for (Id id : ids) {
    auto query = positions_.find(id);
    if (query == positions_.end()) {
      throw MissingRecordError("No record with id " + std::to_string(id) +
                               " in memory copy of " + source_path_);
    }
    records.push_back((*records_)[query->second]);
  }
  return records;
}

void InMemoryCache::save(const std::string &snapshot) const {
  LOG(info, "Saving in-memory records to %s", snapshot.c_str());
  std::string tmp = io::temporary_path(snapshot);
  {
    std::ofstream out(tmp, std::ios::binary);
    if (!out) {
      throw std::runtime_error("Failed to open file for writing: " + tmp);
    }

    io::BinaryWriter writer(out);
    writer.string(kMagic);
    writer.u64(kSnapshotVersion);
    writer.string(source_path_);
    writer.u64(records_->size());
    for (const Record &record : *records_) {
      writer.i64(record.id);
      writer.string(io::encode_words(record.x));
      writer.u64(record.has_y() ? 1 : 0);
      if (record.has_y()) {
        writer.string(io::encode_words(*record.y));
      }
    }

    out.close();
    if (!out) {
      std::error_code ec;
      std::filesystem::remove(tmp, ec);
      throw std::runtime_error("Failed writing " + tmp);
    }
  }
  io::replace_file(tmp, snapshot);
}

Ptr<InMemoryCache> InMemoryCache::load(const std::string &snapshot,
                                       const Ptr<Store> &source) {
  io::MmapFile file(snapshot);
  io::BinaryReader reader(file.data(), file.size());

  if (file.size() == 0 || reader.string() != kMagic) {
    LOG(warn, "%s is not a seqbatch snapshot; ignoring it", snapshot.c_str());
    return nullptr;
  }

  uint64_t version = reader.u64();
  if (version != kSnapshotVersion) {
    LOG(warn, "%s has format version %lu, expected %lu; ignoring it",
        snapshot.c_str(), static_cast<unsigned long>(version),
        static_cast<unsigned long>(kSnapshotVersion));
    return nullptr;
  }

  std::string_view recorded = reader.string();
  if (recorded != source->path()) {
    LOG(warn, "%s was made from %s, not %s; ignoring it", snapshot.c_str(),
        std::string(recorded).c_str(), source->path().c_str());
    return nullptr;
  }

  uint64_t count = reader.u64();
  Records records;
  for (uint64_t i = 0; i < count; i++) {
    Record record;
    record.id = reader.i64();
    std::string_view x = reader.string();
    record.x = io::decode_words(x.data(), x.size());
    if (reader.u64() != 0) {
      std::string_view y = reader.string();
      record.y = io::decode_words(y.data(), y.size());
    }
    records.push_back(std::move(record));
  }

  if (!reader.exhausted()) {
    throw MalformedRecordError("Trailing bytes in snapshot " + snapshot);
  }

  LOG(info, "Loaded %zu records from %s", records.size(), snapshot.c_str());
  return Ptr<InMemoryCache>(new InMemoryCache(source, std::move(records)));
}

Ptr<InMemoryCache> InMemoryCache::open(const Ptr<Store> &source) {
  std::string snapshot = snapshot_path(source->path());
  if (std::filesystem::exists(snapshot)) {
    LOG(info, "Loading from %s", snapshot.c_str());
    Ptr<InMemoryCache> cache = load(snapshot, source);
    if (cache) {
      return cache;
    }
  }

  auto cache = std::make_shared<InMemoryCache>(source);
  cache->save(snapshot);
  return cache;
}

std::string InMemoryCache::snapshot_path(const std::string &source_path) {
  std::filesystem::path path(source_path);
  path.replace_extension(".memdb.bin");
  return path.string();
}

}  // namespace seqbatch
