#include "seqbatch/Batcher.hh"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "seqbatch/Cache.hh"
#include "seqbatch/Error.hh"
#include "seqbatch/FlatFileStore.hh"
#include "seqbatch/IndexedStore.hh"
#include "seqbatch/Macros.hh"

namespace seqbatch {

namespace {

bool ends_with(const std::string &value, const std::string &suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) ==
             0;
}

BatchOverflowError overflow(size_t max_tokens, int64_t x_len, int64_t y_len) {
  return BatchOverflowError("Unable to make a batch of " +
                            std::to_string(max_tokens) +
                            " toks with a seq of x_len:" +
                            std::to_string(x_len) +
                            " y_len:" + std::to_string(y_len));
}

// Running state of one batch under the token budget.
class Bucket {
 public:
  explicit Bucket(size_t max_tokens) : max_tokens_(max_tokens) {}

  bool admits(size_t length) const {
    return (count_ + 1) * std::max(max_length_, length) <= max_tokens_;
  }

  void add(size_t length) {
    ++count_;
    max_length_ = std::max(max_length_, length);
  }

  void clear() {
    count_ = 0;
    max_length_ = 0;
  }

 private:
  size_t max_tokens_;
  size_t count_ = 0;
  size_t max_length_ = 0;
};

class SequentialBatches : public BatchStream {
 public:
  SequentialBatches(Ptr<Store> store, size_t max_tokens,
                    const Alignment &alignment)
      : store_(std::move(store)),
        stream_(store_->read()),
        max_tokens_(max_tokens),
        bucket_(max_tokens),
        alignment_(alignment) {}

  std::optional<Batch> next() override {
    Records records;
    bucket_.clear();
    if (pending_) {
      bucket_.add(pending_->length());
      records.push_back(std::move(*pending_));
      pending_.reset();
    }

    while (!exhausted_) {
      std::optional<Record> record = stream_->next();
      if (!record) {
        exhausted_ = true;
        break;
      }
      if (record->x.empty() || (record->has_y() && record->y->empty())) {
        LOG(warn, "Skipping record %ld, either source or target is empty",
            static_cast<long>(record->id));
        continue;
      }

      size_t length = record->length();
      if (length > max_tokens_) {
        int64_t y_len =
            record->has_y() ? static_cast<int64_t>(record->y_len()) : -1;
        throw overflow(max_tokens_, static_cast<int64_t>(record->x_len()),
                       y_len);
      }

      if (bucket_.admits(length)) {
        bucket_.add(length);
        records.push_back(std::move(*record));
      } else {
        pending_ = std::move(record);
        return Batch(records, alignment_);
      }
    }

    if (records.empty()) {
      return std::nullopt;
    }
    LOG(debug, "Last batch, size=%zu", records.size());
    return Batch(records, alignment_);
  }

 private:
  // Declared before stream_: the stream reads through the store.
  Ptr<Store> store_;
  std::unique_ptr<RecordStream> stream_;
  size_t max_tokens_;
  Bucket bucket_;
  Alignment alignment_;
  std::optional<Record> pending_;
  bool exhausted_ = false;
};

class EqualLengthBatches : public BatchStream {
 public:
  EqualLengthBatches(Ptr<Store> store, size_t max_tokens,
                     const Alignment &alignment, Rng &rng)
      : store_(std::move(store)), alignment_(alignment) {
    std::vector<RecordStats> stats = store_->stats(Column::y_len, Order::desc);

    Bucket bucket(max_tokens);
    Ids ids;
    for (const RecordStats &row : stats) {
      if (row.empty()) {
        LOG(warn, "Skipping record %ld, either source or target is empty",
            static_cast<long>(row.id));
        continue;
      }

      size_t length = row.length();
      if (length > max_tokens) {
        throw overflow(max_tokens, row.x_len, row.y_len);
      }

      if (!bucket.admits(length)) {
        batches_.push_back(std::move(ids));
        ids.clear();
        bucket.clear();
      }
      bucket.add(length);
      ids.push_back(row.id);
    }

    if (!ids.empty()) {
      batches_.push_back(std::move(ids));
    }

    if (batches_.empty()) {
      throw EmptyDatasetError("Found no training data in " + store_->path());
    }

    LOG(info, "Length sorted random batches = %zu. Shuffling...",
        batches_.size());
    rng.shuffle(batches_);
  }

  std::optional<Batch> next() override {
    if (position_ == batches_.size()) {
      return std::nullopt;
    }
    Records records = store_->fetch(batches_[position_++]);
    return Batch(records, alignment_);
  }

 private:
  Ptr<Store> store_;
  Alignment alignment_;
  std::vector<Ids> batches_;
  size_t position_ = 0;
};

}  // namespace

Ptr<Store> BatchIterable::open(const std::string &path, const Config &config) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Training data does not exist: " + path);
  }

  Ptr<Store> store;
  if (ends_with(path, ".db")) {
    IndexedStore::Config indexed;
    indexed.sort_by = config.sort_by.empty() ? "random" : config.sort_by;
    indexed.len_rand = config.len_rand;
    indexed.lengths = config.lengths;
    indexed.seed = config.seed;
    store = std::make_shared<IndexedStore>(path, indexed);
  } else {
    if (!config.sort_by.empty()) {
      throw UnsupportedStrategyError("sort_by=" + config.sort_by +
                                     " is not supported for flat-file data " +
                                     path);
    }
    FlatFileStore::Config flat;
    flat.shuffle = config.shuffle;
    flat.lengths = config.lengths;
    flat.seed = config.seed;
    store = std::make_shared<FlatFileStore>(path, flat);
  }

  if (config.keep_in_mem) {
    store = InMemoryCache::open(store);
  }
  return store;
}

BatchIterable::BatchIterable(const std::string &path, const Config &config)
    : BatchIterable(open(path, config), config) {}

BatchIterable::BatchIterable(Ptr<Store> store, const Config &config)
    : store_(std::move(store)), config_(config), rng_(config.seed) {
  if (config_.max_tokens == 0) {
    throw BatchOverflowError("Token budget of a batch must be positive.");
  }
  if (eq_len_rand_batch() && !store_->supports_projection()) {
    throw UnsupportedStrategyError(std::string(kEqLenRandBatch) +
                                   " needs sorted projections, which " +
                                   store_->path() + " does not support.");
  }
  LOG(info, "Batch size = %zu toks, sort_by=%s", config_.max_tokens,
      config_.sort_by.empty() ? "<store>" : config_.sort_by.c_str());
}

std::unique_ptr<BatchStream> BatchIterable::pass() {
  if (eq_len_rand_batch()) {
    return std::make_unique<EqualLengthBatches>(store_, config_.max_tokens,
                                                config_.alignment, rng_);
  }
  return std::make_unique<SequentialBatches>(store_, config_.max_tokens,
                                             config_.alignment);
}

size_t BatchIterable::num_batches() {
  size_t items = num_items();
  return (items + config_.max_tokens - 1) / config_.max_tokens;
}

LoopingIterable::LoopingIterable(Ptr<BatchIterable> iterable, size_t total)
    : iterable_(std::move(iterable)), total_(total) {}

std::optional<Batch> LoopingIterable::next() {
  while (count_ < total_) {
    if (!pass_) {
      pass_ = iterable_->pass();
      in_pass_ = 0;
    }

    std::optional<Batch> batch = pass_->next();
    if (batch) {
      ++count_;
      ++in_pass_;
      if (count_ == total_) {
        pass_.reset();
      }
      return batch;
    }

    if (in_pass_ == 0) {
      throw EmptyDatasetError("A full pass over " + iterable_->store()->path() +
                              " produced no batches.");
    }
    pass_.reset();
  }
  return std::nullopt;
}

void LoopingIterable::reset() {
  pass_.reset();
  count_ = 0;
  in_pass_ = 0;
}

}  // namespace seqbatch
