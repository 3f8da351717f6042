#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "seqbatch/Batch.hh"
#include "seqbatch/Store.hh"
#include "seqbatch/Types.hh"
#include "seqbatch/Utils.hh"

namespace seqbatch {

/// One pass worth of batches. Pull with next() until std::nullopt.
class BatchStream {
 public:
  virtual ~BatchStream() = default;
  virtual std::optional<Batch> next() = 0;
};

/// Groups the records of a Store into batches of at most max_tokens padded
/// tokens: a batch of n records whose longest side is L holds n * L <=
/// max_tokens.
///
/// Two strategies:
///
/// * sequential (default): records in store order, a batch is closed as soon
///   as the next record does not fit.
/// * eq_len_rand_batch: batches are formed over the (id, x_len, y_len)
///   projection sorted by length, then visited in random order and filled
///   in from the store by id. Needs a store that supports projections.
///
/// Not thread-safe.
class BatchIterable {
 public:
  struct Config {
    // NOLINTBEGIN
    size_t max_tokens = 4096;
    // Ordering of the indexed store, or eq_len_rand_batch. Empty keeps the
    // store's own order.
    std::string sort_by;
    size_t len_rand = 2;
    bool shuffle = false;
    bool keep_in_mem = false;
    LengthPolicy lengths;
    Alignment alignment;
    uint64_t seed = 0;
    // NOLINTEND

    template <class App>
    void setup_onto(App &app) {
      // clang-format off
      app.add_option("--max-tokens", max_tokens, "Token budget of a batch, padding included.");
      app.add_option("--sort-by", sort_by, "random, x_len_asc, x_len_desc, y_len_asc, y_len_desc or eq_len_rand_batch (.db only).");
      app.add_option("--len-rand", len_rand, "Length jitter of sorted orders, >= 1.");
      app.add_flag("--shuffle", shuffle, "Shuffle flat-file records between passes.");
      app.add_flag("--keep-in-mem", keep_in_mem, "Hold all records in memory, with a snapshot beside the data.");
      app.add_option("--max-src-len", lengths.max_src_len, "Longest source sequence kept.");
      app.add_option("--max-tgt-len", lengths.max_tgt_len, "Longest target sequence kept.");
      app.add_flag("--truncate", lengths.truncate, "Truncate long sequences instead of skipping them.");
      app.add_option("--seed", seed, "Seed for shuffling and length jitter.");
      alignment.setup_onto(app);
      // clang-format on
    }
  };

  constexpr static const char *kEqLenRandBatch = "eq_len_rand_batch";

  /// Opens path as an indexed store if it ends in .db, as a flat file
  /// otherwise.
  BatchIterable(const std::string &path, const Config &config);

  /// Batches over an already opened store.
  BatchIterable(Ptr<Store> store, const Config &config);

  /// Starts a pass. Every pass re-reads the store, so shuffled or jittered
  /// stores give a different order each time.
  std::unique_ptr<BatchStream> pass();

  size_t num_items() { return store_->size(); }

  /// Estimate, ceil(num_items / max_tokens).
  size_t num_batches();

  const Ptr<Store> &store() const { return store_; }
  const Config &config() const { return config_; }

  /// Store for path under config, wrapped in an InMemoryCache if
  /// config.keep_in_mem. Throws std::runtime_error if path does not exist.
  static Ptr<Store> open(const std::string &path, const Config &config);

 private:
  bool eq_len_rand_batch() const { return config_.sort_by == kEqLenRandBatch; }

  Ptr<Store> store_;
  Config config_;
  Rng rng_;
};

/// Replays passes of a BatchIterable until total batches have been handed
/// out, starting a new pass whenever one runs out. Stops at total even in the
/// middle of a pass.
class LoopingIterable {
 public:
  LoopingIterable(Ptr<BatchIterable> iterable, size_t total);

  /// Next batch, or std::nullopt once total batches were produced. Throws
  /// EmptyDatasetError if a whole pass yields nothing.
  std::optional<Batch> next();

  size_t count() const { return count_; }
  size_t total() const { return total_; }

  /// Back to zero batches produced; the pass in progress is dropped.
  void reset();

 private:
  Ptr<BatchIterable> iterable_;
  std::unique_ptr<BatchStream> pass_;
  size_t total_;
  size_t count_ = 0;
  size_t in_pass_ = 0;
};

}  // namespace seqbatch
