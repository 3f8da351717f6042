#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "seqbatch/Store.hh"
#include "seqbatch/Types.hh"
#include "seqbatch/Utils.hh"

namespace seqbatch {

/// Records kept as text, one per line: space separated source ids, a tab,
/// then space separated target ids. The target field is optional.
///
/// Held in memory when asked to, or when shuffling or longest-first
/// ordering needs it; otherwise every pass streams the file again.
class FlatFileStore : public Store {
 public:
  struct Config {
    // NOLINTBEGIN
    bool in_mem = false;
    bool shuffle = false;
    bool longest_first = false;
    LengthPolicy lengths;
    uint64_t seed = 0;
    // NOLINTEND
  };

  FlatFileStore(std::string path, const Config &config);

  size_t size() override { return size_; }
  std::unique_ptr<RecordStream> read() override;
  std::string path() const override { return path_; }

  bool in_mem() const { return mem_ != nullptr; }

  static void write_parallel(const SeqPairs &pairs, const std::string &path);
  static void write_mono(const std::vector<Words> &sequences,
                         const std::string &path);

 private:
  Records read_all() const;

  std::string path_;
  Config config_;
  Ptr<Records> mem_;
  size_t size_ = 0;
  size_t passes_ = 0;
  Rng rng_;
};

}  // namespace seqbatch
