#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "seqbatch/Store.hh"
#include "seqbatch/Types.hh"

namespace seqbatch {

/// Turns raw text corpora into integer sequences ready to be written as a
/// store. Lines are read on the calling thread; tokenization and the length
/// policy run on a pool of worker threads.
class Preprocessor {
 public:
  /// Must be safe to call from several threads at once.
  using Tokenizer = std::function<Words(std::string_view)>;

  using RawPair = std::pair<std::string, std::string>;

  struct Config {
    // NOLINTBEGIN
    size_t workers = 4;
    LengthPolicy lengths;
    // NOLINTEND

    template <class App>
    void setup_onto(App &app) {
      // clang-format off
      app.add_option("--workers", workers, "Number of tokenizer threads.");
      app.add_option("--max-src-len", lengths.max_src_len, "Longest source sequence kept.");
      app.add_option("--max-tgt-len", lengths.max_tgt_len, "Longest target sequence kept.");
      app.add_flag("--truncate", lengths.truncate, "Truncate long sequences instead of dropping them.");
      // clang-format on
    }
  };

  Preprocessor(Tokenizer source, Tokenizer target, const Config &config);

  /// Line pairs of two line-aligned files, stripped, with pairs having an
  /// empty side dropped. Throws CorpusMismatchError if the files differ in
  /// line count.
  static std::vector<RawPair> read_raw_parallel(const std::string &src_path,
                                                const std::string &tgt_path);

  /// Tokenized pairs, in input order, after the length policy.
  SeqPairs process(const std::string &src_path,
                   const std::string &tgt_path) const;

  /// Tokenized lines of a single corpus, using the source tokenizer and
  /// max_src_len.
  std::vector<Words> process_mono(const std::string &path) const;

  /// process() and write the result to out: an indexed store if out ends in
  /// .db, a flat file otherwise. Returns the number of records written.
  size_t prepare(const std::string &src_path, const std::string &tgt_path,
                 const std::string &out) const;

  /// process_mono() and write, as prepare().
  size_t prepare_mono(const std::string &path, const std::string &out) const;

  /// Tokenizer for text that is already space separated integer ids. Throws
  /// MalformedRecordError on anything else.
  static Tokenizer integers();

 private:
  Tokenizer source_;
  Tokenizer target_;
  Config config_;
};

}  // namespace seqbatch
