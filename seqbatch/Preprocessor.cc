#include "seqbatch/Preprocessor.hh"

#include <algorithm>
#include <exception>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "seqbatch/Error.hh"
#include "seqbatch/FlatFileStore.hh"
#include "seqbatch/IndexedStore.hh"
#include "seqbatch/Io.hh"
#include "seqbatch/Macros.hh"
#include "seqbatch/Utils.hh"

namespace seqbatch {

namespace {

std::vector<std::string> read_lines(const std::string &path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(std::move(line));
  }
  if (in.bad()) {
    throw std::runtime_error("Failed reading " + path);
  }
  return lines;
}

// Applies fn to every input on `workers` threads, each taking a contiguous
// slice, so outputs[i] corresponds to inputs[i]. The first exception thrown
// by any worker is rethrown here once all have joined.
template <class Input, class Output, class Fn>
std::vector<Output> parallel_map(const std::vector<Input> &inputs,
                                 size_t workers, Fn fn) {
  std::vector<Output> outputs(inputs.size());
  workers = std::max<size_t>(1, std::min(workers, inputs.size()));
  size_t slice = (inputs.size() + workers - 1) / std::max<size_t>(1, workers);

  std::vector<std::exception_ptr> errors(workers);
  std::vector<std::thread> threads;
  threads.reserve(workers);
  auto join = [&threads]() {
    for (std::thread &thread : threads) {
      if (thread.joinable()) {
        thread.join();
      }
    }
  };

  try {
    for (size_t w = 0; w < workers; w++) {
      size_t begin = w * slice;
      size_t end = std::min(inputs.size(), begin + slice);
      threads.emplace_back([&, w, begin, end]() {
        try {
          for (size_t i = begin; i < end; i++) {
            outputs[i] = fn(inputs[i]);
          }
        } catch (...) {
          errors[w] = std::current_exception();
        }
      });
    }
  } catch (const std::system_error &) {
    // Workers already started still reference outputs.
    join();
    throw;
  }

  join();

  for (const std::exception_ptr &error : errors) {
    if (error) {
      std::rethrow_exception(error);
    }
  }
  return outputs;
}

template <class Output>
std::vector<Output> compact(std::vector<std::optional<Output>> &results) {
  std::vector<Output> kept;
  kept.reserve(results.size());
  for (std::optional<Output> &result : results) {
    if (result) {
      kept.push_back(std::move(*result));
    }
  }
  return kept;
}

bool ends_with_db(const std::string &path) {
  const std::string suffix = ".db";
  return path.size() >= suffix.size() &&
         path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

Preprocessor::Preprocessor(Tokenizer source, Tokenizer target,
                           const Config &config)
    : source_(std::move(source)),
      target_(std::move(target)),
      config_(config) {}

std::vector<Preprocessor::RawPair> Preprocessor::read_raw_parallel(
    const std::string &src_path, const std::string &tgt_path) {
  std::vector<std::string> sources = read_lines(src_path);
  std::vector<std::string> targets = read_lines(tgt_path);
  if (sources.size() != targets.size()) {
    throw CorpusMismatchError(src_path + " has " +
                              std::to_string(sources.size()) + " lines but " +
                              tgt_path + " has " +
                              std::to_string(targets.size()));
  }

  std::vector<RawPair> pairs;
  pairs.reserve(sources.size());
  for (size_t i = 0; i < sources.size(); i++) {
    std::string_view src = io::strip(sources[i]);
    std::string_view tgt = io::strip(targets[i]);
    if (!src.empty() && !tgt.empty()) {
      pairs.emplace_back(std::string(src), std::string(tgt));
    }
  }
  return pairs;
}

SeqPairs Preprocessor::process(const std::string &src_path,
                               const std::string &tgt_path) const {
  std::vector<RawPair> raw = read_raw_parallel(src_path, tgt_path);
  LOG(info, "Processing %zu parallel lines using %zu workers", raw.size(),
      config_.workers);

  Timer timer;
  const LengthPolicy &lengths = config_.lengths;
  auto task = [this, &lengths](const RawPair &pair) -> std::optional<SeqPair> {
    Words x = source_(pair.first);
    std::optional<Words> y = target_(pair.second);
    if (!lengths.admit(x, y) || x.empty() || y->empty()) {
      return std::nullopt;
    }
    return SeqPair(std::move(x), std::move(y));
  };

  auto results = parallel_map<RawPair, std::optional<SeqPair>>(
      raw, config_.workers, task);
  SeqPairs pairs = compact(results);
  LOG(info, "Kept %zu of %zu pairs in %.2lfs", pairs.size(), raw.size(),
      timer.elapsed());
  return pairs;
}

std::vector<Words> Preprocessor::process_mono(const std::string &path) const {
  std::vector<std::string> raw;
  for (std::string &line : read_lines(path)) {
    std::string_view stripped = io::strip(line);
    if (!stripped.empty()) {
      raw.emplace_back(stripped);
    }
  }
  LOG(info, "Processing %zu lines using %zu workers", raw.size(),
      config_.workers);

  const LengthPolicy &lengths = config_.lengths;
  auto task = [this, &lengths](const std::string &line) -> std::optional<Words> {
    Words x = source_(line);
    std::optional<Words> none;
    if (!lengths.admit(x, none) || x.empty()) {
      return std::nullopt;
    }
    return x;
  };

  auto results = parallel_map<std::string, std::optional<Words>>(
      raw, config_.workers, task);
  return compact(results);
}

size_t Preprocessor::prepare(const std::string &src_path,
                             const std::string &tgt_path,
                             const std::string &out) const {
  SeqPairs pairs = process(src_path, tgt_path);
  if (ends_with_db(out)) {
    IndexedStore::write(out, pairs);
  } else {
    FlatFileStore::write_parallel(pairs, out);
  }
  return pairs.size();
}

size_t Preprocessor::prepare_mono(const std::string &path,
                                  const std::string &out) const {
  std::vector<Words> sequences = process_mono(path);
  if (ends_with_db(out)) {
    SeqPairs pairs;
    pairs.reserve(sequences.size());
    for (Words &sequence : sequences) {
      pairs.emplace_back(std::move(sequence), std::nullopt);
    }
    IndexedStore::write(out, pairs);
    return pairs.size();
  }
  FlatFileStore::write_mono(sequences, out);
  return sequences.size();
}

Preprocessor::Tokenizer Preprocessor::integers() {
  return [](std::string_view line) {
    Words words;
    if (!io::parse_words(line, words)) {
      throw MalformedRecordError("Expected integer tokens, found: " +
                                 std::string(line));
    }
    return words;
  };
}

}  // namespace seqbatch
