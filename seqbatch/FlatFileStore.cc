#include "seqbatch/FlatFileStore.hh"

#include <algorithm>
#include <fstream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "seqbatch/Error.hh"
#include "seqbatch/Io.hh"
#include "seqbatch/Macros.hh"

namespace seqbatch {

namespace {

class FileStream : public RecordStream {
 public:
  FileStream(const std::string &path, const LengthPolicy &lengths)
      : in_(path), path_(path), lengths_(lengths) {
    if (!in_) {
      throw std::runtime_error("Failed to open file: " + path);
    }
  }

  std::optional<Record> next() override {
    std::string line;
    while (std::getline(in_, line)) {
      Id id = line_number_++;
      std::optional<Record> record = parse(line, id);
      if (record) {
        return record;
      }
    }

    if (in_.bad()) {
      throw std::runtime_error("Failed reading " + path_);
    }

    if (!reported_ && skipped_ > 0) {
      LOG(warn, "Skipped %zu records longer than (%zu, %zu) in %s", skipped_,
          lengths_.max_src_len, lengths_.max_tgt_len, path_.c_str());
    }
    reported_ = true;
    return std::nullopt;
  }

 private:
  std::optional<Record> parse(std::string_view line, Id id) {
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }

    auto words = [&](std::string_view field) {
      Words parsed;
      if (!io::parse_words(field, parsed)) {
        throw MalformedRecordError(path_ + ":" + std::to_string(id + 1) +
                                   ": expected integer tokens");
      }
      return parsed;
    };

    size_t tab = line.find('\t');
    Words x = words(line.substr(0, tab));
    std::optional<Words> y;
    if (tab != std::string_view::npos) {
      std::string_view rest = line.substr(tab + 1);
      y = words(rest.substr(0, rest.find('\t')));
    }

    if (!lengths_.admit(x, y)) {
      LOG(debug, "Skipping long record %ld x:%zu y:%zu", static_cast<long>(id),
          x.size(), y ? y->size() : 0);
      ++skipped_;
      return std::nullopt;
    }

    if (x.empty() || (y && y->empty())) {
      LOG(warn, "Ignoring an empty record %ld x:%zu y:%zu",
          static_cast<long>(id), x.size(), y ? y->size() : 0);
      return std::nullopt;
    }

    Record record;
    record.id = id;
    record.x = std::move(x);
    record.y = std::move(y);
    return record;
  }

  std::ifstream in_;
  std::string path_;
  LengthPolicy lengths_;
  Id line_number_ = 0;
  size_t skipped_ = 0;
  bool reported_ = false;
};

std::string join(const Words &words) {
  std::string line;
  for (size_t i = 0; i < words.size(); i++) {
    if (i != 0) {
      line.push_back(' ');
    }
    line += std::to_string(words[i]);
  }
  return line;
}

template <class Emit>
void write_lines(const std::string &path, size_t count, Emit &&emit) {
  LOG(info, "Storing data at %s", path.c_str());
  std::string tmp = io::temporary_path(path);
  {
    std::ofstream out(tmp);
    if (!out) {
      throw std::runtime_error("Failed to open file for writing: " + tmp);
    }
    for (size_t i = 0; i < count; i++) {
      out << emit(i) << '\n';
    }
    out.close();
    if (!out) {
      throw std::runtime_error("Failed writing " + tmp);
    }
  }
  io::replace_file(tmp, path);
}

}  // namespace

FlatFileStore::FlatFileStore(std::string path, const Config &config)
    : path_(std::move(path)), config_(config), rng_(config.seed) {
  bool in_mem = config_.in_mem || config_.shuffle || config_.longest_first;
  if (in_mem) {
    mem_ = std::make_shared<Records>(read_all());
    size_ = mem_->size();
  } else {
    size_ = io::line_count(path_);
  }
}

Records FlatFileStore::read_all() const {
  FileStream stream(path_, config_.lengths);
  Records records;
  while (std::optional<Record> record = stream.next()) {
    records.push_back(std::move(*record));
  }
  return records;
}

std::unique_ptr<RecordStream> FlatFileStore::read() {
  if (!mem_) {
    ++passes_;
    return std::make_unique<FileStream>(path_, config_.lengths);
  }

  // A stream from the previous pass may still hold the list; reorder a copy.
  if (mem_.use_count() > 1 && (config_.shuffle || passes_ == 0)) {
    mem_ = std::make_shared<Records>(*mem_);
  }

  if (config_.shuffle) {
    if (passes_ == 0) {
      LOG(info, "Shuffling the data...");
    }
    rng_.shuffle(*mem_);
  }

  if (config_.longest_first && passes_ == 0 && !mem_->empty()) {
    LOG(info, "Sorting the dataset by length of target sequence");
    auto target_length = [](const Record &record) {
      return record.y ? record.y->size() : record.x.size();
    };
    std::stable_sort(mem_->begin(), mem_->end(),
                     [&](const Record &a, const Record &b) {
                       return target_length(a) > target_length(b);
                     });
    LOG(info, "Longest source seq length: %zu", mem_->front().x.size());
  }

  ++passes_;
  return std::make_unique<MemoryStream>(mem_);
}

void FlatFileStore::write_parallel(const SeqPairs &pairs,
                                   const std::string &path) {
  write_lines(path, pairs.size(), [&pairs](size_t i) {
    const auto &[x, y] = pairs[i];
    std::string line = join(x);
    if (y) {
      line.push_back('\t');
      line += join(*y);
    }
    return line;
  });
}

void FlatFileStore::write_mono(const std::vector<Words> &sequences,
                               const std::string &path) {
  write_lines(path, sequences.size(),
              [&sequences](size_t i) { return join(sequences[i]); });
}

}  // namespace seqbatch
