#pragma once
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "seqbatch/seqbatch.hh"

#define SEQBATCH_CHECK(condition)                                             \
  do {                                                                        \
    if (!(condition)) {                                                       \
      fprintf(stderr, "%s:%d %s failed\n", __FILE__, __LINE__, (#condition)); \
      throw std::runtime_error("Failed test");                                \
    }                                                                         \
    fprintf(stderr, "%s:%d %s success\n", __FILE__, __LINE__, (#condition));  \
  } while (0)

#define SEQBATCH_CHECK_THROWS(statement, Exception)                         \
  do {                                                                      \
    bool thrown = false;                                                    \
    try {                                                                   \
      statement;                                                            \
    } catch (const Exception &e) {                                          \
      thrown = true;                                                        \
      fprintf(stderr, "%s:%d %s threw %s: %s\n", __FILE__, __LINE__,        \
              (#statement), (#Exception), e.what());                        \
    }                                                                       \
    if (!thrown) {                                                          \
      fprintf(stderr, "%s:%d %s did not throw %s\n", __FILE__, __LINE__,    \
              (#statement), (#Exception));                                  \
      throw std::runtime_error("Failed test");                              \
    }                                                                       \
  } while (0)

namespace seqbatch::test {

/// Scratch directory, removed with everything in it on destruction.
class TempDir {
 public:
  TempDir() {
    std::string pattern =
        (std::filesystem::temp_directory_path() / "seqbatch-XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (mkdtemp(buffer.data()) == nullptr) {
      throw std::runtime_error("Failed to create a temporary directory");
    }
    root_ = buffer.data();
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  std::string path(const std::string &name) const {
    return (std::filesystem::path(root_) / name).string();
  }

 private:
  std::string root_;
};

inline void write_text(const std::string &path, const std::string &content) {
  std::ofstream out(path);
  out << content;
  if (!out) {
    throw std::runtime_error("Failed writing " + path);
  }
}

inline Record make_record(Id id, Words x, std::optional<Words> y) {
  Record record;
  record.id = id;
  record.x = std::move(x);
  record.y = std::move(y);
  return record;
}

// Sequence of length n, every token set to token.
inline Words fill(size_t n, Word token = 7) {  // NOLINT
  return Words(n, token);
}

/// Store over a fixed list of records, in list order.
class VectorStore : public Store {
 public:
  explicit VectorStore(Records records, std::string path = "<memory>")
      : records_(std::make_shared<Records>(std::move(records))),
        path_(std::move(path)) {}

  size_t size() override { return records_->size(); }
  std::unique_ptr<RecordStream> read() override {
    return std::make_unique<MemoryStream>(records_);
  }
  std::string path() const override { return path_; }

 private:
  Ptr<Records> records_;
  std::string path_;
};

inline Records drain(RecordStream &stream) {
  Records records;
  while (std::optional<Record> record = stream.next()) {
    records.push_back(std::move(*record));
  }
  return records;
}

inline std::vector<Batch> drain(BatchStream &stream) {
  std::vector<Batch> batches;
  while (std::optional<Batch> batch = stream.next()) {
    batches.push_back(std::move(*batch));
  }
  return batches;
}

}  // namespace seqbatch::test
