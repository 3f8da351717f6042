#pragma once
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

#include "seqbatch/Types.hh"

namespace seqbatch {

// Leading byte of an encoded sequence blob. Bump when the layout changes.
constexpr static uint8_t kBlobVersion = 1;

namespace io {

/// Parses a whitespace separated list of base-10 integers into words.
/// Returns false if any token is not an integer; words is left partially
/// filled in that case.
bool parse_words(std::string_view text, Words &words);

/// Number of lines in a text file, a final line without '\n' included.
size_t line_count(const std::string &path);

/// Strips leading and trailing whitespace.
std::string_view strip(std::string_view text);

/// Sequence blobs: kBlobVersion, LEB128 element count, then each element
/// zig-zag encoded as LEB128.
std::string encode_words(const Words &words);
Words decode_words(const void *data, size_t size);

/// A path next to `path` to write into before moving into place.
std::string temporary_path(const std::string &path);

/// Moves `from` onto `to`, replacing `to` if present.
void replace_file(const std::string &from, const std::string &to);

class MmapFile {
 public:
  explicit MmapFile(const std::string &filepath);
  ~MmapFile();

  void *data() const { return data_; }
  size_t size() const { return size_; }

  // Disable copy and assignment
  MmapFile(const MmapFile &) = delete;
  MmapFile &operator=(const MmapFile &) = delete;

  MmapFile(MmapFile &&from) noexcept;
  MmapFile &operator=(MmapFile &&from) noexcept;

 private:
  void consume(MmapFile &from);
  void release();
  void reset();

  int fd_ = -1;
  void *data_ = nullptr;
  size_t size_ = 0;
};

/// Little-endian fixed width and length-prefixed writes onto a stream.
class BinaryWriter {
 public:
  explicit BinaryWriter(std::ofstream &out) : out_(out) {}

  void u64(uint64_t value);
  void i64(int64_t value);
  void string(std::string_view value);

 private:
  std::ofstream &out_;
};

/// Reads what BinaryWriter wrote, from memory (usually an MmapFile). Every
/// read is bounds checked and throws MalformedRecordError past the end.
class BinaryReader {
 public:
  BinaryReader(const void *data, size_t size)
      : head_(reinterpret_cast<const char *>(data)),
        end_(reinterpret_cast<const char *>(data) + size) {}

  uint64_t u64();
  int64_t i64();
  std::string_view string();
  bool exhausted() const { return head_ == end_; }

 private:
  const char *emit(size_t size);

  const char *head_;
  const char *end_;
};

}  // namespace io

}  // namespace seqbatch
