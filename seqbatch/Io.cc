#include "seqbatch/Io.hh"

#include <charconv>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>

#include "seqbatch/Error.hh"

namespace seqbatch::io {

namespace {

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' ||
         c == '\f';
}

void put_varint(std::string &out, uint64_t value) {
  constexpr uint64_t kLow = 0x7F;
  constexpr uint64_t kMore = 0x80;
  while (value > kLow) {
    out.push_back(static_cast<char>((value & kLow) | kMore));
    value >>= 7;  // NOLINT
  }
  out.push_back(static_cast<char>(value));
}

uint64_t get_varint(const uint8_t *&head, const uint8_t *end) {
  constexpr uint8_t kLow = 0x7F;
  constexpr uint8_t kMore = 0x80;
  constexpr unsigned kMaxShift = 63;
  uint64_t value = 0;
  unsigned shift = 0;
  while (true) {
    if (head == end || shift > kMaxShift) {
      throw MalformedRecordError("Truncated varint in sequence blob.");
    }
    uint8_t byte = *head++;
    value |= static_cast<uint64_t>(byte & kLow) << shift;
    if ((byte & kMore) == 0) {
      return value;
    }
    shift += 7;  // NOLINT
  }
}

uint32_t zigzag(Word word) {
  auto value = static_cast<uint32_t>(word);
  return (value << 1) ^ static_cast<uint32_t>(word >> 31);  // NOLINT
}

Word unzigzag(uint32_t value) {
  return static_cast<Word>((value >> 1) ^ (~(value & 1) + 1));
}

}  // namespace

bool parse_words(std::string_view text, Words &words) {
  const char *p = text.data();
  const char *end = text.data() + text.size();
  while (p != end) {
    while (p != end && is_space(*p)) {
      ++p;
    }
    if (p == end) {
      break;
    }
    const char *token_end = p;
    while (token_end != end && !is_space(*token_end)) {
      ++token_end;
    }
    Word word = 0;
    auto [ptr, ec] = std::from_chars(p, token_end, word);
    if (ec != std::errc() || ptr != token_end) {
      return false;
    }
    words.push_back(word);
    p = token_end;
  }
  return true;
}

std::string_view strip(std::string_view text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && is_space(text[begin])) {
    ++begin;
  }
  while (end > begin && is_space(text[end - 1])) {
    --end;
  }
  return text.substr(begin, end - begin);
}

size_t line_count(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  constexpr size_t kChunk = 1 << 16;
  std::vector<char> buffer(kChunk);
  size_t count = 0;
  char last = '\n';
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto got = static_cast<size_t>(in.gcount());
    for (size_t i = 0; i < got; i++) {
      if (buffer[i] == '\n') {
        ++count;
      }
    }
    if (got > 0) {
      last = buffer[got - 1];
    }
  }
  // Unterminated final line.
  if (last != '\n') {
    ++count;
  }
  return count;
}

std::string encode_words(const Words &words) {
  std::string blob;
  blob.reserve(words.size() + 2);
  blob.push_back(static_cast<char>(kBlobVersion));
  put_varint(blob, words.size());
  for (Word word : words) {
    put_varint(blob, zigzag(word));
  }
  return blob;
}

Words decode_words(const void *data, size_t size) {
  const auto *head = reinterpret_cast<const uint8_t *>(data);
  const uint8_t *end = head + size;
  if (size == 0 || *head != kBlobVersion) {
    throw MalformedRecordError("Unknown sequence blob version.");
  }
  ++head;

  uint64_t count = get_varint(head, end);
  // Every element takes at least a byte.
  if (count > static_cast<uint64_t>(end - head)) {
    throw MalformedRecordError("Sequence blob shorter than its length.");
  }

  Words words;
  words.reserve(count);
  for (uint64_t i = 0; i < count; i++) {
    uint64_t value = get_varint(head, end);
    words.push_back(unzigzag(static_cast<uint32_t>(value)));
  }

  if (head != end) {
    throw MalformedRecordError("Trailing bytes in sequence blob.");
  }
  return words;
}

std::string temporary_path(const std::string &path) {
  return path + ".tmp." + std::to_string(getpid());
}

void replace_file(const std::string &from, const std::string &to) {
  std::error_code ec;
  std::filesystem::rename(from, to, ec);
  if (!ec) {
    return;
  }

  // rename(2) does not cross filesystems, fall back to copy.
  std::filesystem::copy_file(
      from, to, std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    throw std::runtime_error("Failed to move " + from + " to " + to + ": " +
                             ec.message());
  }
  std::filesystem::remove(from, ec);
}

MmapFile::MmapFile(const std::string &filepath) {
  fd_ = open(filepath.c_str(), O_RDONLY);
  if (fd_ == -1) {
    throw std::runtime_error("Failed to open file: " + filepath);
  }

  struct stat st {};
  if (fstat(fd_, &st) == -1) {
    close(fd_);
    throw std::runtime_error("Failed to get file size: " + filepath);
  }
  size_ = st.st_size;

  // mmap refuses zero length, an empty file stays a null view.
  if (size_ == 0) {
    return;
  }

  data_ = mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
  if (data_ == MAP_FAILED) {  // NOLINT
    close(fd_);
    throw std::runtime_error("Failed to mmap file: " + filepath);
  }
}

MmapFile::~MmapFile() { release(); }

MmapFile::MmapFile(MmapFile &&from) noexcept { consume(from); }

MmapFile &MmapFile::operator=(MmapFile &&from) noexcept {
  if (this == &from) {
    return *this;
  }
  release();
  consume(from);
  return *this;
}

void MmapFile::consume(MmapFile &from) {
  fd_ = from.fd_;
  data_ = from.data_;
  size_ = from.size_;
  from.reset();
}

void MmapFile::release() {
  if (data_ != nullptr) {
    munmap(data_, size_);
  }
  if (fd_ != -1) {
    close(fd_);
  }
  reset();
}

void MmapFile::reset() {
  fd_ = -1;
  data_ = nullptr;
  size_ = 0;
}

void BinaryWriter::u64(uint64_t value) {
  char bytes[sizeof(uint64_t)];  // NOLINT
  for (size_t i = 0; i < sizeof(uint64_t); i++) {
    bytes[i] = static_cast<char>((value >> (8 * i)) & 0xFF);  // NOLINT
  }
  out_.write(bytes, sizeof(bytes));
}

void BinaryWriter::i64(int64_t value) { u64(static_cast<uint64_t>(value)); }

void BinaryWriter::string(std::string_view value) {
  u64(value.size());
  out_.write(value.data(), static_cast<std::streamsize>(value.size()));
}

const char *BinaryReader::emit(size_t size) {
  if (static_cast<size_t>(end_ - head_) < size) {
    throw MalformedRecordError("Unexpected end of binary data.");
  }
  const char *begin = head_;
  head_ += size;
  return begin;
}

uint64_t BinaryReader::u64() {
  const auto *bytes = reinterpret_cast<const uint8_t *>(emit(sizeof(uint64_t)));
  uint64_t value = 0;
  for (size_t i = 0; i < sizeof(uint64_t); i++) {
    value |= static_cast<uint64_t>(bytes[i]) << (8 * i);  // NOLINT
  }
  return value;
}

int64_t BinaryReader::i64() { return static_cast<int64_t>(u64()); }

std::string_view BinaryReader::string() {
  uint64_t size = u64();
  const char *data = emit(size);
  return {data, size};
}

}  // namespace seqbatch::io
