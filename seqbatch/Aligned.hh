#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdlib>

namespace seqbatch {

constexpr size_t kAlignWidth = 64;

/// Owning, move-only block of aligned memory. Backing store of Tensor.
class Aligned {
 public:
  Aligned() = default;
  Aligned(size_t alignment, size_t size);

  ~Aligned();

  void* data() const { return data_; }
  size_t size() const { return size_; }

  char* begin() const { return reinterpret_cast<char*>(data_); }
  char* end() const { return begin() + size_; }

  Aligned(const Aligned&) = delete;
  Aligned& operator=(const Aligned&) = delete;

  Aligned(Aligned&& from) noexcept;
  Aligned& operator=(Aligned&& from) noexcept;

 private:
  static void* allocate(size_t alignment, size_t size);
  void release();
  void consume(Aligned& from);

  void* data_ = nullptr;
  size_t size_ = 0;
};

}  // namespace seqbatch
