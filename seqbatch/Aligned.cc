#include "seqbatch/Aligned.hh"

#include <new>

namespace seqbatch {

Aligned::Aligned(size_t alignment, size_t size)
    : data_(allocate(alignment, size)), size_(size) {}

Aligned::~Aligned() { release(); }

Aligned::Aligned(Aligned&& from) noexcept { consume(from); }

Aligned& Aligned::operator=(Aligned&& from) noexcept {
  if (this != &from) {
    release();
    consume(from);
  }
  return *this;
}

void Aligned::consume(Aligned& from) {
  data_ = from.data_;
  size_ = from.size_;

  from.data_ = nullptr;
  from.size_ = 0;
}

void* Aligned::allocate(size_t alignment, size_t size) {
  // aligned_alloc wants a multiple of alignment, and a zero-sized batch side
  // (never built, but shaped) still gets one block.
  size_t aligned_size = (size / alignment) * alignment;
  if (size % alignment != 0 || aligned_size == 0) {
    aligned_size += alignment;
  }
  void* data = std::aligned_alloc(alignment, aligned_size);
  if (data == nullptr) {
    throw std::bad_alloc();
  }
  return data;
}

void Aligned::release() {
  if (data_ != nullptr) {
    std::free(data_);
    data_ = nullptr;
  }
  size_ = 0;
}

}  // namespace seqbatch
