#include "seqbatch/TensorOps.hh"

#include <cstddef>
#include <cstdint>

namespace seqbatch {

template <class Scalar>
void transpose_10(const Scalar *in, size_t rows, size_t cols, Scalar *out) {
  for (size_t i = 0; i < rows; i++) {
    for (size_t j = 0; j < cols; j++) {
      out[j * rows + i] = in[i * cols + j];
    }
  }
}

// NOLINTBEGIN
#define SEQBATCH_TRANSPOSE_10_EXPLICIT(Type)                                 \
  template void transpose_10<Type>(const Type *in, size_t rows, size_t cols, \
                                   Type *out)
// NOLINTEND

SEQBATCH_TRANSPOSE_10_EXPLICIT(int32_t);
SEQBATCH_TRANSPOSE_10_EXPLICIT(uint8_t);
#undef SEQBATCH_TRANSPOSE_10_EXPLICIT

Tensor padding_mask(const Tensor &seqs, Word pad) {
  Tensor mask(Type::u8, seqs.shape(), seqs.name() + "_mask");
  const auto *tokens = seqs.data<int32_t>();
  auto *out = mask.data<uint8_t>();
  for (size_t i = 0; i < seqs.size(); i++) {
    out[i] = static_cast<uint8_t>(tokens[i] != pad);
  }
  return mask;
}

Tensor subsequent_mask(size_t size) {
  Tensor mask(Type::u8, Shape({size, size}), "subsequent_mask");
  auto *out = mask.data<uint8_t>();
  for (size_t i = 0; i < size; i++) {
    for (size_t j = 0; j < size; j++) {
      out[i * size + j] = static_cast<uint8_t>(j <= i);
    }
  }
  return mask;
}

Tensor autoregressive_mask(const Tensor &seqs, Word pad) {
  size_t batch_size = seqs.dim(-2);
  size_t length = seqs.dim(-1);
  Tensor mask(Type::u8, Shape({batch_size, length, length}),
              seqs.name() + "_autoreg_mask");

  const auto *tokens = seqs.data<int32_t>();
  auto *out = mask.data<uint8_t>();
  for (size_t b = 0; b < batch_size; b++) {
    const int32_t *row = tokens + b * length;
    uint8_t *block = out + b * length * length;
    for (size_t i = 0; i < length; i++) {
      for (size_t j = 0; j < length; j++) {
        block[i * length + j] = static_cast<uint8_t>(j <= i && row[j] != pad);
      }
    }
  }
  return mask;
}

}  // namespace seqbatch
