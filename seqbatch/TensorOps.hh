#pragma once
#include <cstddef>
#include <cstdint>

#include "seqbatch/Tensor.hh"
#include "seqbatch/Types.hh"

namespace seqbatch {

template <class Scalar>
void transpose_10(const Scalar *in, size_t rows, size_t cols, Scalar *out);

/// [batch, length] tokens -> [batch, length] mask, 1 where the token is not
/// pad. Expects batch-major input.
Tensor padding_mask(const Tensor &seqs, Word pad);

/// [size, size] lower triangular mask including the diagonal: position i may
/// attend to positions j <= i.
Tensor subsequent_mask(size_t size);

/// Combines padding_mask and subsequent_mask for decoder inputs.
/// [batch, length] tokens -> [batch, length, length] mask where entry
/// (b, i, j) is 1 iff seqs[b, j] is not pad and j <= i.
Tensor autoregressive_mask(const Tensor &seqs, Word pad);

}  // namespace seqbatch
