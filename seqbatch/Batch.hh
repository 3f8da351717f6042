#pragma once
#include <cstddef>
#include <vector>

#include "seqbatch/Tensor.hh"
#include "seqbatch/Types.hh"

namespace seqbatch {

/// How the sequences of a batch are laid out. The defaults follow the
/// vocabulary convention <pad>=0, <unk>=1, <s>=2, </s>=3. SentencePiece
/// models use other ids by default; see with_markers().
struct Alignment {
  // NOLINTBEGIN
  bool add_bos_x = false;
  bool add_eos_x = true;
  bool add_bos_y = false;
  bool add_eos_y = true;
  bool batch_first = true;
  bool sort_desc = false;  // Reorder records by source length, longest first.
  Word pad = 0;
  Word bos = 2;
  Word eos = 3;
  // NOLINTEND

  template <class App>
  void setup_onto(App &app) {
    // clang-format off
    app.add_flag("--bos-x,!--no-bos-x", add_bos_x, "Start source sequences with BOS.");
    app.add_flag("--eos-x,!--no-eos-x", add_eos_x, "End source sequences with EOS.");
    app.add_flag("--bos-y,!--no-bos-y", add_bos_y, "Start target sequences with BOS.");
    app.add_flag("--eos-y,!--no-eos-y", add_eos_y, "End target sequences with EOS.");
    app.add_flag("--batch-first,!--time-first", batch_first, "Batch-major [batch, length] matrices, else [length, batch].");
    app.add_flag("--sort-desc", sort_desc, "Order records in a batch by source length, longest first.");
    app.add_option("--pad", pad, "Padding token id. Default 0, or the pad id of --vocab.");
    app.add_option("--bos", bos, "Begin-of-sequence token id. Default 2, or the bos id of --vocab.");
    app.add_option("--eos", eos, "End-of-sequence token id. Default 3, or the eos id of --vocab.");
    // clang-format on
  }
};

/// Adds BOS and/or EOS to a copy of seq as asked. A sequence that already
/// carries the marker is left as is, so applying this twice changes nothing.
/// Throws InvalidAlignmentError if seq is empty, or if it carries a marker
/// that was not asked for.
Words augment(const Words &seq, bool add_bos, bool add_eos, Word bos, Word eos);

/// alignment with the pad, bos and eos ids of a vocabulary of vocab_size
/// pieces. SentencePiece models trained without a pad piece report pad -1;
/// those pad with vocab_size, an id no piece uses. Throws
/// InvalidAlignmentError if alignment adds a marker the vocabulary lacks.
Alignment with_markers(Alignment alignment, Word pad, Word bos, Word eos,
                       size_t vocab_size);

/// Padded, aligned sequences of a group of records. Owns its buffers; the
/// records it was built from are not referenced or modified.
class Batch {
 public:
  /// Throws InvalidAlignmentError if records is empty or records disagree on
  /// having a target.
  Batch(const Records &records, const Alignment &alignment);

  size_t size() const { return ids_.size(); }
  bool has_y() const { return has_y_; }

  /// [size, max_x_len] if batch_first, else [max_x_len, size].
  const Tensor &x_seqs() const { return x_seqs_; }
  const Tensor &y_seqs() const { return y_seqs_; }

  // Lengths after BOS/EOS, in row order.
  const std::vector<size_t> &x_len() const { return x_len_; }
  const std::vector<size_t> &y_len() const { return y_len_; }

  size_t x_toks() const { return x_toks_; }
  size_t y_toks() const { return y_toks_; }
  size_t max_x_len() const { return max_x_len_; }
  size_t max_y_len() const { return max_y_len_; }

  const Ids &ids() const { return ids_; }
  const Alignment &alignment() const { return alignment_; }

  /// [size, max_x_len] mask of non-pad source positions.
  Tensor x_mask() const;

  /// [size, max_y_len, max_y_len] decoder self-attention mask.
  Tensor y_autoreg_mask() const;

 private:
  Tensor batch_major(const Tensor &seqs) const;

  Alignment alignment_;
  Ids ids_;
  bool has_y_ = false;

  Tensor x_seqs_;
  Tensor y_seqs_;
  std::vector<size_t> x_len_;
  std::vector<size_t> y_len_;
  size_t x_toks_ = 0;
  size_t y_toks_ = 0;
  size_t max_x_len_ = 0;
  size_t max_y_len_ = 0;
};

}  // namespace seqbatch
