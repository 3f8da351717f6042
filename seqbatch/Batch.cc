#include "seqbatch/Batch.hh"

#include <algorithm>
#include <numeric>
#include <string>
#include <vector>

#include "seqbatch/Error.hh"
#include "seqbatch/TensorOps.hh"

namespace seqbatch {

namespace {

// Sequences copied left-aligned into the rows of a [rows, max_len] matrix
// filled with pad.
Tensor pad_rows(const std::vector<Words> &rows, size_t max_len, Word pad,
                const std::string &name) {
  Tensor seqs(Type::i32, Shape({rows.size(), max_len}), name);
  seqs.fill_in_place<Word>(pad);
  Word *data = seqs.data<Word>();
  for (size_t i = 0; i < rows.size(); i++) {
    std::copy(rows[i].begin(), rows[i].end(), data + i * max_len);
  }
  return seqs;
}

}  // namespace

Words augment(const Words &seq, bool add_bos, bool add_eos, Word bos,
              Word eos) {
  if (seq.empty()) {
    throw InvalidAlignmentError("Cannot align an empty sequence.");
  }

  if (!add_bos && seq.front() == bos) {
    throw InvalidAlignmentError("Sequence starts with BOS (" +
                                std::to_string(bos) + ") but BOS is off.");
  }
  if (!add_eos && seq.back() == eos) {
    throw InvalidAlignmentError("Sequence ends with EOS (" +
                                std::to_string(eos) + ") but EOS is off.");
  }

  Words augmented;
  augmented.reserve(seq.size() + 2);
  if (add_bos && seq.front() != bos) {
    augmented.push_back(bos);
  }
  augmented.insert(augmented.end(), seq.begin(), seq.end());
  if (add_eos && seq.back() != eos) {
    augmented.push_back(eos);
  }
  return augmented;
}

Alignment with_markers(Alignment alignment, Word pad, Word bos, Word eos,
                       size_t vocab_size) {
  bool needs_bos = alignment.add_bos_x || alignment.add_bos_y;
  bool needs_eos = alignment.add_eos_x || alignment.add_eos_y;
  if ((needs_bos && bos < 0) || (needs_eos && eos < 0)) {
    throw InvalidAlignmentError(
        "Vocabulary has no BOS/EOS piece (bos=" + std::to_string(bos) +
        " eos=" + std::to_string(eos) + ") but the alignment adds one.");
  }

  alignment.pad = pad < 0 ? static_cast<Word>(vocab_size) : pad;
  alignment.bos = bos;
  alignment.eos = eos;
  return alignment;
}

Batch::Batch(const Records &records, const Alignment &alignment)
    : alignment_(alignment) {
  if (records.empty()) {
    throw InvalidAlignmentError("Cannot build a batch of no records.");
  }

  has_y_ = records.front().has_y();
  for (const Record &record : records) {
    if (record.has_y() != has_y_) {
      throw InvalidAlignmentError(
          "Records of a batch must all have a target, or none. Record " +
          std::to_string(record.id) + " differs from record " +
          std::to_string(records.front().id) + ".");
    }
  }

  std::vector<size_t> order(records.size());
  std::iota(order.begin(), order.end(), 0);
  if (alignment_.sort_desc) {
    std::stable_sort(order.begin(), order.end(), [&records](size_t a, size_t b) {
      return records[a].x_len() > records[b].x_len();
    });
  }

  std::vector<Words> xs;
  std::vector<Words> ys;
  xs.reserve(records.size());
  ys.reserve(has_y_ ? records.size() : 0);
  ids_.reserve(records.size());

  const Alignment &a = alignment_;
  for (size_t index : order) {
    const Record &record = records[index];
    ids_.push_back(record.id);
    xs.push_back(augment(record.x, a.add_bos_x, a.add_eos_x, a.bos, a.eos));
    x_len_.push_back(xs.back().size());
    x_toks_ += xs.back().size();
    max_x_len_ = std::max(max_x_len_, xs.back().size());
    if (has_y_) {
      ys.push_back(augment(*record.y, a.add_bos_y, a.add_eos_y, a.bos, a.eos));
      y_len_.push_back(ys.back().size());
      y_toks_ += ys.back().size();
      max_y_len_ = std::max(max_y_len_, ys.back().size());
    }
  }

  x_seqs_ = pad_rows(xs, max_x_len_, a.pad, "x_seqs");
  if (has_y_) {
    y_seqs_ = pad_rows(ys, max_y_len_, a.pad, "y_seqs");
  }

  if (!alignment_.batch_first) {
    x_seqs_ = x_seqs_.transpose_2d();
    if (has_y_) {
      y_seqs_ = y_seqs_.transpose_2d();
    }
  }
}

Tensor Batch::batch_major(const Tensor &seqs) const {
  return alignment_.batch_first ? seqs.clone() : seqs.transpose_2d();
}

Tensor Batch::x_mask() const {
  return padding_mask(batch_major(x_seqs_), alignment_.pad);
}

Tensor Batch::y_autoreg_mask() const {
  if (!has_y_) {
    throw InvalidAlignmentError("Batch has no target sequences to mask.");
  }
  return autoregressive_mask(batch_major(y_seqs_), alignment_.pad);
}

}  // namespace seqbatch
