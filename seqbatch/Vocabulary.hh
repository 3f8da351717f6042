#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "sentencepiece_processor.h"
#include "seqbatch/Types.hh"

namespace seqbatch {

/// SentencePiece model used to turn raw corpus lines into token ids while
/// preparing a store, and to pick the marker ids of its batches.
class Vocabulary {
 public:
  explicit Vocabulary(const std::string &fpath);

  Words encode(std::string_view line) const;

  // -1 when the model has no pad piece, SentencePiece's default.
  Word pad_id() const { return processor_.pad_id(); }
  Word bos_id() const { return processor_.bos_id(); }
  Word eos_id() const { return processor_.eos_id(); }
  size_t size() const { return processor_.GetPieceSize(); }

 private:
  sentencepiece::SentencePieceProcessor processor_;
};

}  // namespace seqbatch
