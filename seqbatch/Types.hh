#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace seqbatch {

using Word = int32_t;
using Words = std::vector<Word>;

using Id = int64_t;
using Ids = std::vector<Id>;

template <class T>
using Ptr = std::shared_ptr<T>;

struct View {
  void *data = nullptr;
  size_t size = 0;
};

/// One training example. x is the source sequence, y the (optional) target.
/// Once produced, a Record is never modified: stores hand out copies and the
/// batch builder writes augmented sequences into its own buffers.
struct Record {
  Id id = 0;
  Words x;
  std::optional<Words> y;

  size_t x_len() const { return x.size(); }
  size_t y_len() const { return y ? y->size() : 0; }
  bool has_y() const { return y.has_value(); }

  // Length used for batching: the longer of the two sides.
  size_t length() const { return y ? std::max(x.size(), y->size()) : x.size(); }
};

using Records = std::vector<Record>;

/// A row of the scalar projection (id, x_len, y_len). y_len is -1 for records
/// without a target, matching what the indexed store keeps on disk.
struct RecordStats {
  Id id;
  int64_t x_len;
  int64_t y_len;

  size_t length() const {
    return static_cast<size_t>(std::max(x_len, y_len));
  }
  bool empty() const { return x_len == 0 || y_len == 0; }
};

using SeqPair = std::pair<Words, std::optional<Words>>;
using SeqPairs = std::vector<SeqPair>;

enum class Column {
  x_len,  //
  y_len   //
};

enum class Order {
  asc,  //
  desc  //
};

}  // namespace seqbatch
