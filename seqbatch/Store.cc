#include "seqbatch/Store.hh"

#include <algorithm>
#include <string>
#include <vector>

#include "seqbatch/Error.hh"

namespace seqbatch {

void LengthPolicy::clip(Words &x, std::optional<Words> &y) const {
  if (x.size() > max_src_len) {
    x.resize(max_src_len);
  }
  if (y && y->size() > max_tgt_len) {
    y->resize(max_tgt_len);
  }
}

bool LengthPolicy::admit(Words &x, std::optional<Words> &y) const {
  if (truncate) {
    clip(x, y);
    return true;
  }
  return x.size() <= max_src_len && (!y || y->size() <= max_tgt_len);
}

bool LengthPolicy::admit(int64_t &x_len, int64_t &y_len) const {
  auto max_x = static_cast<int64_t>(max_src_len);
  auto max_y = static_cast<int64_t>(max_tgt_len);
  if (truncate) {
    x_len = std::min(x_len, max_x);
    y_len = std::min(y_len, max_y);
    return true;
  }
  return x_len <= max_x && y_len <= max_y;
}

std::vector<RecordStats> Store::stats(Column /*column*/, Order /*order*/) {
  throw UnsupportedStrategyError("Store at " + path() +
                                 " does not support sorted projections.");
}

Records Store::fetch(const Ids & /*ids*/) {
  throw UnsupportedStrategyError("Store at " + path() +
                                 " does not support random access by id.");
}

std::string to_string(Column column) {
  switch (column) {
    case Column::x_len:
      return "x_len";
    case Column::y_len:
      return "y_len";
  }
  return "unknown";
}

std::string to_string(Order order) {
  switch (order) {
    case Order::asc:
      return "asc";
    case Order::desc:
      return "desc";
  }
  return "unknown";
}

}  // namespace seqbatch
