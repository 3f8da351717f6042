#include "seqbatch/Vocabulary.hh"

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace seqbatch {

Vocabulary::Vocabulary(const std::string &fpath) {
  auto status = processor_.Load(fpath);
  if (!status.ok()) {
    throw std::runtime_error("Failed to load vocabulary " + fpath + ": " +
                             status.ToString());
  }
}

Words Vocabulary::encode(std::string_view line) const {
  absl::string_view a_line(line.data(), line.size());
  std::vector<int> ids;
  auto status = processor_.Encode(a_line, &ids);
  if (!status.ok()) {
    throw std::runtime_error("Failed to encode line: " + status.ToString());
  }
  return Words(ids.begin(), ids.end());
}

}  // namespace seqbatch
