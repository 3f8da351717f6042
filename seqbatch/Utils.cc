#include "seqbatch/Utils.hh"

#include <sys/resource.h>

#include <cstdint>
#include <cstdio>
#include <functional>
#include <iostream>
#include <vector>

namespace seqbatch {

// clang-format off
template <class Scalar> struct Emit { using Type = Scalar; };
template <>             struct Emit <uint8_t> { using Type = int; };
// clang-format on

template <class Scalar>
std::ostream &print_ndarray(std::ostream &out, const Scalar *data,
                            const std::vector<uint64_t> &dims) {
  // Enable printing by recursing on dimensions.
  using EmitT = typename Emit<Scalar>::Type;
  constexpr size_t kTruncate = 4;

  std::function<size_t(size_t, size_t)> recurse;
  recurse = [&out, &dims, &recurse, data](size_t d, size_t offset) {
    // Base case. Print the vector.
    if (d + 1 == dims.size()) {
      out << "[";
      // we truncate only if we have 2*kTruncate
      bool truncate = dims[d] > 2 * kTruncate;
      if (truncate) {
        out << static_cast<EmitT>(data[offset]);
        for (size_t j = offset + 1; j < offset + kTruncate; j++) {
          out << ", " << static_cast<EmitT>(data[j]);
        }
        out << ", ... ";
        for (size_t j = offset + dims[d] - kTruncate; j < offset + dims[d];
             j++) {
          out << ", " << static_cast<EmitT>(data[j]);
        }
      } else {
        for (size_t j = offset; j < offset + dims[d]; j++) {
          if (j != offset) {
            out << ", ";
          }
          out << static_cast<EmitT>(data[j]);
        }
      }
      out << "]";
      return offset + dims[d];
    }

    out << "[";
    for (size_t j = 0; j < dims[d]; j++) {
      if (j != 0) {
        out << ",";
        if (d + 2 == dims.size()) {
          out << "\n";
        }
      }
      offset = recurse(d + 1, offset);
    }
    out << "]";

    return offset;
  };

  out << "\n";
  if (!dims.empty()) {
    recurse(0, 0);
  }
  return out;
}

// NOLINTBEGIN
#define SEQBATCH_PRINT_NDARRAY_EXPLICIT(ScalarType) \
  template std::ostream &print_ndarray<ScalarType>( \
      std::ostream & out, const ScalarType *data,   \
      const std::vector<uint64_t> &dims)
// NOLINTEND

SEQBATCH_PRINT_NDARRAY_EXPLICIT(int32_t);
SEQBATCH_PRINT_NDARRAY_EXPLICIT(uint8_t);

#undef SEQBATCH_PRINT_NDARRAY_EXPLICIT

size_t max_rss_kb() {
  struct rusage usage {};
  if (getrusage(RUSAGE_SELF, &usage) != 0) {
    return 0;
  }
  // Linux reports kilobytes.
  return static_cast<size_t>(usage.ru_maxrss);
}

std::string format_kb(size_t kb) {
  constexpr double kUnit = 1024.0;
  const char *units[] = {"KB", "MB", "GB", "TB"};
  auto value = static_cast<double>(kb);
  size_t unit = 0;
  while (value >= kUnit && unit + 1 < sizeof(units) / sizeof(units[0])) {
    value /= kUnit;
    ++unit;
  }
  char buffer[32];  // NOLINT
  snprintf(buffer, sizeof(buffer), "%.1f%s", value, units[unit]);
  return buffer;
}

const char *stringify(bool flag) {
  // Converts 0/1 to "false"/"true"
  return flag ? "true" : "false";
}

}  // namespace seqbatch
