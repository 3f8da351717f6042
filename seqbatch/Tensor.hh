#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "seqbatch/Aligned.hh"
#include "seqbatch/Types.hh"

namespace seqbatch {

// NOLINTBEGIN
enum class Type {
  i32,  // token ids
  u8,   // masks
};
// NOLINTEND

size_t size_in_bytes(Type type);
std::string to_string(Type type);

// clang-format off
template <class Scalar> struct DeduceEnumType;

template <> struct DeduceEnumType<int32_t> { static constexpr Type value = Type::i32; };
template <> struct DeduceEnumType<uint8_t> { static constexpr Type value = Type::u8;  };
// clang-format on

class Shape {
 public:
  Shape() = default;
  explicit Shape(std::vector<uint64_t> dims);
  uint64_t elements() const { return elements_; }
  uint64_t dim(int idx) const;
  const std::vector<uint64_t> &dims() const { return dims_; }
  size_t size() const { return dims_.size(); }

  Shape transpose(int x, int y) const;
  friend std::ostream &operator<<(std::ostream &out, const Shape &shape);

 private:
  void recompute_elements();

  uint64_t elements_ = 0;
  std::vector<uint64_t> dims_;
};

bool operator==(const Shape &lhs, const Shape &rhs);
bool operator!=(const Shape &lhs, const Shape &rhs);

/// Dense row-major buffer. Batches keep their padded sequences and masks in
/// Tensors; a Tensor always owns its storage.
class Tensor {
 public:
  Tensor() = default;
  Tensor(Type type, Shape shape, std::string name);

  template <class Scalar>
  Scalar *data() {
    return reinterpret_cast<Scalar *>(aligned_.data());
  }

  template <class Scalar>
  const Scalar *data() const {
    return reinterpret_cast<const Scalar *>(aligned_.data());
  }

  template <class Scalar>
  Scalar at(size_t row, size_t col) const {
    return data<Scalar>()[row * shape_.dim(-1) + col];
  }

  template <class Scalar>
  void fill_in_place(Scalar value) {
    std::fill(data<Scalar>(), data<Scalar>() + size(), value);
  }

  bool empty() const { return aligned_.data() == nullptr; }
  size_t size() const { return shape_.elements(); }
  uint64_t dim(int index) const { return shape_.dim(index); }
  const Shape &shape() const { return shape_; }
  Type type() const { return type_; }
  const std::string &name() const { return name_; }

  // Explicit copy, Tensor has no copy constructor.
  Tensor clone(const std::string &name = "") const;
  Tensor transpose_2d() const;

  /// Copies row `row` (all columns) out of a 2D i32 tensor.
  Words row(size_t row) const;

  friend std::ostream &operator<<(std::ostream &out, const Tensor &tensor);

 private:
  Aligned aligned_;
  Type type_{Type::i32};
  Shape shape_;
  std::string name_;
};

bool operator==(const Tensor &lhs, const Tensor &rhs);

}  // namespace seqbatch
