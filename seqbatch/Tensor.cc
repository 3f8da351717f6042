#include "seqbatch/Tensor.hh"

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include "seqbatch/TensorOps.hh"
#include "seqbatch/Utils.hh"

namespace seqbatch {

size_t size_in_bytes(Type type) {
  size_t scalar_size = 0;
  // clang-format off
  switch (type) {
    case Type::i32: scalar_size = sizeof(int32_t); break;
    case Type::u8 : scalar_size = sizeof(uint8_t); break;
  }
  // clang-format on
  return scalar_size;
}

std::string to_string(Type type) {
  switch (type) {
    // clang-format off
#define CASE(_type) case Type::_type: return #_type
    CASE(i32);
    CASE(u8);
#undef CASE
    // clang-format on
  }

  auto number = static_cast<uint64_t>(type);
  return "Unknown" + std::to_string(number);
}

Shape::Shape(std::vector<uint64_t> dims) : dims_(std::move(dims)) {
  recompute_elements();
}

void Shape::recompute_elements() {
  elements_ = 1;
  for (auto dim : dims_) {
    elements_ *= dim;
  }
}

uint64_t Shape::dim(int idx) const {
  if (idx < 0) {
    idx += static_cast<int>(dims_.size());
  }
  return dims_[idx];
}

Shape Shape::transpose(int x, int y) const {
  auto rank = static_cast<int>(dims_.size());
  if (x < 0) x += rank;
  if (y < 0) y += rank;

  std::vector<uint64_t> transposed_dims = dims_;
  std::swap(transposed_dims[x], transposed_dims[y]);
  return Shape(std::move(transposed_dims));
}

bool operator==(const Shape &lhs, const Shape &rhs) {
  return lhs.dims() == rhs.dims();
}

bool operator!=(const Shape &lhs, const Shape &rhs) { return !(lhs == rhs); }

std::ostream &operator<<(std::ostream &out, const Shape &shape) {
  out << "Shape(";
  for (size_t i = 0; i < shape.dims_.size(); i++) {
    if (i != 0) {
      out << "x";
    }
    out << shape.dims_[i];
  }
  out << ")";
  return out;
}

Tensor::Tensor(Type type, Shape shape, std::string name)
    : aligned_(kAlignWidth, size_in_bytes(type) * shape.elements()),
      type_(type),
      shape_(std::move(shape)),
      name_(std::move(name)) {}

Tensor Tensor::clone(const std::string &name) const {
  Tensor copy(type_, shape_, name.empty() ? name_ : name);
  const char *in = data<char>();
  std::copy(in, in + size_in_bytes(type_) * size(), copy.data<char>());
  return copy;
}

Tensor Tensor::transpose_2d() const {
  Tensor transposed(type_, shape_.transpose(0, 1), name_ + "_transpose");
  switch (type_) {
    case Type::i32:
      transpose_10(data<int32_t>(), shape_.dim(-2), shape_.dim(-1),
                   transposed.data<int32_t>());
      break;
    case Type::u8:
      transpose_10(data<uint8_t>(), shape_.dim(-2), shape_.dim(-1),
                   transposed.data<uint8_t>());
      break;
  }
  return transposed;
}

Words Tensor::row(size_t row) const {
  size_t cols = shape_.dim(-1);
  const auto *begin = data<int32_t>() + row * cols;
  return Words(begin, begin + cols);
}

std::ostream &operator<<(std::ostream &out, const Tensor &tensor) {
  out << "Tensor(" << tensor.name_ << ", " << to_string(tensor.type_) << ", "
      << tensor.shape_;

  if (std::getenv("SEQBATCH_DEBUG")) {
    out << ", ";
    switch (tensor.type_) {
      case Type::i32:
        print_ndarray(out, tensor.data<int32_t>(), tensor.shape_.dims());
        break;
      case Type::u8:
        print_ndarray(out, tensor.data<uint8_t>(), tensor.shape_.dims());
        break;
    }
  }
  out << ")";
  return out;
}

bool operator==(const Tensor &lhs, const Tensor &rhs) {
  if (lhs.type() != rhs.type()) return false;
  if (lhs.shape() != rhs.shape()) return false;
  size_t bytes = size_in_bytes(lhs.type()) * lhs.size();
  return std::memcmp(lhs.data<char>(), rhs.data<char>(), bytes) == 0;
}

}  // namespace seqbatch
