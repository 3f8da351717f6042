#include "seqbatch/seqbatch.hh"

#include <pybind11/iostream.h>
#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace py = pybind11;

#define pystdout py::module_::import("sys").attr("stdout")
#define pystderr py::module_::import("sys").attr("stderr")

using seqbatch::Alignment;
using seqbatch::Batch;
using seqbatch::BatchIterable;
using seqbatch::BatchStream;
using seqbatch::LengthPolicy;
using seqbatch::LoopingIterable;
using seqbatch::Tensor;

class Redirect {
 public:
  Redirect() : out_(std::cout, pystdout), err_(std::cerr, pystderr) {}

 public:
  py::scoped_ostream_redirect out_;
  py::scoped_ostream_redirect err_;
};

template <class Scalar>
py::array_t<Scalar> to_numpy(const Tensor &tensor) {
  std::vector<py::ssize_t> shape(tensor.shape().dims().begin(),
                                 tensor.shape().dims().end());
  py::array_t<Scalar> array(shape);
  std::copy(tensor.data<Scalar>(), tensor.data<Scalar>() + tensor.size(),
            array.mutable_data());
  return array;
}

// Python iterator over one pass.
class PyPass {
 public:
  explicit PyPass(std::unique_ptr<BatchStream> stream)
      : stream_(std::move(stream)) {}

  Batch next() {
    std::optional<Batch> batch;
    {
      py::gil_scoped_release release;
      batch = stream_->next();
    }
    if (!batch) {
      throw py::stop_iteration();
    }
    return std::move(*batch);
  }

 private:
  std::unique_ptr<BatchStream> stream_;
};

class PyLooping {
 public:
  PyLooping(std::shared_ptr<BatchIterable> iterable, size_t total)
      : looping_(std::move(iterable), total) {}

  Batch next() {
    std::optional<Batch> batch;
    {
      py::gil_scoped_release release;
      batch = looping_.next();
    }
    if (!batch) {
      throw py::stop_iteration();
    }
    return std::move(*batch);
  }

  LoopingIterable &looping() { return looping_; }

 private:
  LoopingIterable looping_;
};

PYBIND11_MODULE(_seqbatch, m) {
  m.doc() = "seqbatch python bindings";

  py::register_exception<seqbatch::Error>(m, "Error", PyExc_RuntimeError);

  py::class_<Alignment>(m, "Alignment")
      .def(py::init<>())
      .def_readwrite("add_bos_x", &Alignment::add_bos_x)
      .def_readwrite("add_eos_x", &Alignment::add_eos_x)
      .def_readwrite("add_bos_y", &Alignment::add_bos_y)
      .def_readwrite("add_eos_y", &Alignment::add_eos_y)
      .def_readwrite("batch_first", &Alignment::batch_first)
      .def_readwrite("sort_desc", &Alignment::sort_desc)
      .def_readwrite("pad", &Alignment::pad)
      .def_readwrite("bos", &Alignment::bos)
      .def_readwrite("eos", &Alignment::eos);

  py::class_<LengthPolicy>(m, "LengthPolicy")
      .def(py::init<>())
      .def_readwrite("max_src_len", &LengthPolicy::max_src_len)
      .def_readwrite("max_tgt_len", &LengthPolicy::max_tgt_len)
      .def_readwrite("truncate", &LengthPolicy::truncate);

  using Config = BatchIterable::Config;
  py::class_<Config>(m, "Config")
      .def(py::init<>())
      .def_readwrite("max_tokens", &Config::max_tokens)
      .def_readwrite("sort_by", &Config::sort_by)
      .def_readwrite("len_rand", &Config::len_rand)
      .def_readwrite("shuffle", &Config::shuffle)
      .def_readwrite("keep_in_mem", &Config::keep_in_mem)
      .def_readwrite("lengths", &Config::lengths)
      .def_readwrite("alignment", &Config::alignment)
      .def_readwrite("seed", &Config::seed);

  py::class_<Batch>(m, "Batch")
      .def("__len__", &Batch::size)
      .def_property_readonly("has_y", &Batch::has_y)
      .def_property_readonly(
          "x_seqs", [](const Batch &b) { return to_numpy<int32_t>(b.x_seqs()); })
      .def_property_readonly("y_seqs",
                             [](const Batch &b) -> py::object {
                               if (!b.has_y()) {
                                 return py::none();
                               }
                               return to_numpy<int32_t>(b.y_seqs());
                             })
      .def_property_readonly("x_len", &Batch::x_len)
      .def_property_readonly("y_len", &Batch::y_len)
      .def_property_readonly("x_toks", &Batch::x_toks)
      .def_property_readonly("y_toks", &Batch::y_toks)
      .def_property_readonly("max_x_len", &Batch::max_x_len)
      .def_property_readonly("max_y_len", &Batch::max_y_len)
      .def_property_readonly("ids", &Batch::ids)
      .def("x_mask",
           [](const Batch &b) { return to_numpy<uint8_t>(b.x_mask()); })
      .def("y_autoreg_mask",
           [](const Batch &b) { return to_numpy<uint8_t>(b.y_autoreg_mask()); });

  py::class_<PyPass>(m, "Pass")
      .def("__iter__", [](PyPass &pass) -> PyPass & { return pass; })
      .def("__next__", &PyPass::next);

  py::class_<BatchIterable, std::shared_ptr<BatchIterable>>(m, "BatchIterable")
      .def(py::init<>([](const std::string &path, const Config &config) {
             Redirect redirect;
             return std::make_shared<BatchIterable>(path, config);
           }),
           py::arg("path"), py::arg("config"))
      .def("num_items", &BatchIterable::num_items)
      .def("num_batches", &BatchIterable::num_batches)
      .def("__iter__",
           [](BatchIterable &iterable) { return PyPass(iterable.pass()); });

  py::class_<PyLooping>(m, "LoopingIterable")
      .def(py::init<std::shared_ptr<BatchIterable>, size_t>(),
           py::arg("iterable"), py::arg("total"))
      .def("__iter__", [](PyLooping &looping) -> PyLooping & { return looping; })
      .def("__next__", &PyLooping::next)
      .def("__len__", [](PyLooping &looping) { return looping.looping().total(); })
      .def("reset", [](PyLooping &looping) { looping.looping().reset(); });
}
