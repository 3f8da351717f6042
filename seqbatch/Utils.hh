#pragma once
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <random>
#include <string>
#include <vector>

namespace seqbatch {

template <class Scalar>
std::ostream &print_ndarray(std::ostream &out, const Scalar *data,
                            const std::vector<uint64_t> &dims);

/// Peak resident set size of this process, in kilobytes.
size_t max_rss_kb();

/// Human readable form of a size in kilobytes ("512KB", "1.5GB").
std::string format_kb(size_t kb);

const char *stringify(bool flag);

class Timer {
 public:
  // Create and start the timer
  Timer() : start_(clock::now()) {}

  Timer(const Timer &timer) = delete;
  Timer &operator=(const Timer &timer) = delete;

  Timer(Timer &&timer) = default;
  Timer &operator=(Timer &&timer) = default;

  // Get the time elapsed without stopping the timer.  If the template type is
  // not specified, it returns the time counts as represented by
  // std::chrono::seconds
  template <class Duration = std::chrono::seconds>
  double elapsed() const {
    using duration_double =
        std::chrono::duration<double, typename Duration::period>;
    return std::chrono::duration_cast<duration_double>(clock::now() - start_)
        .count();
  }

 private:
  using clock = std::chrono::steady_clock;
  using time_point = std::chrono::time_point<clock>;

  time_point start_;
};

/// Seeded source of randomness. Every component that shuffles or jitters
/// owns one, constructed from a seed in its Config, so that a fixed seed
/// reproduces the same order across runs.
class Rng {
 public:
  explicit Rng(uint64_t seed) : engine_(seed) {}

  uint64_t next() { return engine_(); }

  template <class Container>
  void shuffle(Container &container) {
    std::shuffle(container.begin(), container.end(), engine_);
  }

 private:
  std::mt19937_64 engine_;
};

}  // namespace seqbatch
