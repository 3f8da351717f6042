#pragma once
#include <cstdio>
#include <cstdlib>
#include <string_view>

namespace seqbatch {
// debug lines are noisy (one per skipped record), keep them behind the
// environment switch.
inline bool debug_enabled() {
  static const bool enabled = (std::getenv("SEQBATCH_DEBUG") != nullptr);
  return enabled;
}
}  // namespace seqbatch

#ifndef SEQBATCH_DISABLE_LOG
#define LOG(level, ...)                                        \
  do {                                                         \
    if (std::string_view(#level) != "debug" ||                 \
        ::seqbatch::debug_enabled()) {                         \
      fprintf(stderr, "[%s] ", #level);                        \
      fprintf(stderr, __VA_ARGS__);                            \
      fprintf(stderr, "\n");                                   \
    }                                                          \
  } while (0)
#else  // SEQBATCH_DISABLE_LOG
#define LOG(...) (void)0
#endif  // SEQBATCH_DISABLE_LOG
