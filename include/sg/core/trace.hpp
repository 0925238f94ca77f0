#pragma once
#include <chrono>
#include <cstddef>
#include <cstdio>

#include "sg/core/config.hpp"

namespace sg::trace {

struct ScopedTimer {
  const char* label;
  bool on;
  std::size_t items = 0;   // set by the traced code before scope exit
  std::chrono::steady_clock::time_point t0;

  explicit ScopedTimer(const char* lbl)
    : label(lbl), on(config::trace_enabled()),
      t0(std::chrono::steady_clock::now()) {}

  ScopedTimer(const ScopedTimer&) = delete;
  ScopedTimer& operator=(const ScopedTimer&) = delete;

  ~ScopedTimer() {
    if (!on) return;
    using namespace std::chrono;
    auto us = duration_cast<microseconds>(steady_clock::now() - t0).count();
    std::fprintf(stderr, "[SG_TRACE] %s | %zu items | %lld us\n",
                 label ? label : "(unnamed)", items,
                 static_cast<long long>(us));
    std::fflush(stderr);
  }
};

} // namespace sg::trace

// Named so the traced code can fill in `items`.
#define SG_TRACE_SCOPE(var, label_literal) ::sg::trace::ScopedTimer var{label_literal}
