#pragma once
#include <atomic>
#include <cstdlib>
#include <cstring>

namespace sg { namespace config {

// ---------- Env parsing ----------
inline bool _env_bool(const char* name, bool def=false) {
  if (const char* s = std::getenv(name)) {
    if (!std::strcmp(s,"1") || !std::strcmp(s,"true") || !std::strcmp(s,"TRUE")) return true;
    if (!std::strcmp(s,"0") || !std::strcmp(s,"false")|| !std::strcmp(s,"FALSE")) return false;
  }
  return def;
}

// ---------- Finite check on leaves (env + runtime) ----------
//   Env: SG_CHECK_FINITE=0|1  (default: off, NaN/Inf propagate)
inline std::atomic<bool>& check_finite_flag() {
  static std::atomic<bool> v{ _env_bool("SG_CHECK_FINITE", false) };
  return v;
}
inline void set_check_finite(bool on) {
  check_finite_flag().store(on, std::memory_order_relaxed);
}
inline bool check_finite_enabled() {
  return check_finite_flag().load(std::memory_order_relaxed);
}

// ---------- Trace logging (env + runtime) ----------
//   Env: SG_TRACE=0|1
inline std::atomic<bool>& trace_flag() {
  static std::atomic<bool> v{ _env_bool("SG_TRACE", false) };
  return v;
}
inline void set_trace(bool on) {
  trace_flag().store(on, std::memory_order_relaxed);
}
inline bool trace_enabled() {
  return trace_flag().load(std::memory_order_relaxed);
}

// Restores both knobs on scope exit. Used by tests and by callers that want a
// temporary override without touching the environment.
struct ScopedConfig {
  ScopedConfig() : check_finite_(check_finite_enabled()), trace_(trace_enabled()) {}
  ~ScopedConfig() { set_check_finite(check_finite_); set_trace(trace_); }
  ScopedConfig(const ScopedConfig&) = delete;
  ScopedConfig& operator=(const ScopedConfig&) = delete;
private:
  bool check_finite_;
  bool trace_;
};

}} // namespace sg::config
