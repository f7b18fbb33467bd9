/**
 * @file debug.h
 * @brief Verbose logging and phase timing for pqstudio sessions.
 */

#ifndef PQSTUDIO_DEBUG_H
#define PQSTUDIO_DEBUG_H

#include <chrono>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace pqstudio {

struct DebugConfig {
  bool verbose = false;
  bool timing = false;
  FILE* output = nullptr; // nullptr = stderr

  DebugConfig() = default;

  static DebugConfig all() {
    DebugConfig config;
    config.verbose = true;
    config.timing = true;
    return config;
  }

  bool enabled() const { return verbose || timing; }
};

struct PhaseTime {
  std::string name;
  std::chrono::nanoseconds duration;
  size_t bytes_processed = 0;

  double seconds() const { return duration.count() / 1e9; }
};

/**
 * @class DebugTrace
 * @brief Provides debug logging and phase timing.
 *
 * @note Thread Safety: This class is NOT thread-safe. Log only from the thread
 *       that owns the session; worker threads of the commit pipeline do not log.
 */
class DebugTrace {
public:
  explicit DebugTrace(const DebugConfig& config = DebugConfig()) : config_(config) {}

  bool enabled() const { return config_.enabled(); }
  bool verbose() const { return config_.verbose; }
  bool timing() const { return config_.timing; }

  // Note: The format attribute uses index 2 for fmt because 'this' is implicit parameter 1
#if defined(__GNUC__) || defined(__clang__)
  __attribute__((format(printf, 2, 3)))
#endif
  void log(const char* fmt, ...) const {
    if (!config_.verbose)
      return;
    FILE* out = stream();
    fprintf(out, "[pqstudio] ");
    va_list args;
    va_start(args, fmt);
    vfprintf(out, fmt, args);
    va_end(args);
    fprintf(out, "\n");
    fflush(out);
  }

  // Safe string logging without format string interpretation.
  // Use this when logging file paths or user-provided text.
  void log_str(const char* msg) const {
    if (!config_.verbose)
      return;
    FILE* out = stream();
    fprintf(out, "[pqstudio] %s\n", msg);
    fflush(out);
  }

  void start_phase(const char* phase_name) {
    if (!config_.timing)
      return;
    current_phase_ = phase_name;
    phase_start_ = std::chrono::steady_clock::now();
  }

  void end_phase(size_t bytes_processed = 0) {
    if (!config_.timing)
      return;
    auto end = std::chrono::steady_clock::now();
    PhaseTime pt;
    pt.name = current_phase_;
    pt.duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end - phase_start_);
    pt.bytes_processed = bytes_processed;
    phase_times_.push_back(pt);
  }

  void print_timing_summary() const {
    if (!config_.timing || phase_times_.empty())
      return;
    FILE* out = stream();
    fprintf(out, "\n[pqstudio] TIMING SUMMARY:\n");
    fprintf(out, "  %-30s %12s %12s\n", "Phase", "Time (ms)", "Bytes");
    fprintf(out, "  %s\n", std::string(56, '-').c_str());

    std::chrono::nanoseconds total_time{0};
    size_t total_bytes = 0;
    for (const auto& pt : phase_times_) {
      fprintf(out, "  %-30s %12.3f %12zu\n", pt.name.c_str(), pt.duration.count() / 1e6,
              pt.bytes_processed);
      total_time += pt.duration;
      total_bytes += pt.bytes_processed;
    }

    fprintf(out, "  %s\n", std::string(56, '-').c_str());
    fprintf(out, "  %-30s %12.3f %12zu\n\n", "TOTAL", total_time.count() / 1e6, total_bytes);
    fflush(out);
  }

  const std::vector<PhaseTime>& get_phase_times() const { return phase_times_; }

  void clear_timing() { phase_times_.clear(); }

private:
  FILE* stream() const { return config_.output ? config_.output : stderr; }

  DebugConfig config_;
  std::string current_phase_;
  std::chrono::steady_clock::time_point phase_start_;
  std::vector<PhaseTime> phase_times_;
};

} // namespace pqstudio

#endif // PQSTUDIO_DEBUG_H
