#pragma once

// nexus/observability.hpp: Structured toolkit event layer.
//
// DESIGN:
//   ToolkitEvent is the canonical observable unit. Every externally visible
//   operation (DAG validation, DFA compilation, signed-HTTP authentication and
//   verification, secret sealing/opening, event page delivery, proof
//   generation/verification) emits one ToolkitEvent, which is:
//     - recorded in the process-wide ToolkitStats counters,
//     - forwarded to a registered hook, if any,
//     - otherwise appended as one JSON line to the file named by NEXUS_EVENT_LOG.
//
// INVARIANT:
//   Events never carry secret material: no keys, no plaintexts, no bodies.
//   Only identifiers, digests and error codes.
//   Event emission must never fail the operation that emits it.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "nexus/types.hpp"

namespace nexus {

// ---------------------------------------------------------------------------
// ToolkitEvent: per-operation observable unit
// ---------------------------------------------------------------------------
struct ToolkitEvent {
  std::string component;   // "dag", "kat", "signed_http", "secret_store", ...
  std::string action;      // "validate", "authenticate", "seal", ...
  std::string subject;     // identifier the action applies to (never a secret)
  bool ok{false};
  ErrorCode error{ErrorCode::none};
  std::string detail;
  uint64_t duration_ns{0};
  size_t bytes{0};
};

// ---------------------------------------------------------------------------
// LatencyHistogram: power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);

  // p in [0.0, 1.0]. Returns microseconds, 0.0 if no samples recorded.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  uint64_t sum_us() const { return sum_us_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// ToolkitStats: global aggregated statistics
// ---------------------------------------------------------------------------
// Thread-safe. Counters are atomic; the failure table and the ring buffer are
// mutex protected.
class ToolkitStats {
 public:
  void record(const ToolkitEvent& ev);
  std::string to_json() const;

  alignas(64) std::atomic<uint64_t> total_events{0};
  alignas(64) std::atomic<uint64_t> failed_events{0};

  // --- DAG / KAT ---
  alignas(64) std::atomic<uint64_t> dag_validations{0};
  alignas(64) std::atomic<uint64_t> dfa_compilations{0};

  // --- Signed HTTP ---
  alignas(64) std::atomic<uint64_t> requests_signed{0};
  alignas(64) std::atomic<uint64_t> requests_authenticated{0};
  alignas(64) std::atomic<uint64_t> responses_signed{0};
  alignas(64) std::atomic<uint64_t> responses_verified{0};
  alignas(64) std::atomic<uint64_t> replay_hits{0};

  // --- Secrets ---
  alignas(64) std::atomic<uint64_t> secrets_sealed{0};
  alignas(64) std::atomic<uint64_t> secrets_opened{0};

  // --- Events ---
  alignas(64) std::atomic<uint64_t> event_pages{0};
  alignas(64) std::atomic<uint64_t> events_delivered{0};

  // --- Proofs ---
  alignas(64) std::atomic<uint64_t> proofs_generated{0};
  alignas(64) std::atomic<uint64_t> proofs_verified{0};

  LatencyHistogram latency_histogram;

  static constexpr size_t kMaxRecentEvents = 256;
  std::vector<ToolkitEvent> recent_events_snapshot() const;
  FailureCategoryStats failure_snapshot() const;

 private:
  mutable std::mutex failure_mu_;
  FailureCategoryStats failure_categories_;

  mutable std::mutex ring_mu_;
  std::vector<ToolkitEvent> ring_buffer_;
  size_t ring_head_{0};  // next slot to overwrite once the ring is full
};

ToolkitStats& global_toolkit_stats();

std::string event_to_json(const ToolkitEvent& ev);

// Emit a toolkit event (fire-and-forget).
void emit_toolkit_event(const ToolkitEvent& ev);

using ToolkitEventHook = void (*)(const ToolkitEvent&);
void set_toolkit_event_hook(ToolkitEventHook hook);

// ---------------------------------------------------------------------------
// ScopeTimer: RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace nexus
