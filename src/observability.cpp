#include "nexus/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>

#include "nexus/jsonlite.hpp"

namespace nexus {

namespace {

// bit_width gives the bucket index in O(1): floor(log2(x)) + 1 for x > 0.
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

void append_fixed(std::string& out, const char* fmt, double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), fmt, v);
  out += buf;
}

}  // namespace

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  const size_t b = bucket_for_us(us);
  buckets_[b].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  uint64_t counts[kBuckets];
  for (size_t i = 0; i < kBuckets; ++i) {
    counts[i] = buckets_[i].load(std::memory_order_relaxed);
  }

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += counts[i];
    if (cumulative >= target) {
      const double bucket_lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double bucket_hi = static_cast<double>(1ULL << i);
      return (bucket_lo + bucket_hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(192);
  out += "{\"count\":";
  out += std::to_string(count_.load(std::memory_order_relaxed));
  out += ",\"mean_us\":";
  append_fixed(out, "%.2f", mean_us());
  out += ",\"p50_us\":";
  append_fixed(out, "%.2f", percentile(0.50));
  out += ",\"p95_us\":";
  append_fixed(out, "%.2f", percentile(0.95));
  out += ",\"p99_us\":";
  append_fixed(out, "%.2f", percentile(0.99));
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// ToolkitStats
// ---------------------------------------------------------------------------

void ToolkitStats::record(const ToolkitEvent& ev) {
  total_events.fetch_add(1, std::memory_order_relaxed);
  if (!ev.ok) {
    failed_events.fetch_add(1, std::memory_order_relaxed);
    std::lock_guard<std::mutex> lk(failure_mu_);
    failure_categories_.record(ev.error);
  }

  if (ev.component == "dag") {
    dag_validations.fetch_add(1, std::memory_order_relaxed);
  } else if (ev.component == "kat") {
    dfa_compilations.fetch_add(1, std::memory_order_relaxed);
  } else if (ev.component == "signed_http" && ev.ok) {
    if (ev.action == "begin_invoke") requests_signed.fetch_add(1, std::memory_order_relaxed);
    else if (ev.action == "authenticate") requests_authenticated.fetch_add(1, std::memory_order_relaxed);
    else if (ev.action == "finish" || ev.action == "sign_rejection") responses_signed.fetch_add(1, std::memory_order_relaxed);
    else if (ev.action == "verify_response") responses_verified.fetch_add(1, std::memory_order_relaxed);
    else if (ev.action == "replay") replay_hits.fetch_add(1, std::memory_order_relaxed);
  } else if (ev.component == "secret_store" && ev.ok) {
    if (ev.action == "seal") secrets_sealed.fetch_add(1, std::memory_order_relaxed);
    else if (ev.action == "open") secrets_opened.fetch_add(1, std::memory_order_relaxed);
  } else if (ev.component == "events" && ev.ok) {
    event_pages.fetch_add(1, std::memory_order_relaxed);
    events_delivered.fetch_add(ev.bytes, std::memory_order_relaxed);
  } else if (ev.component == "groth16" && ev.ok) {
    if (ev.action == "prove") proofs_generated.fetch_add(1, std::memory_order_relaxed);
    else if (ev.action == "verify") proofs_verified.fetch_add(1, std::memory_order_relaxed);
  }

  if (ev.duration_ns > 0) latency_histogram.record(ev.duration_ns);

  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) {
    ring_buffer_.push_back(ev);
  } else {
    ring_buffer_[ring_head_] = ev;
    ring_head_ = (ring_head_ + 1) % kMaxRecentEvents;
  }
}

std::vector<ToolkitEvent> ToolkitStats::recent_events_snapshot() const {
  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) return ring_buffer_;
  // Oldest first.
  std::vector<ToolkitEvent> out;
  out.reserve(ring_buffer_.size());
  for (size_t i = 0; i < ring_buffer_.size(); ++i) {
    out.push_back(ring_buffer_[(ring_head_ + i) % ring_buffer_.size()]);
  }
  return out;
}

FailureCategoryStats ToolkitStats::failure_snapshot() const {
  std::lock_guard<std::mutex> lk(failure_mu_);
  return failure_categories_;
}

std::string ToolkitStats::to_json() const {
  auto load = [](const std::atomic<uint64_t>& a) {
    return std::to_string(a.load(std::memory_order_relaxed));
  };
  std::string out;
  out.reserve(768);
  out += "{\"total_events\":" + load(total_events);
  out += ",\"failed_events\":" + load(failed_events);
  out += ",\"dag\":{\"validations\":" + load(dag_validations) + "}";
  out += ",\"kat\":{\"compilations\":" + load(dfa_compilations) + "}";
  out += ",\"signed_http\":{\"requests_signed\":" + load(requests_signed);
  out += ",\"requests_authenticated\":" + load(requests_authenticated);
  out += ",\"responses_signed\":" + load(responses_signed);
  out += ",\"responses_verified\":" + load(responses_verified);
  out += ",\"replay_hits\":" + load(replay_hits) + "}";
  out += ",\"secrets\":{\"sealed\":" + load(secrets_sealed);
  out += ",\"opened\":" + load(secrets_opened) + "}";
  out += ",\"events\":{\"pages\":" + load(event_pages);
  out += ",\"delivered\":" + load(events_delivered) + "}";
  out += ",\"groth16\":{\"proofs_generated\":" + load(proofs_generated);
  out += ",\"proofs_verified\":" + load(proofs_verified) + "}";
  out += ",\"latency\":" + latency_histogram.to_json();
  out += ",\"failure_categories\":" + failure_snapshot().to_json();
  out += "}";
  return out;
}

// ---------------------------------------------------------------------------
// Global singleton + event emission
// ---------------------------------------------------------------------------

ToolkitStats& global_toolkit_stats() {
  static ToolkitStats inst;
  return inst;
}

namespace {
std::atomic<ToolkitEventHook> g_event_hook{nullptr};
}

void set_toolkit_event_hook(ToolkitEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

std::string event_to_json(const ToolkitEvent& ev) {
  std::string line;
  line.reserve(192);
  line += "{\"component\":\"";
  line += jsonlite::escape(ev.component);
  line += "\",\"action\":\"";
  line += jsonlite::escape(ev.action);
  line += "\",\"subject\":\"";
  line += jsonlite::escape(ev.subject);
  line += "\",\"ok\":";
  line += ev.ok ? "true" : "false";
  line += ",\"error_code\":\"";
  line += to_string(ev.error);
  line += "\",\"duration_ns\":";
  line += std::to_string(ev.duration_ns);
  line += ",\"bytes\":";
  line += std::to_string(ev.bytes);
  if (!ev.detail.empty()) {
    line += ",\"detail\":\"";
    line += jsonlite::escape(ev.detail);
    line += "\"";
  }
  line += "}";
  return line;
}

void emit_toolkit_event(const ToolkitEvent& ev) {
  global_toolkit_stats().record(ev);

  ToolkitEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  // Activation: NEXUS_EVENT_LOG=/path/to/events.jsonl
  const char* log_path = std::getenv("NEXUS_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  const std::string line = event_to_json(ev) + "\n";
  // O_APPEND writes below PIPE_BUF are atomic on POSIX.
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace nexus
