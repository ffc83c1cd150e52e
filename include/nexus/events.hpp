#pragma once

// nexus/events.hpp: On-chain event fetcher.
//
// DESIGN:
//   EventFetcher::poll() starts one poller thread that repeatedly posts the
//   events GraphQL query through a GraphqlTransport and pushes FetchItems onto
//   a bounded EventChannel:
//
//     post(query{after: cursor, filter: {type: <pkg>::event::EventWrapper<inner?>}})
//       transport failure  -> push error item, back off
//       graphql failure    -> push error item, back off
//       empty page         -> back off, push nothing
//       page               -> parse nodes (unparseable nodes are skipped),
//                             push {events, next_cursor}, reset backoff
//
//   Backoff starts at initial_backoff, doubles per idle or failed round and is
//   capped at max_backoff. A successful page resets it.
//
// INVARIANTS:
//   - Pages are pushed in cursor order; events keep server order in a page.
//   - Closing the channel (EventStream destructor or close()) stops the
//     poller at its next suspension point: transport call, backoff sleep or
//     channel send.

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "nexus/jsonlite.hpp"
#include "nexus/types.hpp"

namespace nexus::events {

// ---------------------------------------------------------------------------
// EventChannel: bounded MPSC queue with close
// ---------------------------------------------------------------------------
template <typename T>
class EventChannel {
 public:
  explicit EventChannel(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

  // Blocks while full. Returns false once the channel is closed.
  bool send(T item) {
    std::unique_lock<std::mutex> lock(mu_);
    cv_capacity_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
    if (closed_) return false;
    queue_.push_back(std::move(item));
    cv_items_.notify_one();
    return true;
  }

  // Blocks until an item arrives. nullopt once closed.
  std::optional<T> receive() {
    std::unique_lock<std::mutex> lock(mu_);
    cv_items_.wait(lock, [this] { return closed_ || !queue_.empty(); });
    return pop_locked();
  }

  std::optional<T> receive_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    cv_items_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
    return pop_locked();
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      closed_ = true;
      queue_.clear();
    }
    cv_items_.notify_all();
    cv_capacity_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return closed_;
  }

  // Sleeps for `d` or until the channel closes. Returns true if closed.
  bool wait_closed_for(std::chrono::milliseconds d) const {
    std::unique_lock<std::mutex> lock(mu_);
    return cv_capacity_.wait_for(lock, d, [this] { return closed_; });
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return queue_.size();
  }
  std::size_t capacity() const { return capacity_; }

 private:
  std::optional<T> pop_locked() {
    if (closed_ || queue_.empty()) return std::nullopt;
    T item = std::move(queue_.front());
    queue_.pop_front();
    cv_capacity_.notify_one();
    return item;
  }

  const std::size_t capacity_;
  mutable std::mutex mu_;
  mutable std::condition_variable cv_items_;
  mutable std::condition_variable cv_capacity_;
  std::deque<T> queue_;
  bool closed_{false};
};

// ---------------------------------------------------------------------------
// Move type tags
// ---------------------------------------------------------------------------
// "<address>::<module>::<name><P1, P2, ...>"; parameters may nest. Primitive
// parameters ("u64", "address", ...) keep only `name`.
struct TypeTag {
  std::string address;
  std::string module;
  std::string name;
  std::vector<TypeTag> params;

  bool is_struct() const { return !module.empty(); }
  std::string to_string() const;
};

std::optional<TypeTag> parse_type_tag(std::string_view repr, Error* error = nullptr);

// Addresses compare after lowercasing and stripping leading zeros.
std::string normalize_address(std::string_view address);

// ---------------------------------------------------------------------------
// Events
// ---------------------------------------------------------------------------
struct EventId {
  std::string tx_digest;
  std::uint64_t index{0};

  bool operator==(const EventId&) const = default;
};

struct NexusEvent {
  EventId id;
  std::string name;               // normalised inner event name
  std::vector<TypeTag> generics;  // inner event type parameters
  jsonlite::Value payload;        // contents.json.event
};

struct EventPage {
  std::vector<NexusEvent> events;
  std::string next_cursor;
};

// One channel element: a page, or an error the poller recovered from.
struct FetchItem {
  std::optional<EventPage> page;
  std::optional<Error> error;

  bool ok() const { return page.has_value(); }
};

struct EventFilter {
  std::string package;                    // primitives package, owner of EventWrapper
  std::vector<std::string> extra_packages;  // other packages events may originate from
  std::optional<std::string> inner_type;

  // "<package>::event::EventWrapper" or "...::EventWrapper<inner_type>".
  std::string type_filter() const;
  bool accepts_package(std::string_view address) const;
};

// `node` is one element of data.events.nodes:
//   { sequenceNumber, transaction: {digest}, transactionModule: {package: {address}},
//     contents: {type: {repr}, json: {event: ...}} }
std::optional<NexusEvent> parse_event(const jsonlite::Value& node, const EventFilter& filter, Error* error = nullptr);

// Maps RequestScheduledExecution<OccurrenceScheduledEvent> and
// RequestScheduledExecution<RequestWalkExecutionEvent> to their dedicated
// names; other tags keep their own name.
std::optional<std::string> normalize_event_name(const TypeTag& event_type, Error* error = nullptr);

// ---------------------------------------------------------------------------
// GraphQL
// ---------------------------------------------------------------------------
struct EventsQuery {
  std::optional<std::string> after;
  std::optional<std::uint64_t> at_checkpoint;
  std::optional<std::uint64_t> first;
  std::string type_filter;

  std::string to_json() const;
};

struct EventsResponse {
  std::vector<jsonlite::Value> nodes;
  std::optional<std::string> end_cursor;
};

// graphql_error when the response carries "errors" or lacks data.events.
std::optional<EventsResponse> parse_events_response(const std::string& body, Error* error = nullptr);

class GraphqlTransport {
 public:
  virtual ~GraphqlTransport() = default;
  // POSTs a JSON request body and returns the response body.
  virtual std::optional<std::string> post(const std::string& request_json, Error* error) = 0;
};

// ---------------------------------------------------------------------------
// EventFetcher
// ---------------------------------------------------------------------------
struct FetcherConfig {
  std::size_t channel_capacity{100};
  std::chrono::milliseconds initial_backoff{100};
  std::chrono::milliseconds max_backoff{2000};
  std::optional<std::uint64_t> page_size;
};

// Receiver side of a running poll. Destruction closes the channel and joins
// the poller.
class EventStream {
  struct Passkey {
    explicit Passkey() = default;
  };

 public:
  EventStream(Passkey, std::shared_ptr<EventChannel<FetchItem>> channel) : channel_(std::move(channel)) {}
  EventStream(const EventStream&) = delete;
  EventStream& operator=(const EventStream&) = delete;
  ~EventStream();

  std::optional<FetchItem> next() { return channel_->receive(); }
  std::optional<FetchItem> next_for(std::chrono::milliseconds timeout) { return channel_->receive_for(timeout); }
  void close();

 private:
  friend class EventFetcher;
  static std::unique_ptr<EventStream> create(std::size_t capacity) {
    return std::make_unique<EventStream>(Passkey{}, std::make_shared<EventChannel<FetchItem>>(capacity));
  }

  std::shared_ptr<EventChannel<FetchItem>> channel_;
  std::thread poller_;
};

class EventFetcher {
 public:
  EventFetcher(std::shared_ptr<GraphqlTransport> transport, EventFilter filter, FetcherConfig config = {});

  std::unique_ptr<EventStream> poll(std::optional<std::string> from_cursor = std::nullopt,
                                    std::optional<std::uint64_t> from_checkpoint = std::nullopt) const;

  const EventFilter& filter() const { return filter_; }
  const FetcherConfig& config() const { return config_; }

 private:
  std::shared_ptr<GraphqlTransport> transport_;
  EventFilter filter_;
  FetcherConfig config_;
};

}  // namespace nexus::events
