#include "nexus/events.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>

#include "nexus/observability.hpp"

namespace nexus::events {
namespace {

constexpr const char* kEventWrapperModule = "event";
constexpr const char* kEventWrapperName = "EventWrapper";

constexpr const char* kEventsQueryText =
    "query Events($after: String, $first: Int, $filter: EventFilter) {"
    " events(after: $after, first: $first, filter: $filter) {"
    " nodes { sequenceNumber transaction { digest } transactionModule { package { address } }"
    " contents { type { repr } json } }"
    " pageInfo { endCursor hasNextPage } } }";

void emit(bool ok, ErrorCode code, const std::string& subject, std::size_t delivered, std::uint64_t duration_ns) {
  ToolkitEvent ev;
  ev.component = "events";
  ev.action = "page";
  ev.subject = subject;
  ev.ok = ok;
  ev.error = code;
  ev.bytes = delivered;
  ev.duration_ns = duration_ns;
  emit_toolkit_event(ev);
}

// ---------------------------------------------------------------------------
// Type tag parser
// ---------------------------------------------------------------------------
class TagParser {
 public:
  explicit TagParser(std::string_view s) : s_(s) {}

  std::optional<TypeTag> parse(Error* error) {
    auto tag = parse_tag();
    skip_ws();
    if (!tag || pos_ != s_.size()) {
      set_error(error, ErrorCode::event_parse_error, "invalid type tag '" + std::string(s_) + "'");
      return std::nullopt;
    }
    return tag;
  }

 private:
  void skip_ws() {
    while (pos_ < s_.size() && std::isspace(static_cast<unsigned char>(s_[pos_]))) ++pos_;
  }

  std::string ident() {
    skip_ws();
    const std::size_t start = pos_;
    while (pos_ < s_.size() && (std::isalnum(static_cast<unsigned char>(s_[pos_])) || s_[pos_] == '_')) ++pos_;
    return std::string(s_.substr(start, pos_ - start));
  }

  bool consume(std::string_view tok) {
    skip_ws();
    if (s_.substr(pos_, tok.size()) != tok) return false;
    pos_ += tok.size();
    return true;
  }

  std::optional<TypeTag> parse_tag() {
    TypeTag tag;
    std::string first = ident();
    if (first.empty()) return std::nullopt;
    if (consume("::")) {
      tag.address = std::move(first);
      tag.module = ident();
      if (tag.module.empty() || !consume("::")) return std::nullopt;
      tag.name = ident();
      if (tag.name.empty()) return std::nullopt;
    } else {
      tag.name = std::move(first);
    }
    if (consume("<")) {
      do {
        auto param = parse_tag();
        if (!param) return std::nullopt;
        tag.params.push_back(std::move(*param));
      } while (consume(","));
      if (!consume(">")) return std::nullopt;
    }
    return tag;
  }

  std::string_view s_;
  std::size_t pos_{0};
};

const jsonlite::Value* path(const jsonlite::Value& root, std::initializer_list<const char*> keys) {
  const jsonlite::Value* cur = &root;
  for (const char* k : keys) {
    const auto* obj = jsonlite::as_object(*cur);
    if (!obj) return nullptr;
    cur = jsonlite::find(*obj, k);
    if (!cur) return nullptr;
  }
  return cur;
}

const std::string* path_string(const jsonlite::Value& root, std::initializer_list<const char*> keys) {
  const auto* v = path(root, keys);
  return v ? jsonlite::as_string(*v) : nullptr;
}

// ---------------------------------------------------------------------------
// Poller
// ---------------------------------------------------------------------------
struct PollState {
  std::shared_ptr<GraphqlTransport> transport;
  EventFilter filter;
  FetcherConfig config;
  std::shared_ptr<EventChannel<FetchItem>> channel;
  std::optional<std::string> cursor;
  std::optional<std::uint64_t> at_checkpoint;
};

void poll_loop(PollState st) {
  const std::string type_filter = st.filter.type_filter();
  auto backoff = st.config.initial_backoff;

  // Returns false once the receiver is gone.
  auto back_off = [&]() {
    if (st.channel->wait_closed_for(backoff)) return false;
    backoff = std::min(backoff * 2, st.config.max_backoff);
    return true;
  };
  auto surface = [&](const Error& err, std::uint64_t ns) {
    emit(false, err.code, type_filter, 0, ns);
    if (!st.channel->send(FetchItem{std::nullopt, err})) return false;
    return back_off();
  };

  while (!st.channel->closed()) {
    EventsQuery query;
    query.after = st.cursor;
    query.at_checkpoint = st.at_checkpoint;
    query.first = st.config.page_size;
    query.type_filter = type_filter;

    std::uint64_t ns = 0;
    Error err;
    std::optional<EventsResponse> response;
    {
      ScopeTimer timer(ns);
      auto body = st.transport->post(query.to_json(), &err);
      if (body) response = parse_events_response(*body, &err);
    }
    if (!response) {
      if (!surface(err, ns)) return;
      continue;
    }

    if (response->nodes.empty() || !response->end_cursor) {
      if (!back_off()) return;
      continue;
    }

    EventPage page;
    page.next_cursor = *response->end_cursor;
    for (const auto& node : response->nodes) {
      // Nodes that do not parse are skipped.
      if (auto ev = parse_event(node, st.filter)) page.events.push_back(std::move(*ev));
    }
    st.cursor = page.next_cursor;
    st.at_checkpoint.reset();

    const std::size_t delivered = page.events.size();
    if (!st.channel->send(FetchItem{std::move(page), std::nullopt})) return;
    emit(true, ErrorCode::none, type_filter, delivered, ns);

    backoff = st.config.initial_backoff;
    if (st.channel->wait_closed_for(backoff)) return;
  }
}

}  // namespace

// ---------------------------------------------------------------------------
// Type tags
// ---------------------------------------------------------------------------

std::string TypeTag::to_string() const {
  std::string out = is_struct() ? address + "::" + module + "::" + name : name;
  if (!params.empty()) {
    out += "<";
    for (std::size_t i = 0; i < params.size(); ++i) {
      if (i) out += ", ";
      out += params[i].to_string();
    }
    out += ">";
  }
  return out;
}

std::optional<TypeTag> parse_type_tag(std::string_view repr, Error* error) {
  return TagParser(repr).parse(error);
}

std::string normalize_address(std::string_view address) {
  if (address.substr(0, 2) == "0x" || address.substr(0, 2) == "0X") address.remove_prefix(2);
  while (!address.empty() && address.front() == '0') address.remove_prefix(1);
  std::string out = "0x";
  for (char c : address) out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (out.size() == 2) out += '0';
  return out;
}

// ---------------------------------------------------------------------------
// Filter
// ---------------------------------------------------------------------------

std::string EventFilter::type_filter() const {
  std::string out = package + "::" + kEventWrapperModule + "::" + kEventWrapperName;
  if (inner_type) out += "<" + *inner_type + ">";
  return out;
}

bool EventFilter::accepts_package(std::string_view address) const {
  const std::string a = normalize_address(address);
  if (a == normalize_address(package)) return true;
  return std::any_of(extra_packages.begin(), extra_packages.end(),
                     [&](const std::string& p) { return normalize_address(p) == a; });
}

// ---------------------------------------------------------------------------
// Event parsing
// ---------------------------------------------------------------------------

std::optional<std::string> normalize_event_name(const TypeTag& event_type, Error* error) {
  if (event_type.name != "RequestScheduledExecution") return event_type.name;
  if (event_type.params.empty() || !event_type.params.front().is_struct()) {
    set_error(error, ErrorCode::event_parse_error, "RequestScheduledExecution expects a struct type parameter");
    return std::nullopt;
  }
  const std::string& inner = event_type.params.front().name;
  if (inner == "OccurrenceScheduledEvent") return std::string("RequestScheduledOccurrenceEvent");
  if (inner == "RequestWalkExecutionEvent") return std::string("RequestScheduledWalkEvent");
  set_error(error, ErrorCode::event_parse_error, "Unsupported RequestScheduledExecution payload: " + inner);
  return std::nullopt;
}

std::optional<NexusEvent> parse_event(const jsonlite::Value& node, const EventFilter& filter, Error* error) {
  auto fail = [&](std::string message) -> std::optional<NexusEvent> {
    set_error(error, ErrorCode::event_parse_error, std::move(message));
    return std::nullopt;
  };

  const auto* seq_v = path(node, {"sequenceNumber"});
  auto index = seq_v ? jsonlite::as_u64(*seq_v) : std::nullopt;
  if (!index) return fail("event is missing sequenceNumber");
  const auto* digest = path_string(node, {"transaction", "digest"});
  if (!digest) return fail("event is missing transaction digest");
  const auto* package = path_string(node, {"transactionModule", "package", "address"});
  if (!package) return fail("event is missing package address");

  if (!filter.accepts_package(*package)) {
    return fail("Event does not come from a Nexus package, it comes from '" + *package + "' instead");
  }

  const auto* repr = path_string(node, {"contents", "type", "repr"});
  if (!repr) return fail("event is missing contents.type.repr");
  auto tag = parse_type_tag(*repr, error);
  if (!tag) return std::nullopt;

  if (normalize_address(tag->address) != normalize_address(filter.package) || tag->module != kEventWrapperModule ||
      tag->name != kEventWrapperName) {
    return fail("Event is not wrapped in '" + filter.package + "::event::EventWrapper', found type: '" + *repr + "'");
  }
  if (tag->params.empty() || !tag->params.front().is_struct()) {
    return fail("EventWrapper does not have a valid event type parameter");
  }
  const TypeTag& event_type = tag->params.front();

  auto name = normalize_event_name(event_type, error);
  if (!name) return std::nullopt;

  const auto* payload = path(node, {"contents", "json", "event"});
  if (!payload) return fail("Event contents missing JSON data");

  NexusEvent out;
  out.id = EventId{*digest, *index};
  out.name = std::move(*name);
  out.generics = event_type.params;
  out.payload = *payload;
  return out;
}

// ---------------------------------------------------------------------------
// GraphQL
// ---------------------------------------------------------------------------

std::string EventsQuery::to_json() const {
  jsonlite::Object filter;
  filter["type"] = jsonlite::Value{type_filter};
  if (at_checkpoint) filter["atCheckpoint"] = jsonlite::Value{*at_checkpoint};

  jsonlite::Object vars;
  vars["after"] = after ? jsonlite::Value{*after} : jsonlite::Value{nullptr};
  if (first) vars["first"] = jsonlite::Value{*first};
  vars["filter"] = jsonlite::Value{std::move(filter)};

  jsonlite::Object root;
  root["query"] = jsonlite::Value{std::string(kEventsQueryText)};
  root["variables"] = jsonlite::Value{std::move(vars)};
  return jsonlite::to_json(root);
}

std::optional<EventsResponse> parse_events_response(const std::string& body, Error* error) {
  auto fail = [&](std::string message) -> std::optional<EventsResponse> {
    set_error(error, ErrorCode::graphql_error, std::move(message));
    return std::nullopt;
  };

  std::optional<jsonlite::JsonError> jerr;
  auto root = jsonlite::parse_value(body, &jerr);
  if (jerr) return fail("invalid GraphQL response: " + jerr->message);

  if (const auto* errors = path(root, {"errors"})) {
    const auto* list = jsonlite::as_array(*errors);
    if (list && !list->empty()) {
      const auto* msg = path_string(list->front(), {"message"});
      return fail("GraphQL error: " + (msg ? *msg : jsonlite::to_json(list->front())));
    }
  }

  const auto* nodes_v = path(root, {"data", "events", "nodes"});
  const auto* nodes = nodes_v ? jsonlite::as_array(*nodes_v) : nullptr;
  if (!nodes) return fail("GraphQL response has no data.events.nodes");

  EventsResponse out;
  out.nodes = *nodes;
  if (const auto* cursor = path_string(root, {"data", "events", "pageInfo", "endCursor"})) out.end_cursor = *cursor;
  return out;
}

// ---------------------------------------------------------------------------
// EventStream / EventFetcher
// ---------------------------------------------------------------------------

EventStream::~EventStream() { close(); }

void EventStream::close() {
  if (channel_) channel_->close();
  if (poller_.joinable()) poller_.join();
}

EventFetcher::EventFetcher(std::shared_ptr<GraphqlTransport> transport, EventFilter filter, FetcherConfig config)
    : transport_(std::move(transport)), filter_(std::move(filter)), config_(config) {}

std::unique_ptr<EventStream> EventFetcher::poll(std::optional<std::string> from_cursor,
                                                std::optional<std::uint64_t> from_checkpoint) const {
  auto stream = EventStream::create(config_.channel_capacity);
  PollState st{transport_, filter_, config_, stream->channel_, std::move(from_cursor), from_checkpoint};
  stream->poller_ = std::thread(poll_loop, std::move(st));
  return stream;
}

}  // namespace nexus::events
