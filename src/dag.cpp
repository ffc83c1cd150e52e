#include "nexus/dag.hpp"

#include <algorithm>
#include <set>
#include <sstream>
#include <utility>

#include "nexus/hash.hpp"
#include "nexus/observability.hpp"

namespace nexus::dag {
namespace {

using PortRef = std::pair<std::string, std::string>;  // (vertex, port)

std::optional<DagDescription> invalid(Error* error, std::string message) {
  set_error(error, ErrorCode::dag_invalid_definition, std::move(message));
  return std::nullopt;
}

std::optional<Error> structure_error(std::string message) {
  return make_error(ErrorCode::dag_invalid_definition, std::move(message));
}

bool read_string(const jsonlite::Object& obj, const char* key, std::string* out) {
  const auto* v = jsonlite::find(obj, key);
  if (!v) return false;
  const auto* s = jsonlite::as_string(*v);
  if (!s || s->empty()) return false;
  *out = *s;
  return true;
}

bool read_vertex_decl(const jsonlite::Object& obj, VertexDecl* out, std::string* why) {
  if (!read_string(obj, "name", &out->name)) {
    *why = "vertex is missing 'name'";
    return false;
  }
  const auto* kind_v = jsonlite::find(obj, "kind");
  const auto* kind = kind_v ? jsonlite::as_object(*kind_v) : nullptr;
  if (!kind || !read_string(*kind, "variant", &out->variant)) {
    *why = "vertex '" + out->name + "' is missing 'kind.variant'";
    return false;
  }
  if (out->variant == "off_chain") {
    if (!read_string(*kind, "tool_fqn", &out->tool_fqn)) {
      *why = "vertex '" + out->name + "' is missing 'kind.tool_fqn'";
      return false;
    }
  } else if (out->variant != "on_chain") {
    *why = "vertex '" + out->name + "' has unknown kind '" + out->variant + "'";
    return false;
  }
  return true;
}

const jsonlite::Array* array_field(const jsonlite::Object& obj, const char* key) {
  const auto* v = jsonlite::find(obj, key);
  return v ? jsonlite::as_array(*v) : nullptr;
}

std::string port_label(const char* what, const std::string& vertex, const std::string& port) {
  return std::string(what) + ": " + vertex + "." + port;
}

void emit_validate(bool ok, ErrorCode code, const std::string& subject, uint64_t duration_ns,
                   const std::string& detail) {
  ToolkitEvent ev;
  ev.component = "dag";
  ev.action = "validate";
  ev.subject = subject;
  ev.ok = ok;
  ev.error = code;
  ev.duration_ns = duration_ns;
  ev.detail = detail;
  emit_toolkit_event(ev);
}

// Kahn's algorithm: the graph is acyclic iff every vertex is eventually
// removed.
bool is_acyclic(const DagGraph& graph) {
  const auto& vs = graph.vertices();
  std::vector<std::size_t> indegree(vs.size());
  std::vector<std::size_t> ready;
  for (std::size_t i = 0; i < vs.size(); ++i) {
    indegree[i] = vs[i].in.size();
    if (indegree[i] == 0) ready.push_back(i);
  }
  std::size_t removed = 0;
  while (!ready.empty()) {
    const std::size_t v = ready.back();
    ready.pop_back();
    ++removed;
    for (std::size_t w : vs[v].out) {
      if (--indegree[w] == 0) ready.push_back(w);
    }
  }
  return removed == vs.size();
}

std::optional<Error> check_layering(const DagGraph& graph) {
  for (const auto& v : graph.vertices()) {
    const std::size_t n = v.out.size();
    switch (v.kind) {
      case VertexKind::input_port:
      case VertexKind::input_port_with_default:
      case VertexKind::output_port:
        if (n != 1) {
          return make_error(ErrorCode::dag_layering_violated, "'" + v.label() + "' must have exactly 1 outgoing edge");
        }
        break;
      case VertexKind::output_variant:
        if (n == 0) {
          return make_error(ErrorCode::dag_layering_violated,
                            "'" + v.label() + "' must have at least 1 outgoing edge");
        }
        break;
      case VertexKind::tool:
        break;
    }
    for (std::size_t w : v.out) {
      const Vertex& next = graph.vertex(w);
      bool ok = false;
      switch (v.kind) {
        case VertexKind::input_port:
        case VertexKind::input_port_with_default:
          ok = next.kind == VertexKind::tool;
          break;
        case VertexKind::tool:
          ok = next.kind == VertexKind::output_variant;
          break;
        case VertexKind::output_variant:
          ok = next.kind == VertexKind::output_port;
          break;
        case VertexKind::output_port:
          ok = next.kind == VertexKind::input_port || next.kind == VertexKind::input_port_with_default;
          break;
      }
      if (!ok) {
        return make_error(ErrorCode::dag_layering_violated,
                          "The edge from '" + v.label() + "' to '" + next.label() + "' is invalid.");
      }
    }
  }
  return std::nullopt;
}

std::vector<char> ancestors_of(const DagGraph& graph, std::size_t end) {
  std::vector<char> in_set(graph.vertices().size(), 0);
  std::vector<std::size_t> stack(graph.vertex(end).in.begin(), graph.vertex(end).in.end());
  while (!stack.empty()) {
    const std::size_t v = stack.back();
    stack.pop_back();
    if (in_set[v]) continue;
    in_set[v] = 1;
    for (std::size_t w : graph.vertex(v).in) {
      if (!in_set[w]) stack.push_back(w);
    }
  }
  return in_set;
}

long long concurrency_balance(const DagGraph& graph, const std::vector<char>& in_set) {
  const auto& vs = graph.vertices();
  long long entries = 0;
  for (std::size_t i = 0; i < vs.size(); ++i) {
    if (in_set[i] && vs[i].kind == VertexKind::input_port && vs[i].in.empty()) ++entries;
  }
  long long acc = entries - 1;
  for (std::size_t i = 0; i < vs.size(); ++i) {
    if (!in_set[i]) continue;
    const Vertex& v = vs[i];
    if (v.kind == VertexKind::tool) {
      long long widest = 0;
      for (std::size_t variant : v.out) {
        if (!in_set[variant]) continue;
        long long ports = 0;
        for (std::size_t port : vs[variant].out) {
          if (in_set[port]) ++ports;
        }
        widest = std::max(widest, ports - 1);
      }
      acc += widest + 1;
    } else if (v.kind == VertexKind::input_port) {
      acc -= 1;
    }
  }
  return acc;
}

}  // namespace

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

std::optional<DagDescription> parse_dag_json(const std::string& text, Error* error) {
  std::optional<jsonlite::JsonError> jerr;
  jsonlite::Object root = jsonlite::parse(text, &jerr);
  if (jerr) return invalid(error, "invalid DAG JSON: " + jerr->message);

  DagDescription d;
  std::string why;

  const auto* vertices = array_field(root, "vertices");
  const auto* edges = array_field(root, "edges");
  const auto* entries = array_field(root, "entry_vertices");
  if (!vertices || !edges || !entries) {
    return invalid(error, "DAG requires 'vertices', 'edges' and 'entry_vertices' arrays");
  }

  for (const auto& item : *vertices) {
    const auto* obj = jsonlite::as_object(item);
    VertexDecl decl;
    if (!obj) return invalid(error, "vertex must be an object");
    if (!read_vertex_decl(*obj, &decl, &why)) return invalid(error, why);
    d.vertices.push_back(std::move(decl));
  }

  for (const auto& item : *edges) {
    const auto* obj = jsonlite::as_object(item);
    const auto* from_v = obj ? jsonlite::find(*obj, "from") : nullptr;
    const auto* to_v = obj ? jsonlite::find(*obj, "to") : nullptr;
    const auto* from = from_v ? jsonlite::as_object(*from_v) : nullptr;
    const auto* to = to_v ? jsonlite::as_object(*to_v) : nullptr;
    EdgeDecl e;
    if (!from || !to || !read_string(*from, "vertex", &e.from.vertex) ||
        !read_string(*from, "output_variant", &e.from.output_variant) ||
        !read_string(*from, "output_port", &e.from.output_port) || !read_string(*to, "vertex", &e.to.vertex) ||
        !read_string(*to, "input_port", &e.to.input_port)) {
      return invalid(error, "edge requires from.{vertex,output_variant,output_port} and to.{vertex,input_port}");
    }
    d.edges.push_back(std::move(e));
  }

  for (const auto& item : *entries) {
    const auto* obj = jsonlite::as_object(item);
    EntryVertex ev;
    if (!obj) return invalid(error, "entry vertex must be an object");
    if (!read_vertex_decl(*obj, &ev.decl, &why)) return invalid(error, why);
    const auto* ports = array_field(*obj, "input_ports");
    if (!ports) return invalid(error, "entry vertex '" + ev.decl.name + "' is missing 'input_ports'");
    for (const auto& p : *ports) {
      const auto* s = jsonlite::as_string(p);
      if (!s || s->empty()) return invalid(error, "entry vertex '" + ev.decl.name + "' has a malformed input port");
      ev.input_ports.push_back(*s);
    }
    d.entry_vertices.push_back(std::move(ev));
  }

  if (const auto* defaults = array_field(root, "default_values")) {
    for (const auto& item : *defaults) {
      const auto* obj = jsonlite::as_object(item);
      DefaultValue dv;
      if (!obj || !read_string(*obj, "vertex", &dv.vertex) || !read_string(*obj, "input_port", &dv.input_port)) {
        return invalid(error, "default value requires 'vertex' and 'input_port'");
      }
      const auto* value_v = jsonlite::find(*obj, "value");
      const auto* value = value_v ? jsonlite::as_object(*value_v) : nullptr;
      std::string storage;
      if (!value || !read_string(*value, "storage", &storage) || storage != "inline") {
        return invalid(error, "default value for '" + dv.vertex + "." + dv.input_port +
                                  "' must use inline storage");
      }
      const auto* data = jsonlite::find(*value, "data");
      if (!data) return invalid(error, "default value for '" + dv.vertex + "." + dv.input_port + "' has no data");
      dv.value = *data;
      d.default_values.push_back(std::move(dv));
    }
  }

  if (const auto* groups = array_field(root, "entry_groups")) {
    for (const auto& item : *groups) {
      const auto* obj = jsonlite::as_object(item);
      EntryGroup g;
      if (!obj || !read_string(*obj, "name", &g.name)) return invalid(error, "entry group requires 'name'");
      g.vertices = jsonlite::get_string_array(*obj, "vertices");
      d.entry_groups.push_back(std::move(g));
    }
  }

  if (auto err = check_structure(d)) {
    if (error) *error = *err;
    return std::nullopt;
  }
  return d;
}

std::optional<Error> check_structure(const DagDescription& d) {
  std::set<std::string> connected;
  std::set<std::tuple<std::string, std::string, std::string>> from_ports;
  std::set<PortRef> to_ports;
  for (const auto& e : d.edges) {
    connected.insert(e.from.vertex);
    connected.insert(e.to.vertex);
    if (!from_ports.insert({e.from.vertex, e.from.output_variant, e.from.output_port}).second) {
      return structure_error("Edge from 'Output port: " + e.from.vertex + "." + e.from.output_variant + "." +
                             e.from.output_port + "' already exists.");
    }
    to_ports.insert({e.to.vertex, e.to.input_port});
  }

  std::set<std::string> entry_names;
  std::set<PortRef> entry_ports;
  for (const auto& ev : d.entry_vertices) {
    const std::string& name = ev.decl.name;
    if (!connected.count(name)) return structure_error("Entry 'Vertex: " + name + "' is not connected to the DAG.");
    if (!entry_names.insert(name).second) return structure_error("Entry 'Vertex: " + name + "' is a duplicate vertex.");
    for (const auto& port : ev.input_ports) {
      if (!entry_ports.insert({name, port}).second) {
        return structure_error("Entry '" + port_label("Input port", name, port) + "' is defined multiple times.");
      }
      if (to_ports.count({name, port})) {
        return structure_error("Entry '" + port_label("Input port", name, port) + "' has an incoming edge.");
      }
    }
  }

  std::set<std::string> names;
  for (const auto& v : d.vertices) {
    if (!connected.count(v.name)) return structure_error("'Vertex: " + v.name + "' is not connected to the DAG.");
    if (!names.insert(v.name).second) return structure_error("'Vertex: " + v.name + "' is a duplicate vertex.");
    if (entry_names.count(v.name)) {
      return structure_error("Vertex: " + v.name + " is both a vertex and an entry vertex.");
    }
  }

  for (const auto& name : connected) {
    if (!names.count(name) && !entry_names.count(name)) {
      return structure_error("'Vertex: " + name + "' is referenced by an edge but never declared.");
    }
  }

  for (const auto& g : d.entry_groups) {
    for (const auto& v : g.vertices) {
      if (!entry_names.count(v)) {
        return structure_error("'Vertex: " + v + "' is not an entry vertex but is referenced in the '" + g.name +
                               "' entry group.");
      }
    }
  }

  std::set<PortRef> defaults;
  for (const auto& dv : d.default_values) {
    if (!names.count(dv.vertex) && !entry_names.count(dv.vertex)) {
      return structure_error("Default value for unknown vertex '" + dv.vertex + "'.");
    }
    if (!defaults.insert({dv.vertex, dv.input_port}).second) {
      return structure_error("'" + port_label("Input port", dv.vertex, dv.input_port) +
                             "' has more than one default value.");
    }
  }
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// Graph
// ---------------------------------------------------------------------------

std::string to_string(VertexKind kind) {
  switch (kind) {
    case VertexKind::input_port: return "input_port";
    case VertexKind::input_port_with_default: return "input_port_with_default";
    case VertexKind::tool: return "tool";
    case VertexKind::output_variant: return "output_variant";
    case VertexKind::output_port: return "output_port";
  }
  return "unknown";
}

std::string Vertex::label() const {
  switch (kind) {
    case VertexKind::tool: return "Vertex: " + tool;
    case VertexKind::output_variant: return "Output variant: " + tool + "." + variant;
    case VertexKind::output_port: return "Output port: " + tool + "." + variant + "." + port;
    case VertexKind::input_port: return "Input port: " + tool + "." + port;
    case VertexKind::input_port_with_default: return "Input port (default): " + tool + "." + port;
  }
  return tool;
}

std::size_t DagGraph::intern(VertexKind kind, const std::string& tool, const std::string& variant,
                             const std::string& port) {
  Key key{tool, variant, port};
  auto it = index_.find(key);
  if (it != index_.end()) return it->second;
  Vertex v;
  v.kind = kind;
  v.tool = tool;
  v.variant = variant;
  v.port = port;
  vertices_.push_back(std::move(v));
  const std::size_t idx = vertices_.size() - 1;
  index_.emplace(std::move(key), idx);
  return idx;
}

std::optional<std::size_t> DagGraph::find(const std::string& tool, const std::string& variant,
                                          const std::string& port) const {
  auto it = index_.find(Key{tool, variant, port});
  if (it == index_.end()) return std::nullopt;
  return it->second;
}

bool DagGraph::has_edge(std::size_t a, std::size_t b) const {
  const auto& out = vertices_[a].out;
  return std::find(out.begin(), out.end(), b) != out.end();
}

bool DagGraph::add_edge(std::size_t a, std::size_t b) {
  if (has_edge(a, b)) return false;
  vertices_[a].out.push_back(b);
  vertices_[b].in.push_back(a);
  ++edge_count_;
  return true;
}

DagGraph build_graph(const DagDescription& d) {
  std::set<PortRef> defaults;
  for (const auto& dv : d.default_values) defaults.insert({dv.vertex, dv.input_port});
  auto input_kind = [&](const std::string& vertex, const std::string& port) {
    return defaults.count({vertex, port}) ? VertexKind::input_port_with_default : VertexKind::input_port;
  };

  DagGraph g;
  for (const auto& e : d.edges) {
    const std::size_t origin = g.intern(VertexKind::tool, e.from.vertex, "", "");
    const std::size_t variant = g.intern(VertexKind::output_variant, e.from.vertex, e.from.output_variant, "");
    const std::size_t out_port =
        g.intern(VertexKind::output_port, e.from.vertex, e.from.output_variant, e.from.output_port);
    const std::size_t dest = g.intern(VertexKind::tool, e.to.vertex, "", "");
    const std::size_t in_port =
        g.intern(input_kind(e.to.vertex, e.to.input_port), e.to.vertex, "", e.to.input_port);
    g.add_edge(origin, variant);
    g.add_edge(variant, out_port);
    g.add_edge(out_port, in_port);
    g.add_edge(in_port, dest);
  }
  for (const auto& ev : d.entry_vertices) {
    const std::size_t tool = g.intern(VertexKind::tool, ev.decl.name, "", "");
    for (const auto& port : ev.input_ports) {
      const std::size_t in_port = g.intern(input_kind(ev.decl.name, port), ev.decl.name, "", port);
      g.vertex(in_port).entry = true;
      g.add_edge(in_port, tool);
    }
  }
  return g;
}

std::optional<Error> validate(const DagGraph& graph) {
  uint64_t duration_ns = 0;
  std::optional<Error> result;
  {
    ScopeTimer timer(duration_ns);
    result = [&]() -> std::optional<Error> {
      if (!is_acyclic(graph)) {
        return make_error(ErrorCode::dag_cycle, "The provided graph contains one or more cycles.");
      }

      const auto& vs = graph.vertices();
      const bool has_entry = std::any_of(vs.begin(), vs.end(),
                                         [](const Vertex& v) { return v.is_input_port() && v.in.empty(); });
      if (!has_entry) {
        return make_error(ErrorCode::dag_no_entry_vertices, "The DAG has no entry vertices.");
      }

      for (const auto& v : vs) {
        if (v.kind == VertexKind::input_port_with_default && !v.in.empty()) {
          return make_error(ErrorCode::dag_default_has_incoming_edge,
                            "'" + v.label() + "' has a default value and therefore cannot have incoming edges.");
        }
      }

      if (auto err = check_layering(graph)) return err;

      for (std::size_t i = 0; i < vs.size(); ++i) {
        if (vs[i].kind != VertexKind::input_port || vs[i].in.size() < 2) continue;
        const long long acc = concurrency_balance(graph, ancestors_of(graph, i));
        if (acc != 0) {
          return make_error(ErrorCode::dag_concurrency_violated,
                            "Graph does not follow concurrency rules at '" + vs[i].label() +
                                "' (balance " + std::to_string(acc) + ").");
        }
      }
      return std::nullopt;
    }();
  }
  emit_validate(!result, result ? result->code : ErrorCode::none, dag_fingerprint(graph), duration_ns,
                result ? result->message : std::string());
  return result;
}

std::optional<Error> validate_dag_json(const std::string& text) {
  Error err;
  auto description = parse_dag_json(text, &err);
  if (!description) {
    emit_validate(false, err.code, "", 0, err.message);
    return err;
  }
  return validate(build_graph(*description));
}

std::string dag_fingerprint(const DagGraph& graph) {
  std::vector<std::string> vertex_lines;
  std::vector<std::string> edge_lines;
  for (const auto& v : graph.vertices()) {
    vertex_lines.push_back(to_string(v.kind) + "|" + v.label());
    for (std::size_t w : v.out) edge_lines.push_back(v.label() + "->" + graph.vertex(w).label());
  }
  std::sort(vertex_lines.begin(), vertex_lines.end());
  std::sort(edge_lines.begin(), edge_lines.end());
  std::ostringstream o;
  for (const auto& l : vertex_lines) o << "v " << l << "\n";
  for (const auto& l : edge_lines) o << "e " << l << "\n";
  return hash_domain("nexus.dag:", o.str());
}

}  // namespace nexus::dag
