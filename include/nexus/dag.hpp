#pragma once

// nexus/dag.hpp: Workflow DAG model and static validator.
//
// DESIGN:
//   DagDescription is the parsed JSON file. build_graph() turns it into a
//   DagGraph of five vertex kinds, identified by the composite name
//   (tool, variant, port) and owned by the graph. Edges are dense indices.
//
//   Layering:  InputPort[WithDefault] -> Tool -> OutputVariant -> OutputPort
//              -> InputPort
//
// INVARIANT (checked by validate(), in this order):
//   1. acyclic
//   2. at least one input port with no incoming edge (an entry port)
//   3. no InputPortWithDefault has an incoming edge
//   4. layering and fan-out: ports exactly 1 outgoing, variants >= 1
//   5. concurrency balance is exactly zero at every merge point
//
// Concurrency balance at a merge point M (an InputPort with >= 2 incoming
// edges), over the set S of M's ancestors:
//   acc = (#entry input ports without default in S) - 1
//   Tool t in S:       acc += max over variants v of t in S of
//                             (#output ports of v in S - 1), floored at 0, + 1
//   InputPort in S:    acc -= 1
// A forked branch that is never joined, or two branches racing into the same
// port, leaves acc != 0.

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "nexus/jsonlite.hpp"
#include "nexus/types.hpp"

namespace nexus::dag {

// ---------------------------------------------------------------------------
// Parsed description (JSON file format)
// ---------------------------------------------------------------------------
struct VertexDecl {
  std::string name;
  std::string variant;   // "off_chain" | "on_chain"
  std::string tool_fqn;
};

struct FromPort {
  std::string vertex;
  std::string output_variant;
  std::string output_port;
};

struct ToPort {
  std::string vertex;
  std::string input_port;
};

struct EdgeDecl {
  FromPort from;
  ToPort to;
};

// Entry vertices are declared apart from `vertices`; a name may not be both.
struct EntryVertex {
  VertexDecl decl;
  std::vector<std::string> input_ports;
};

struct DefaultValue {
  std::string vertex;
  std::string input_port;
  jsonlite::Value value;
};

struct EntryGroup {
  std::string name;
  std::vector<std::string> vertices;
};

struct DagDescription {
  std::vector<VertexDecl> vertices;
  std::vector<EdgeDecl> edges;
  std::vector<EntryVertex> entry_vertices;
  std::vector<DefaultValue> default_values;
  std::vector<EntryGroup> entry_groups;
};

// Parses the file format and runs the structural pre-checks (duplicate
// edges, entry bookkeeping). Failures are dag_invalid_definition.
std::optional<DagDescription> parse_dag_json(const std::string& text, Error* error = nullptr);
std::optional<Error> check_structure(const DagDescription& description);

// ---------------------------------------------------------------------------
// Graph
// ---------------------------------------------------------------------------
enum class VertexKind {
  input_port,
  input_port_with_default,
  tool,
  output_variant,
  output_port,
};

std::string to_string(VertexKind kind);

struct Vertex {
  VertexKind kind{VertexKind::tool};
  std::string tool;
  std::string variant;
  std::string port;
  bool entry{false};  // created from an entry_vertices declaration
  std::vector<std::size_t> out;
  std::vector<std::size_t> in;

  bool is_input_port() const {
    return kind == VertexKind::input_port || kind == VertexKind::input_port_with_default;
  }
  std::string label() const;
};

class DagGraph {
 public:
  // Returns the index of the vertex named (tool, variant, port), creating it
  // with `kind` on first sight. Empty variant/port mean "absent".
  std::size_t intern(VertexKind kind, const std::string& tool, const std::string& variant,
                     const std::string& port);
  std::optional<std::size_t> find(const std::string& tool, const std::string& variant,
                                  const std::string& port) const;

  // Adds a->b unless present. Returns false if the edge already existed.
  bool add_edge(std::size_t a, std::size_t b);
  bool has_edge(std::size_t a, std::size_t b) const;

  const std::vector<Vertex>& vertices() const { return vertices_; }
  const Vertex& vertex(std::size_t i) const { return vertices_[i]; }
  Vertex& vertex(std::size_t i) { return vertices_[i]; }
  std::size_t edge_count() const { return edge_count_; }

 private:
  using Key = std::tuple<std::string, std::string, std::string>;
  std::vector<Vertex> vertices_;
  std::map<Key, std::size_t> index_;
  std::size_t edge_count_{0};
};

DagGraph build_graph(const DagDescription& description);

std::optional<Error> validate(const DagGraph& graph);

// Parse + build + validate.
std::optional<Error> validate_dag_json(const std::string& text);

// BLAKE3 domain hash ("nexus.dag:") over a canonical listing of the graph.
std::string dag_fingerprint(const DagGraph& graph);

}  // namespace nexus::dag
