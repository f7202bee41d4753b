// lola/sema/graph/stream_graph.hpp - Stream dependency graph
//
// Streams live in an arena addressed by StreamId; references (edges) are kept
// in a separate vector with per-stream adjacency lists. The structure is
// frozen after lowering; later passes only refine per-stream fields.
//
#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "lola/ast/ast.hpp"
#include "lola/basic/rational.hpp"
#include "lola/sema/pacing/pacing.hpp"
#include "lola/sema/unify/unifier.hpp"

namespace lola
{

struct Type;

using StreamId = uint32_t;
using EdgeId = uint32_t;

inline constexpr StreamId k_invalid_stream = k_unresolved_stream;

enum class StreamKind : uint8_t {
  Input,
  Output,
  Trigger,
};

[[nodiscard]] std::string_view to_string(StreamKind kind) noexcept;

// ============================================================================
// Offset
// ============================================================================

enum class OffsetKind : uint8_t {
  Current,    ///< synchronous access
  Lookback,   ///< n values in the past, n > 0
  Lookahead,  ///< n values in the future, n > 0
  Window,     ///< aggregation over a trailing duration
};

/**
 * Temporal offset of a reference.
 *
 * A sample-and-hold access is a Current offset with `hold` set: it reads the
 * latest value without synchronizing with the accessed stream.
 */
struct Offset
{
  OffsetKind kind = OffsetKind::Current;

  /// Lookback / Lookahead distance
  uint32_t amount = 0;

  /// Window duration in seconds
  Rational duration;

  /// Window aggregation
  WindowOp op = WindowOp::Sum;

  bool hold = false;

  /// Largest lookback / lookahead distance; one more slot must still fit a
  /// MemoryBound.
  static constexpr uint32_t k_max_amount = std::numeric_limits<uint32_t>::max() - 1;

  [[nodiscard]] static Offset current() { return Offset{}; }
  /// Lookback(0) is the current value.
  [[nodiscard]] static Offset lookback(uint32_t n);
  [[nodiscard]] static Offset lookahead(uint32_t n);
  [[nodiscard]] static Offset window(Rational seconds, WindowOp op);
  [[nodiscard]] static Offset sample_and_hold();

  [[nodiscard]] bool is_current() const noexcept { return kind == OffsetKind::Current; }
  [[nodiscard]] bool is_lookback() const noexcept { return kind == OffsetKind::Lookback; }
  [[nodiscard]] bool is_lookahead() const noexcept { return kind == OffsetKind::Lookahead; }
  [[nodiscard]] bool is_window() const noexcept { return kind == OffsetKind::Window; }

  /// Synchronous access that ties the accessing clock to the accessed one
  [[nodiscard]] bool constrains_pacing() const noexcept { return is_current() && !hold; }

  /// The accessed value must be computed earlier in the same cycle
  [[nodiscard]] bool orders_evaluation() const noexcept { return is_current(); }

  /// Only positive lookbacks and windows may close a dependency cycle
  [[nodiscard]] bool breaks_cycles() const noexcept { return is_lookback() || is_window(); }

  /// "current", "lookback(2)", "window(5s, sum)", "hold"
  [[nodiscard]] std::string to_string() const;

  bool operator==(const Offset & o) const noexcept
  {
    return kind == o.kind && amount == o.amount && duration == o.duration && op == o.op &&
           hold == o.hold;
  }
};

// ============================================================================
// Reference
// ============================================================================

/// `target`'s expression reads `source` at `offset`.
struct Reference
{
  StreamId source = k_invalid_stream;  ///< accessed stream
  StreamId target = k_invalid_stream;  ///< accessing stream
  Offset offset;
  SourceRange range;
  const Expr * expr = nullptr;
};

// ============================================================================
// Memory Bound
// ============================================================================

/**
 * Storage a runtime must reserve for a stream.
 *
 * `samples` counts retained values including the current one. Windows read
 * by event-driven streams cannot be converted to a sample count and keep
 * their wall-clock duration instead.
 */
struct MemoryBound
{
  uint32_t samples = 0;

  /// Longest window over this stream evaluated on an event-driven clock
  std::optional<Rational> duration;

  /// Values that must be buffered for lookahead access
  uint32_t future_values = 0;

  [[nodiscard]] bool is_unbounded_by_samples() const noexcept { return duration.has_value(); }

  /// "5", "3 + 2.5s", "1 (+2 future)"
  [[nodiscard]] std::string to_string() const;

  bool operator==(const MemoryBound & o) const noexcept
  {
    return samples == o.samples && duration == o.duration && future_values == o.future_values;
  }
};

// ============================================================================
// Stream
// ============================================================================

/**
 * One node of the stream graph: an input, an output or a trigger.
 *
 * The fields above "Refined by analysis" are set by the StreamGraphBuilder
 * and never change afterwards. The type checker, pacing analyzer and graph
 * analyzer each fill in their own result fields; a field whose pass has not
 * run yet keeps its default (null type, Unknown pacing, zero memory).
 */
struct Stream
{
  StreamId id = k_invalid_stream;
  std::string name;
  StreamKind kind = StreamKind::Input;

  /// Declaring AST node (owned by the AstContext)
  const Decl * decl = nullptr;

  /// Output expression or trigger condition; null for inputs.
  /// Analysis passes annotate it (Expr::resolvedType).
  Expr * expr = nullptr;

  const TypeNode * declared_type = nullptr;
  const PacingNode * declared_pacing = nullptr;

  /// Trigger message
  std::string message;

  /// Unifier keys; the unifiers are owned by their passes
  VarId type_var = k_no_var;
  VarId pacing_var = k_no_var;

  // Refined by analysis
  const Type * type = nullptr;
  Pacing pacing;
  MemoryBound memory;
  uint32_t layer = 0;
  bool future_dependent = false;

  [[nodiscard]] bool is_input() const noexcept { return kind == StreamKind::Input; }
  [[nodiscard]] bool is_output() const noexcept { return kind == StreamKind::Output; }
  [[nodiscard]] bool is_trigger() const noexcept { return kind == StreamKind::Trigger; }
};

// ============================================================================
// Stream Graph
// ============================================================================

/**
 * Arena of streams and the references between them.
 *
 * Streams are numbered densely in declaration order and references in
 * insertion order, so ids double as deterministic tie-breakers for every
 * later pass. Structural edits are only allowed until freeze().
 *
 * Example:
 * @code
 *   StreamGraph graph;
 *   Stream a;
 *   a.name = "a";
 *   const StreamId in = graph.add_stream(std::move(a));
 *   Stream b;
 *   b.name = "b";
 *   b.kind = StreamKind::Output;
 *   const StreamId out = graph.add_stream(std::move(b));
 *
 *   Reference ref;
 *   ref.source = in;   // b reads a
 *   ref.target = out;
 *   ref.offset = Offset::lookback(1);
 *   graph.add_reference(ref);
 *   graph.freeze();
 *
 *   graph.dependencies_of(out);  // {0}
 * @endcode
 */
class StreamGraph
{
public:
  StreamGraph() = default;

  StreamGraph(const StreamGraph &) = delete;
  StreamGraph & operator=(const StreamGraph &) = delete;
  StreamGraph(StreamGraph &&) = default;
  StreamGraph & operator=(StreamGraph &&) = default;

  // ===========================================================================
  // Construction
  // ===========================================================================

  /**
   * Add a stream and assign it the next id.
   *
   * @param stream Stream to store; its `id` field is overwritten
   * @return Id of the new stream (equal to the previous stream_count())
   * @throws std::logic_error after freeze() or on a duplicate name
   */
  StreamId add_stream(Stream stream);

  /**
   * Add a reference between two existing streams.
   *
   * The edge is appended to the dependency list of `ref.target` and the
   * dependent list of `ref.source`.
   *
   * @param ref Edge to store; both endpoints must already exist
   * @return Id of the new edge
   * @throws std::logic_error after freeze() or if an endpoint is unknown
   */
  EdgeId add_reference(Reference ref);

  /// End structural construction.
  void freeze() noexcept { frozen_ = true; }
  [[nodiscard]] bool is_frozen() const noexcept { return frozen_; }

  // ===========================================================================
  // Queries
  // ===========================================================================

  [[nodiscard]] size_t stream_count() const noexcept { return streams_.size(); }
  [[nodiscard]] size_t reference_count() const noexcept { return references_.size(); }

  [[nodiscard]] Stream & stream(StreamId id) { return streams_.at(id); }
  [[nodiscard]] const Stream & stream(StreamId id) const { return streams_.at(id); }

  [[nodiscard]] std::vector<Stream> & streams() noexcept { return streams_; }
  [[nodiscard]] const std::vector<Stream> & streams() const noexcept { return streams_; }

  [[nodiscard]] const Reference & reference(EdgeId id) const { return references_.at(id); }
  [[nodiscard]] const std::vector<Reference> & references() const noexcept
  {
    return references_;
  }

  /// Edges whose target is `id` (what `id` reads), in insertion order
  [[nodiscard]] const std::vector<EdgeId> & dependencies_of(StreamId id) const
  {
    return incoming_.at(id);
  }

  /// Edges whose source is `id` (who reads `id`), in insertion order
  [[nodiscard]] const std::vector<EdgeId> & dependents_of(StreamId id) const
  {
    return outgoing_.at(id);
  }

  /**
   * Look up a stream by name.
   *
   * @param name Declared name, or the synthetic "trigger_N" of a trigger
   * @return The stream id, or std::nullopt if no stream has this name
   */
  [[nodiscard]] std::optional<StreamId> find(std::string_view name) const;

  [[nodiscard]] std::vector<StreamId> inputs() const { return of_kind(StreamKind::Input); }
  [[nodiscard]] std::vector<StreamId> outputs() const { return of_kind(StreamKind::Output); }
  [[nodiscard]] std::vector<StreamId> triggers() const { return of_kind(StreamKind::Trigger); }

  [[nodiscard]] std::string_view name_of(StreamId id) const { return streams_.at(id).name; }

  // ===========================================================================
  // Evaluation Order
  // ===========================================================================

  /// Global evaluation order; empty until the graph analyzer succeeds
  [[nodiscard]] const std::vector<StreamId> & evaluation_order() const noexcept
  {
    return evaluationOrder_;
  }

  /**
   * Replace the evaluation order.
   *
   * @param order Every stream id exactly once; accessed streams first
   */
  void set_evaluation_order(std::vector<StreamId> order) { evaluationOrder_ = std::move(order); }

private:
  [[nodiscard]] std::vector<StreamId> of_kind(StreamKind kind) const;

  std::vector<Stream> streams_;
  std::vector<Reference> references_;
  std::vector<std::vector<EdgeId>> incoming_;
  std::vector<std::vector<EdgeId>> outgoing_;
  std::unordered_map<std::string, StreamId> byName_;
  std::vector<StreamId> evaluationOrder_;
  bool frozen_ = false;
};

}  // namespace lola
