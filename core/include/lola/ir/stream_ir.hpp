// lola/ir/stream_ir.hpp - Finalized intermediate representation
//
// Produced from a fully analyzed StreamGraph by IrLowering. Stream
// references are StreamGraph ids; every list is ordered by id unless noted.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lola/ast/ast_enums.hpp"
#include "lola/basic/rational.hpp"
#include "lola/sema/graph/stream_graph.hpp"
#include "lola/sema/pacing/pacing.hpp"

namespace lola
{
struct Type;
}

namespace lola::ir
{

enum class FeatureFlag : uint8_t {
  DiscreteFutureOffset,  ///< some stream is accessed with a lookahead
  SlidingWindows,
  Periodic,  ///< some stream is time-driven
  HoldAccess,
};

[[nodiscard]] std::string_view to_string(FeatureFlag flag) noexcept;

/// One access of another stream
struct Dependency
{
  StreamId stream;
  Offset offset;
};

struct WindowReference
{
  uint32_t index = 0;
  StreamId target = k_invalid_stream;  ///< aggregated stream
  StreamId caller = k_invalid_stream;  ///< stream evaluating the window
  Rational duration;                   ///< seconds
  WindowOp op = WindowOp::Sum;
  const Type * type = nullptr;  ///< result type of the aggregation
};

struct InputStream
{
  StreamId reference = k_invalid_stream;
  std::string name;
  const Type * type = nullptr;
  Pacing pacing;
  MemoryBound memory;
  uint32_t layer = 0;
  std::vector<StreamId> dependents;
  std::vector<uint32_t> dependent_windows;
};

/// Output stream; triggers are outputs with a trigger index.
struct OutputStream
{
  StreamId reference = k_invalid_stream;
  std::string name;
  const Type * type = nullptr;
  Pacing pacing;
  MemoryBound memory;
  uint32_t layer = 0;
  bool future_dependent = false;

  /// Direct accesses, in expression order
  std::vector<Dependency> dependencies;

  /// Inputs reachable through any chain of accesses
  std::vector<StreamId> input_dependencies;

  std::vector<StreamId> dependents;
  std::vector<uint32_t> dependent_windows;

  std::optional<uint32_t> trigger;
};

struct TimeDrivenStream
{
  StreamId reference = k_invalid_stream;
  Rational frequency;      ///< Hz
  Rational extend_period;  ///< 1 / frequency, seconds
};

struct EventDrivenStream
{
  StreamId reference = k_invalid_stream;
  ActivationCondition activation;
};

struct Trigger
{
  StreamId reference = k_invalid_stream;
  std::string message;
};

struct StreamIr
{
  std::vector<InputStream> inputs;
  std::vector<OutputStream> outputs;
  std::vector<TimeDrivenStream> time_driven;
  std::vector<EventDrivenStream> event_driven;
  std::vector<WindowReference> windows;
  std::vector<Trigger> triggers;
  std::vector<FeatureFlag> feature_flags;

  /// All streams, accessed streams before accessors
  std::vector<StreamId> evaluation_order;

  [[nodiscard]] const InputStream * input(StreamId id) const;
  [[nodiscard]] const OutputStream * output(StreamId id) const;

  /// Name of an input or output; empty for unknown ids.
  [[nodiscard]] std::string_view name_of(StreamId id) const;

  [[nodiscard]] bool has_feature(FeatureFlag flag) const;

  /**
   * Event-driven outputs grouped by evaluation layer, lowest layer first.
   *
   * Layers without event-driven streams are skipped; streams within a layer
   * are ordered by id.
   */
  [[nodiscard]] std::vector<std::vector<StreamId>> event_driven_layers() const;
};

}  // namespace lola::ir
