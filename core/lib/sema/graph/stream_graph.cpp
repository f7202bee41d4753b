// lola/sema/graph/stream_graph.cpp - Stream dependency graph
#include "lola/sema/graph/stream_graph.hpp"

#include <stdexcept>
#include <utility>

namespace lola
{

std::string_view to_string(StreamKind kind) noexcept
{
  switch (kind) {
    case StreamKind::Input:
      return "input";
    case StreamKind::Output:
      return "output";
    case StreamKind::Trigger:
      return "trigger";
  }
  return "?";
}

// ============================================================================
// Offset
// ============================================================================

Offset Offset::lookback(uint32_t n)
{
  Offset o;
  if (n > 0) {
    o.kind = OffsetKind::Lookback;
    o.amount = n;
  }
  return o;
}

Offset Offset::lookahead(uint32_t n)
{
  Offset o;
  if (n > 0) {
    o.kind = OffsetKind::Lookahead;
    o.amount = n;
  }
  return o;
}

Offset Offset::window(Rational seconds, WindowOp op)
{
  Offset o;
  o.kind = OffsetKind::Window;
  o.duration = seconds;
  o.op = op;
  return o;
}

Offset Offset::sample_and_hold()
{
  Offset o;
  o.hold = true;
  return o;
}

std::string Offset::to_string() const
{
  switch (kind) {
    case OffsetKind::Current:
      return hold ? "hold" : "current";
    case OffsetKind::Lookback:
      return "lookback(" + std::to_string(amount) + ")";
    case OffsetKind::Lookahead:
      return "lookahead(" + std::to_string(amount) + ")";
    case OffsetKind::Window:
      return "window(" + duration.to_string() + "s, " + std::string(lola::to_string(op)) + ")";
  }
  return "?";
}

// ============================================================================
// MemoryBound
// ============================================================================

std::string MemoryBound::to_string() const
{
  std::string s = std::to_string(samples);
  if (duration) {
    s += " + " + duration->to_string() + "s";
  }
  if (future_values > 0) {
    s += " (+" + std::to_string(future_values) + " future)";
  }
  return s;
}

// ============================================================================
// StreamGraph
// ============================================================================

StreamId StreamGraph::add_stream(Stream stream)
{
  if (frozen_) {
    throw std::logic_error("StreamGraph: cannot add a stream after freeze()");
  }
  const auto id = static_cast<StreamId>(streams_.size());
  if (!byName_.emplace(stream.name, id).second) {
    throw std::logic_error("StreamGraph: duplicate stream name '" + stream.name + "'");
  }
  stream.id = id;
  streams_.push_back(std::move(stream));
  incoming_.emplace_back();
  outgoing_.emplace_back();
  return id;
}

EdgeId StreamGraph::add_reference(Reference ref)
{
  if (frozen_) {
    throw std::logic_error("StreamGraph: cannot add a reference after freeze()");
  }
  if (ref.source >= streams_.size() || ref.target >= streams_.size()) {
    throw std::logic_error("StreamGraph: reference endpoint is not a stream of this graph");
  }
  const auto id = static_cast<EdgeId>(references_.size());
  outgoing_[ref.source].push_back(id);
  incoming_[ref.target].push_back(id);
  references_.push_back(std::move(ref));
  return id;
}

std::optional<StreamId> StreamGraph::find(std::string_view name) const
{
  const auto it = byName_.find(std::string(name));
  if (it == byName_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<StreamId> StreamGraph::of_kind(StreamKind kind) const
{
  std::vector<StreamId> ids;
  for (const auto & s : streams_) {
    if (s.kind == kind) {
      ids.push_back(s.id);
    }
  }
  return ids;
}

}  // namespace lola
