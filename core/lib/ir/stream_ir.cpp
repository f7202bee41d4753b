// lola/ir/stream_ir.cpp - Finalized intermediate representation
#include "lola/ir/stream_ir.hpp"

#include <algorithm>
#include <map>

namespace lola::ir
{

std::string_view to_string(FeatureFlag flag) noexcept
{
  switch (flag) {
    case FeatureFlag::DiscreteFutureOffset:
      return "DiscreteFutureOffset";
    case FeatureFlag::SlidingWindows:
      return "SlidingWindows";
    case FeatureFlag::Periodic:
      return "Periodic";
    case FeatureFlag::HoldAccess:
      return "HoldAccess";
  }
  return "?";
}

const InputStream * StreamIr::input(StreamId id) const
{
  const auto it = std::find_if(
    inputs.begin(), inputs.end(), [id](const InputStream & s) { return s.reference == id; });
  return it == inputs.end() ? nullptr : &*it;
}

const OutputStream * StreamIr::output(StreamId id) const
{
  const auto it = std::find_if(
    outputs.begin(), outputs.end(), [id](const OutputStream & s) { return s.reference == id; });
  return it == outputs.end() ? nullptr : &*it;
}

std::string_view StreamIr::name_of(StreamId id) const
{
  if (const auto * in = input(id)) return in->name;
  if (const auto * out = output(id)) return out->name;
  return {};
}

bool StreamIr::has_feature(FeatureFlag flag) const
{
  return std::find(feature_flags.begin(), feature_flags.end(), flag) != feature_flags.end();
}

std::vector<std::vector<StreamId>> StreamIr::event_driven_layers() const
{
  std::map<uint32_t, std::vector<StreamId>> by_layer;
  for (const auto & s : event_driven) {
    if (const auto * out = output(s.reference)) {
      by_layer[out->layer].push_back(s.reference);
    }
  }

  std::vector<std::vector<StreamId>> layers;
  layers.reserve(by_layer.size());
  for (auto & [layer, streams] : by_layer) {
    std::sort(streams.begin(), streams.end());
    layers.push_back(std::move(streams));
  }
  return layers;
}

}  // namespace lola::ir
