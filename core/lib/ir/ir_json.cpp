// lola/ir/ir_json.cpp - JSON dump of the IR
#include "lola/ir/ir_json.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

#include "lola/ir/schedule.hpp"
#include "lola/sema/types/type.hpp"

namespace lola
{

namespace
{

using json = nlohmann::json;

std::string type_name(const Type * type) { return type ? type->to_string() : "<unknown>"; }

json memory_to_json(const MemoryBound & m)
{
  json out{{"samples", m.samples}, {"futureValues", m.future_values}};
  out["duration"] = m.duration ? json(m.duration->to_string()) : json(nullptr);
  return out;
}

json names_to_json(const ir::StreamIr & ir, const std::vector<StreamId> & ids)
{
  json out = json::array();
  for (const StreamId id : ids) {
    out.push_back(std::string(ir.name_of(id)));
  }
  return out;
}

std::string pacing_to_string(const ir::StreamIr & ir, const Pacing & pacing)
{
  return pacing.to_string([&ir](uint32_t id) { return std::string(ir.name_of(id)); });
}

json window_to_json(const ir::StreamIr & ir, const ir::WindowReference & w)
{
  return json{
    {"index", w.index},
    {"target", std::string(ir.name_of(w.target))},
    {"caller", std::string(ir.name_of(w.caller))},
    {"duration", w.duration.to_string()},
    {"op", std::string(to_string(w.op))},
    {"type", type_name(w.type)},
  };
}

json schedule_to_json(const ir::StreamIr & ir)
{
  std::optional<ir::Schedule> schedule;
  try {
    schedule = ir::Schedule::from(ir);
  } catch (const std::length_error & e) {
    return json{{"error", e.what()}};
  }
  if (!schedule) return json(nullptr);

  json deadlines = json::array();
  for (const auto & d : schedule->deadlines) {
    deadlines.push_back(json{{"pause", d.pause.to_string()}, {"due", names_to_json(ir, d.due)}});
  }
  return json{
    {"gcd", schedule->gcd.to_string()},
    {"hyperPeriod", schedule->hyper_period.to_string()},
    {"deadlines", deadlines},
  };
}

}  // namespace

std::string IrJsonSerializer::serialize(const ir::StreamIr & ir, int indent)
{
  json out;

  out["inputs"] = json::array();
  for (const auto & in : ir.inputs) {
    out["inputs"].push_back(json{
      {"name", in.name},
      {"type", type_name(in.type)},
      {"pacing", pacing_to_string(ir, in.pacing)},
      {"memory", memory_to_json(in.memory)},
      {"layer", in.layer},
      {"dependents", names_to_json(ir, in.dependents)},
      {"windows", in.dependent_windows},
    });
  }

  out["outputs"] = json::array();
  for (const auto & o : ir.outputs) {
    json deps = json::array();
    for (const auto & d : o.dependencies) {
      deps.push_back(json{{"stream", std::string(ir.name_of(d.stream))}, {"offset", d.offset.to_string()}});
    }
    json item{
      {"name", o.name},
      {"type", type_name(o.type)},
      {"pacing", pacing_to_string(ir, o.pacing)},
      {"memory", memory_to_json(o.memory)},
      {"layer", o.layer},
      {"futureDependent", o.future_dependent},
      {"dependencies", deps},
      {"inputDependencies", names_to_json(ir, o.input_dependencies)},
      {"dependents", names_to_json(ir, o.dependents)},
      {"windows", o.dependent_windows},
    };
    item["trigger"] = o.trigger ? json(*o.trigger) : json(nullptr);
    out["outputs"].push_back(std::move(item));
  }

  out["timeDriven"] = json::array();
  for (const auto & t : ir.time_driven) {
    out["timeDriven"].push_back(json{
      {"stream", std::string(ir.name_of(t.reference))},
      {"frequency", t.frequency.to_string()},
      {"extendPeriod", t.extend_period.to_string()},
    });
  }

  out["eventDriven"] = json::array();
  for (const auto & e : ir.event_driven) {
    out["eventDriven"].push_back(json{
      {"stream", std::string(ir.name_of(e.reference))},
      {"activation", e.activation.to_string([&ir](uint32_t id) { return std::string(ir.name_of(id)); })},
    });
  }

  out["windows"] = json::array();
  for (const auto & w : ir.windows) {
    out["windows"].push_back(window_to_json(ir, w));
  }

  out["triggers"] = json::array();
  for (const auto & t : ir.triggers) {
    out["triggers"].push_back(
      json{{"stream", std::string(ir.name_of(t.reference))}, {"message", t.message}});
  }

  out["features"] = json::array();
  for (const auto flag : ir.feature_flags) {
    out["features"].push_back(std::string(ir::to_string(flag)));
  }

  out["evaluationOrder"] = names_to_json(ir, ir.evaluation_order);

  json layers = json::array();
  for (const auto & layer : ir.event_driven_layers()) {
    layers.push_back(names_to_json(ir, layer));
  }
  out["eventDrivenLayers"] = layers;

  out["schedule"] = schedule_to_json(ir);

  return out.dump(indent);
}

}  // namespace lola
