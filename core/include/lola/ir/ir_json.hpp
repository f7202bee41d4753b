// lola/ir/ir_json.hpp - JSON dump of the IR
#pragma once

#include <string>

#include "lola/ir/stream_ir.hpp"

namespace lola
{

/**
 * Serialize the IR (and the schedule of its time-driven streams) to JSON.
 *
 * The dump is meant for inspection and golden tests; nothing reads it back.
 * Keys are camelCase; stream references are written as names. Rationals are
 * written as strings ("1/10") so no precision is lost.
 */
class IrJsonSerializer
{
public:
  [[nodiscard]] static std::string serialize(const ir::StreamIr & ir, int indent = 2);
};

}  // namespace lola
