// lola/ir/lowering.hpp - StreamGraph to IR conversion
#pragma once

#include "lola/ir/stream_ir.hpp"
#include "lola/sema/graph/stream_graph.hpp"

namespace lola
{

/**
 * Converts an analyzed StreamGraph to the IR.
 *
 * The graph must have passed every analysis without errors: types, pacings,
 * memory bounds, layers and the evaluation order are copied as they are.
 */
class IrLowering
{
public:
  [[nodiscard]] static ir::StreamIr lower(const StreamGraph & graph);

private:
  [[nodiscard]] static std::vector<StreamId> reachable_inputs(
    const StreamGraph & graph, StreamId from);
};

}  // namespace lola
