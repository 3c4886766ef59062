// Executor.hpp
// Walks a finished plan against a source value
#pragma once

#include <NGIN/Transform/Export.hpp>
#include <NGIN/Transform/PartialResult.hpp>
#include <NGIN/Transform/Plan.hpp>

namespace NGIN::Transform
{

  struct ExecutionOptions
  {
    // Stop at the first failing step instead of collecting every failure.
    bool failFast{false};
  };

  // `source` points at a value of plan.from; `root` at the value the transformer was called with.
  [[nodiscard]] NGIN_TRANSFORM_API PartialAny Execute(const TransformationPlan &plan,
                                                      const void *source,
                                                      const void *root,
                                                      const ExecutionOptions &options = {});

} // namespace NGIN::Transform
