// Derivation.hpp
// Engine entry: synthesize a TransformationPlan for (From, To) or report why none exists
#pragma once

#include <NGIN/Transform/Export.hpp>
#include <NGIN/Transform/Failure.hpp>
#include <NGIN/Transform/Override.hpp>
#include <NGIN/Transform/Plan.hpp>

#include <expected>

namespace NGIN::Transform
{

  using DerivationResult = std::expected<PlanPtr, DerivationFailure>;

  // Runs one derivation session. All problems are collected; nothing is thrown.
  [[nodiscard]] NGIN_TRANSFORM_API DerivationResult Derive(const TypeRef &from,
                                                           const TypeRef &to,
                                                           const OverrideRegistry &overrides,
                                                           DerivationMode mode,
                                                           const TransformerFlags &flags = {});

} // namespace NGIN::Transform
