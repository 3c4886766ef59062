#pragma once

#include <string_view>

#include <NGIN/Transform/Export.hpp>
#include <NGIN/Transform/Types.hpp>
#include <NGIN/Transform/Shape.hpp>
#include <NGIN/Transform/ShapeBuilder.hpp>
#include <NGIN/Transform/Inspector.hpp>
#include <NGIN/Transform/Matcher.hpp>
#include <NGIN/Transform/Derivation.hpp>
#include <NGIN/Transform/Executor.hpp>
#include <NGIN/Transform/Transformer.hpp>

namespace NGIN::Transform
{

    // For quick sanity checks / examples.
    [[nodiscard]] NGIN_TRANSFORM_API constexpr std::string_view LibraryName() noexcept { return "NGIN.Transform"; }

} // namespace NGIN::Transform
