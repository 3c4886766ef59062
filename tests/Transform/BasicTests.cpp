/// @file BasicTests.cpp
/// @brief Basic smoke tests for NGIN.Transform.

#include <catch2/catch_test_macros.hpp>
#include <NGIN/Transform/Transform.hpp>

TEST_CASE("LibraryNameReturnsModuleIdentifier", "[transform][Basics]") {
  CHECK(NGIN::Transform::LibraryName() == std::string_view{"NGIN.Transform"});
}
