#include <matricx/version.h>

#include "test_framework.h"

#include <string>

TEST_CASE("Generated version header is present") {
  REQUIRE(std::string(MATRICX_VERSION).size() > 0);
  REQUIRE(MATRICX_VERSION_MAJOR >= 0);
}
