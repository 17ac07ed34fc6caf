// With the Catch2 backend, main() comes from Catch2::Catch2WithMain.
#if !defined(MATRICX_TEST_BACKEND_CATCH2)
  #include "minitest.h"

#include <string_view>

// Optional argument: only run tests whose name contains it.
int main(int argc, char** argv) {
  const std::string_view filter = (argc > 1 && argv[1]) ? std::string_view(argv[1]) : std::string_view();
  return ::matricx::minitest::runAll(filter);
}
#endif
