// Deactivate leak checks, boost log keeps its core alive until process exit.
extern "C" const char*
__asan_default_options() {
  return "detect_leaks=0";
}

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
