/**
 * @file test_main.cpp
 * @brief Catch2 runner for the apiscout unit tests
 *
 * Live tests against the fixture server are tagged [.live] and only run
 * when selected explicitly: apiscout_tests "[live]"
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
