#ifndef __PT_TEST_HEADERS__
#define __PT_TEST_HEADERS__

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "Headers.hpp"

#endif  // __PT_TEST_HEADERS__
