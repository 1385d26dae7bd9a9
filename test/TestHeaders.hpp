#ifndef __TS_TEST_HEADERS__
#define __TS_TEST_HEADERS__

#include "Headers.hpp"

#include <catch2/catch_all.hpp>

#endif  // __TS_TEST_HEADERS__
