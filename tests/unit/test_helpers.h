#pragma once

#include <doctest/doctest.h>

#define PE_TEST(suite, name) TEST_CASE(name)
#define PE_CHECK(...) CHECK(__VA_ARGS__)
