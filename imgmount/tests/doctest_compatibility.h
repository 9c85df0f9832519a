#ifndef DOCTEST_COMPATIBILITY
#define DOCTEST_COMPATIBILITY

#include <doctest/doctest.h>

// Catch doesn't require a semicolon after CAPTURE but doctest does
#undef CAPTURE
#define CAPTURE(x) DOCTEST_CAPTURE(x);

// Sections from Catch are called Subcases in doctest
#define SECTION(x) DOCTEST_SUBCASE(x)

#endif  // DOCTEST_COMPATIBILITY
