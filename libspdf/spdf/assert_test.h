/*
 * Include this file to use assert in test code. This ensures that
 * NDEBUG is undefined so that a release build still checks the
 * assertions.
 */

#ifndef SPDF_ASSERT_TEST_H
#define SPDF_ASSERT_TEST_H

#ifdef NDEBUG
# undef NDEBUG
#endif
#include <assert.h>

#endif /* SPDF_ASSERT_TEST_H */
