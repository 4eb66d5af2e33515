/*
 * Include this file to use assert in test code. This will allow the use of assert and ensure that
 * NDEBUG is undefined (which would cause spurious passes).
 */

#ifndef DOCSIFT_ASSERT_TEST_H
#define DOCSIFT_ASSERT_TEST_H

#ifdef NDEBUG
# undef NDEBUG
#endif
#include <assert.h>

#endif /* DOCSIFT_ASSERT_TEST_H */
