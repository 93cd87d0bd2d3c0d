#ifndef QSTORE_ASSERT_H
#define QSTORE_ASSERT_H


// always check asserts, except where project logic dictates otherwise
#ifdef NDEBUG
#undef NDEBUG
#define QSTORE_UNDEF_NDEBUG
#endif
#include <cassert>
#ifdef QSTORE_UNDEF_NDEBUG
#define NDEBUG
#undef QSTORE_UNDEF_NDEBUG
#endif


/*
* These checks guard conditions which can only fail if the
* library itself is faulty (for example, the planner emitting
* a descriptor that does not match its case). Errors which a
* caller or an executor can cause are reported with the
* exceptions in `qstore_errors.h` instead.
* Each group can be disabled independently.
*/


// #define QSTORE_DISABLE_ALL_CHECKS


#ifdef QSTORE_DISABLE_ALL_CHECKS
#define QSTORE_DISABLE_CHECK_PRECOND
#define QSTORE_DISABLE_CHECK_POSTCOND
#define QSTORE_DISABLE_CHECK_INVARIANT
#endif


#ifndef QSTORE_DISABLE_CHECK_PRECOND
#define QSTORE_CHECK_PRECOND(expr) assert(expr)
#define QSTORE_CHECKING_PRECONDS
#else
#define QSTORE_CHECK_PRECOND(expr) ((void)0)
#endif


#ifndef QSTORE_DISABLE_CHECK_POSTCOND
#define QSTORE_CHECK_POSTCOND(expr) assert(expr)
#define QSTORE_CHECKING_POSTCONDS
#else
#define QSTORE_CHECK_POSTCOND(expr) ((void)0)
#endif


#ifndef QSTORE_DISABLE_CHECK_INVARIANT
#define QSTORE_CHECK_INVARIANT(expr) assert(expr)
#define QSTORE_CHECKING_INVARIANTS
#else
#define QSTORE_CHECK_INVARIANT(expr) ((void)0)
#endif


#endif  // QSTORE_ASSERT_H
