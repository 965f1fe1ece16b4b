#pragma once
#include <cassert>

// Simple assert wrapper.
// Checks only invariants of in-memory structures, never input data.
#ifdef DEBUG
#define CV_ASSERT(x) \
	{ assert(x); }
#else
#define CV_ASSERT(x) { (void)(x); }
#endif
