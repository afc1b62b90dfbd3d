#ifndef OVERFLOW_OPERATIONS_H
#define OVERFLOW_OPERATIONS_H

#include "core.h"

template<typename Int>
struct operation_result_t
{
	Int result;
	bool overflowed;
};

template<typename Result = uint64_t>
operation_result_t<Result> mul_overflow(uint64_t a, uint64_t b)
{
	Result result;
	auto const overflowed = __builtin_mul_overflow(a, b, &result);
	return { result, overflowed };
}

// offsets never go below zero
inline uint64_t sub_saturating(uint64_t a, uint64_t b)
{
	uint64_t result;
	auto const overflowed = __builtin_sub_overflow(a, b, &result);
	return overflowed ? 0 : result;
}

#endif // OVERFLOW_OPERATIONS_H
