/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#ifndef __ALIGN_KIT_TIME_H__
#define __ALIGN_KIT_TIME_H__

#include "defines.h"
#include <ctime>

BEGIN_NAMESPACE_AK

using ticks_t = long long;
ticks_t ticks();     // monotonic, in nanoseconds
ticks_t tickrate();  // ticks per second
double  duration(ticks_t ticks);

///////////////////////////////////////////

class stopwatch_t {
public:
	INLINE void tic()  { _tic = ticks(); }
	INLINE void toc()  { _toc = ticks(); }
	INLINE double duration() const { return ak::duration(_toc-_tic); }

private:
	ticks_t _tic{};
	ticks_t _toc{};
};

END_NAMESPACE_AK

#endif // __ALIGN_KIT_TIME_H__
