/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "ak_time.h"

BEGIN_NAMESPACE_AK

// Wall-clock time, including time spent waiting on I/O
ticks_t ticks()
{
	timespec ts;
	clock_gettime(CLOCK_MONOTONIC, &ts);
	return (ticks_t)ts.tv_sec * 1000000000LL + ts.tv_nsec;
}

ticks_t tickrate() { return 1000000000LL; }

double duration(ticks_t ticks)
{
	return (double)ticks / tickrate();
}

END_NAMESPACE_AK
