/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "util.h"
#include <cstdlib>

BEGIN_NAMESPACE_AK

bool is_verbose()
{
	return getenv("ALIGNKIT_QUIET") == nullptr;
}

END_NAMESPACE_AK
