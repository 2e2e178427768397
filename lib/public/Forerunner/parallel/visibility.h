#pragma once

#include <StormByte/platform.h>

#ifdef WINDOWS
	#ifdef Forerunner_Parallel_EXPORTS
		#define FORERUNNER_PARALLEL_PUBLIC	__declspec(dllexport)
	#else
		#define FORERUNNER_PARALLEL_PUBLIC	__declspec(dllimport)
	#endif
	#define FORERUNNER_PARALLEL_PRIVATE
#else
	#define FORERUNNER_PARALLEL_PUBLIC		__attribute__ ((visibility ("default")))
	#define FORERUNNER_PARALLEL_PRIVATE	__attribute__ ((visibility ("hidden")))
#endif
