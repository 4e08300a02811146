#pragma once

#if defined(_WIN32)
#if defined(REFPOOL_BUILD_DLL)
#define REFPOOL_API __declspec(dllexport)
#elif defined(REFPOOL_USE_DLL)
#define REFPOOL_API __declspec(dllimport)
#else
#define REFPOOL_API
#endif
#else
#define REFPOOL_API
#endif
