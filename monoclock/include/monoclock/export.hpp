// Copyright (c) 2025 The monoclock Authors
#pragma once

#if defined(_WIN32) || defined(__CYGWIN__)
#if defined(MONOCLOCK_BUILDING_DLL)
#define MONOCLOCK_API __declspec(dllexport)
#elif defined(MONOCLOCK_SHARED)
#define MONOCLOCK_API __declspec(dllimport)
#else
#define MONOCLOCK_API
#endif
#else
#define MONOCLOCK_API
#endif
