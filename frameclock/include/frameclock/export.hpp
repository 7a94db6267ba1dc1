// Copyright (c) 2025
#pragma once

#if defined(_WIN32)
#if defined(FRAMECLOCK_BUILDING_DLL)
#define FRAMECLOCK_API __declspec(dllexport)
#elif defined(FRAMECLOCK_SHARED)
#define FRAMECLOCK_API __declspec(dllimport)
#else
#define FRAMECLOCK_API
#endif
#else
#define FRAMECLOCK_API
#endif
