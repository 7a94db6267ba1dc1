// Copyright (c) 2025
#pragma once

#if defined(_WIN32)
#if defined(GAMEPLAYCLOCK_BUILDING_DLL)
#define GAMEPLAYCLOCK_API __declspec(dllexport)
#elif defined(GAMEPLAYCLOCK_SHARED)
#define GAMEPLAYCLOCK_API __declspec(dllimport)
#else
#define GAMEPLAYCLOCK_API
#endif
#else
#define GAMEPLAYCLOCK_API
#endif
