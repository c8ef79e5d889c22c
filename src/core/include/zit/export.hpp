/* SPDX-FileCopyrightText: 2025 zit Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#if defined(_WIN32)
#if defined(ZIT_CORE_EXPORTS)
#define ZIT_CORE_API __declspec(dllexport)
#elif defined(ZIT_CORE_SHARED)
#define ZIT_CORE_API __declspec(dllimport)
#else
#define ZIT_CORE_API
#endif
#else
#define ZIT_CORE_API __attribute__((visibility("default")))
#endif

#define ZIT_LOGGER_API ZIT_CORE_API
