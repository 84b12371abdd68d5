/*
 *  Memory-mapped Key-Value (libmkv).
 *  Copyright 2016-2020 Leonid Yuriev <leo@yuriev.ru>
 *
 *  Licensed under the Apache License, Version 2.0 (the "License");
 *  you may not use this file except in compliance with the License.
 *  You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 *  Unless required by applicable law or agreed to in writing, software
 *  distributed under the License is distributed on an "AS IS" BASIS,
 *  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *  See the License for the specific language governing permissions and
 *  limitations under the License.
 */

/* Compiler-dependent helpers shared by the public headers and sources. */

#pragma once

#ifndef __has_attribute
#define __has_attribute(x) (0)
#endif

#ifndef __has_builtin
#define __has_builtin(x) (0)
#endif

#if !defined(__GNUC__) && !defined(__clang__)
#define __attribute__(x)
#endif

#ifndef likely
#if defined(__GNUC__) || __has_builtin(__builtin_expect)
#define likely(cond) __builtin_expect(!!(cond), 1)
#else
#define likely(x) (x)
#endif
#endif /* likely */

#ifndef unlikely
#if defined(__GNUC__) || __has_builtin(__builtin_expect)
#define unlikely(cond) __builtin_expect(!!(cond), 0)
#else
#define unlikely(x) (x)
#endif
#endif /* unlikely */

#ifndef __hot
#if defined(__OPTIMIZE__) && (defined(__GNUC__) || __has_attribute(hot))
#define __hot __attribute__((hot))
#else
#define __hot
#endif
#endif /* __hot */

#ifndef __cold
#if defined(__OPTIMIZE__) && (defined(__GNUC__) || __has_attribute(cold))
#define __cold __attribute__((cold))
#else
#define __cold
#endif
#endif /* __cold */

#ifndef __dll_export
#if defined(_WIN32) || defined(__CYGWIN__)
#define __dll_export __declspec(dllexport)
#elif defined(__GNUC__) || __has_attribute(visibility)
#define __dll_export __attribute__((visibility("default")))
#else
#define __dll_export
#endif
#endif /* __dll_export */

#ifndef __dll_import
#if defined(_WIN32) || defined(__CYGWIN__)
#define __dll_import __declspec(dllimport)
#else
#define __dll_import
#endif
#endif /* __dll_import */

#define MKV_ARRAY_LENGTH(array) (sizeof(array) / sizeof(array[0]))
