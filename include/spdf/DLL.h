/* Copyright (c) 2024-2026 The spdf authors
 *
 * This file is part of spdf.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef SPDF_DLL_H
#define SPDF_DLL_H

#define SPDF_MAJOR_VERSION 1
#define SPDF_MINOR_VERSION 0
#define SPDF_PATCH_VERSION 0
#define SPDF_VERSION "1.0.0"

/*
 * SPDF_DLL marks functions and methods that belong to the public ABI,
 * SPDF_DLL_CLASS marks classes whose type information must be visible
 * outside the library (exceptions, classes meant to be subclassed or
 * used with dynamic_cast), and SPDF_DLL_PRIVATE hides members of an
 * exported class. On Windows, libspdf_EXPORTS is defined only while
 * building the library itself.
 */

#if defined _WIN32 || defined __CYGWIN__
# ifdef libspdf_EXPORTS
#  define SPDF_DLL __declspec(dllexport)
# else
#  define SPDF_DLL
# endif
# define SPDF_DLL_PRIVATE
#elif defined __GNUC__
# define SPDF_DLL __attribute__((visibility("default")))
# define SPDF_DLL_PRIVATE __attribute__((visibility("hidden")))
#else
# define SPDF_DLL
# define SPDF_DLL_PRIVATE
#endif
#ifdef __GNUC__
# define SPDF_DLL_CLASS SPDF_DLL
#else
# define SPDF_DLL_CLASS
#endif

#endif /* SPDF_DLL_H */
