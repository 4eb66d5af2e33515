// Copyright (c) 2026 The docsift authors
//
// This file is part of docsift.
//
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except
// in compliance with the License. You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software distributed under the License
// is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express
// or implied. See the License for the specific language governing permissions and limitations under
// the License.

#ifndef DOCSIFT_DLL_HH
#define DOCSIFT_DLL_HH

#define DOCSIFT_MAJOR_VERSION 1
#define DOCSIFT_MINOR_VERSION 0
#define DOCSIFT_PATCH_VERSION 0
#define DOCSIFT_VERSION "1.0.0"

/*
 * DOCSIFT_DLL marks functions and methods that are part of the public ABI, DOCSIFT_DLL_CLASS marks
 * classes whose runtime type information must be exported (anything thrown, inherited from across
 * the library boundary, or used with dynamic_cast), and DOCSIFT_DLL_PRIVATE unexports private
 * members of exported classes. The library is built with hidden visibility by default.
 */

#if defined _WIN32 || defined __CYGWIN__
# ifdef libdocsift_EXPORTS
#  define DOCSIFT_DLL __declspec(dllexport)
# else
#  define DOCSIFT_DLL
# endif
# define DOCSIFT_DLL_PRIVATE
#elif defined __GNUC__
# define DOCSIFT_DLL __attribute__((visibility("default")))
# define DOCSIFT_DLL_PRIVATE __attribute__((visibility("hidden")))
#else
# define DOCSIFT_DLL
# define DOCSIFT_DLL_PRIVATE
#endif
#ifdef __GNUC__
# define DOCSIFT_DLL_CLASS DOCSIFT_DLL
#else
# define DOCSIFT_DLL_CLASS
#endif

#endif /* DOCSIFT_DLL_HH */
