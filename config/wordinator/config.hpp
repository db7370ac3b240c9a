// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef WORDINATOR_VERSION
#define WORDINATOR_VERSION 0.0 (unknown)
#endif

#define WORDINATOR_STRFY_INTERNAL(MACRO) #MACRO
#define WORDINATOR_STRFY(MACRO) WORDINATOR_STRFY_INTERNAL(MACRO)
