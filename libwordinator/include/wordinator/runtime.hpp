// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef WORDINATOR_RUNTIME_HPP
#define WORDINATOR_RUNTIME_HPP

#include "runtime/Config.hpp"
#include "runtime/Counter.hpp"
#include "runtime/Duplicates.hpp"
#include "runtime/Generator.hpp"
#include "runtime/Listener.hpp"
#include "runtime/Odometer.hpp"
#include "runtime/Pattern.hpp"
#include "runtime/Sink.hpp"

#endif // WORDINATOR_RUNTIME_HPP
