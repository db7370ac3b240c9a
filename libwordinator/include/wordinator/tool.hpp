// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef WORDINATOR_TOOL_HPP
#define WORDINATOR_TOOL_HPP

#include "tool/FileSink.hpp"
#include "tool/GenerateCommand.hpp"
#include "tool/GeneratorTool.hpp"
#include "tool/JsonConfigLoader.hpp"
#include "tool/ProgressReporter.hpp"

#endif // WORDINATOR_TOOL_HPP
