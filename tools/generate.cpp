// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#include <wordinator/tool/GenerateCommand.hpp>

#include "wordinator/config.hpp"

int main(int argc, char **argv) {
  return wordinator::tool::generate_main(argc, argv, WORDINATOR_STRFY(WORDINATOR_VERSION));
}
