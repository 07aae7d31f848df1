/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include <stdio.h>
#include <stdlib.h>

#include "src/main/tools/chroot-manager-options.h"
#include "src/main/tools/chroot-manager.h"

int main(int argc, char *argv[]) {
  Options opt;
  ParseResult parsed = ParseOptions(argc, argv, &opt);
  if (parsed == PARSE_ERROR) {
    return EXIT_FAILURE;
  }
  if (parsed == PARSE_EXIT_SUCCESS) {
    if (opt.print_version) {
      printf("chroot-manager version %s\n", build_version);
    }
    return EXIT_SUCCESS;
  }
  return ChrootMgrMain(opt);
}
