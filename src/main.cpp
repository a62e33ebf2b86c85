 /**
  * @file    main.cpp
  * @brief   Structure Mask Tool - CLI Entry Point
  * @author  AllenK (Kwyshell)
  * @date    2025.12.13
  * @license MIT
  *
  * @details
  * Preprocessing stage for optical chemical structure recognition.
  * Splits a page image into:
  *   - structure mask : regions depicting chemical structures
  *   - exclusion mask : noise lines (table borders, underlines, arrow shafts)
  * and optionally per-region seed points for downstream region growing.
  *
  * Usage:
  *   StructureMaskTool page.png                       (masks beside the image)
  *   StructureMaskTool -i page.png -o out/ --seeds
  *   StructureMaskTool -i pages/ -o out/ --axis-lines
  */

#include "cli/cli_app.hpp"

int main(int argc, char** argv) {
    return smt::cli::run(argc, argv);
}
