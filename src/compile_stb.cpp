// ============================================================================
//  File: src/compile_stb.cpp — Unique instanciation de stb_image / stb_image_write
//  Project: E-Ink Gallery Renderer v1
// ============================================================================

#define EINK_IO_IMAGE_IMPLEMENTATION
#include "io_image.hpp"
