// regionmap World Format
// world.hpp - Convenience include-all header

#pragma once

#include "block_chunk_data.hpp"
#include "byte_cursor.hpp"
#include "chunk_document.hpp"
#include "decode_error.hpp"
#include "region_file.hpp"
#include "section_palette.hpp"
#include "surface_extractor.hpp"
#include "types.hpp"
