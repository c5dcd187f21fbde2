// regionmap Rendering
// rendering.hpp - Convenience include-all header

#pragma once

#include "block_properties.hpp"
#include "color.hpp"
#include "compositor.hpp"
#include "image_writer.hpp"
#include "map_renderer.hpp"
#include "terrain_shading.hpp"
