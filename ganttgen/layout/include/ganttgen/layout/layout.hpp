#pragma once

/// @defgroup layout Layout Library
/// @brief Chart validation, geometry, resource colors, and scene building.
///
/// The layout library maps a core::Chart onto pixel geometry and turns
/// that geometry into an abstract Document of drawing primitives.
/// Depends on core only; serialization lives in the I/O library.

/// @defgroup layout_engine Layout Engine
/// @ingroup layout
/// @brief Validation, date span, month columns, and row placement.

/// @defgroup layout_color Colors
/// @ingroup layout
/// @brief Golden-ratio hue assignment and per-resource style descriptors.

/// @defgroup layout_scene Scene
/// @ingroup layout
/// @brief Drawing primitives and the scene builder.

// Convenience header for the layout library
#include <ganttgen/layout/color.hpp>
#include <ganttgen/layout/geometry.hpp>
#include <ganttgen/layout/layout_engine.hpp>
#include <ganttgen/layout/scene.hpp>
#include <ganttgen/layout/scene_builder.hpp>
