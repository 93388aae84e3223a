#pragma once

#include <Eigen/Dense>
#include "CubehelixParameters.h"
#include "PaletteStatus.h"

/**
 * Check parameters against the generator's requirements, printing the first violation to stderr.
 * @return INVALID_PARAMETER if sample_count < 1, gamma <= 0, min_light > max_light, or only one hue is set
 */
PaletteStatus validate(const CubehelixParameters &params);

/**
 * Resolve the start/rotation pair actually used by the helix. When both hues are set,
 * start = start_hue/360 + 0.72 and rotation = (end_hue - start_hue)/360.
 */
void effective_start_rotation(const CubehelixParameters &params, double &start, double &rotation);

/**
 * Cubehelix color scheme (D. A. Green, 2011): a helix around the gray diagonal of the RGB cube
 * whose lightness increases monotonically with intensity.
 * @param params generation parameters
 * @param colors (sample_count, 3) output matrix, row i is the RGB color (0-255) of sample i. Untouched on failure.
 * @return OK, or INVALID_PARAMETER
 */
PaletteStatus cubehelix(const CubehelixParameters &params, Eigen::MatrixX3i &colors);
