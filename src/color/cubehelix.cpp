#include "cubehelix.h"
#include <iostream>
#include <cmath>
#include <utility>
#include <algorithm>

namespace {
// Green (2011), eq. 2: per-channel weights of cos(angle) and sin(angle)
const Eigen::Array3d kCosCoeffs(-0.14861, -0.29227, 1.97294);
const Eigen::Array3d kSinCoeffs(1.78277, -0.90649, 0.0);

bool checkFinite(const CubehelixParameters &params, double value, const char *field) {
    if (!std::isfinite(value)) {
        std::cerr << params.name << ": " << field << " must be finite, got " << value << std::endl;
        return false;
    }
    return true;
}
}

PaletteStatus validate(const CubehelixParameters &params) {
    if (params.sample_count < 1) {
        std::cerr << params.name << ": sample count must be at least 1, got " << params.sample_count << std::endl;
        return PaletteStatus::INVALID_PARAMETER;
    }
    if (!checkFinite(params, params.start, "start") || !checkFinite(params, params.rotation, "rotation") ||
        !checkFinite(params, params.gamma, "gamma") ||
        !checkFinite(params, params.min_sat, "min_sat") || !checkFinite(params, params.max_sat, "max_sat") ||
        !checkFinite(params, params.min_light, "min_light") || !checkFinite(params, params.max_light, "max_light") ||
        (params.has_sat && !checkFinite(params, params.sat, "sat")) ||
        (params.has_start_hue && !checkFinite(params, params.start_hue, "start_hue")) ||
        (params.has_end_hue && !checkFinite(params, params.end_hue, "end_hue"))) {
        return PaletteStatus::INVALID_PARAMETER;
    }
    if (!(params.gamma > 0)) {
        std::cerr << params.name << ": gamma must be positive, got " << params.gamma << std::endl;
        return PaletteStatus::INVALID_PARAMETER;
    }
    if (params.min_light > params.max_light) {
        std::cerr << params.name << ": min light " << params.min_light << " exceeds max light " << params.max_light << std::endl;
        return PaletteStatus::INVALID_PARAMETER;
    }
    if (params.has_start_hue != params.has_end_hue) {
        std::cerr << params.name << ": start_hue and end_hue must be given together" << std::endl;
        return PaletteStatus::INVALID_PARAMETER;
    }
    return PaletteStatus::OK;
}

void effective_start_rotation(const CubehelixParameters &params, double &start, double &rotation) {
    if (params.useHues()) {
        start = params.start_hue / 360.0 + 0.72;
        rotation = (params.end_hue - params.start_hue) / 360.0;
    } else {
        start = params.start;
        rotation = params.rotation;
    }
}

PaletteStatus cubehelix(const CubehelixParameters &params, Eigen::MatrixX3i &colors) {
    PaletteStatus status = validate(params);
    if (status != PaletteStatus::OK) {
        return status;
    }
    double start, rotation;
    effective_start_rotation(params, start, rotation);

    int n = params.sample_count;
    Eigen::MatrixX3i result(n, 3);
    for (int i=0; i<n; ++i) {
        double t = n > 1 ? static_cast<double>(i) / (n - 1) : 0.0;
        double saturation = params.has_sat ? params.sat : params.min_sat + t * (params.max_sat - params.min_sat);
        double light = params.min_light + t * (params.max_light - params.min_light);
        double fract = std::pow(std::max(light, 0.0), params.gamma);
        double angle = 2 * M_PI * (start / 3.0 + rotation * t + 1.0);
        double amp = saturation * fract * (1 - fract) / 2;
        Eigen::Array3d rgb = fract + amp * (kCosCoeffs * std::cos(angle) + kSinCoeffs * std::sin(angle));
        // oversaturated channels are clipped rather than rejected
        rgb = rgb.max(0.0).min(1.0);
        for (int c=0; c<3; ++c) {
            result(i, c) = static_cast<int>(std::lround(rgb(c) * 255));
        }
    }
    if (params.reverse) {
        // a single sample stays the t = 0 color, so reversing matches reversing the forward sequence
        result = result.colwise().reverse().eval();
    }
    colors = std::move(result);
    return PaletteStatus::OK;
}
