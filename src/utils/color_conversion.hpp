#pragma once

#include <string>
#include <cstdio>

/**
 * Luma of an RGB triple (Rec. 601 weights), in the same units as the input channels
 */
template <class FT>
FT rgb2grayscale(FT r, FT g, FT b) {
    return 0.11 * b + 0.59 * g + 0.3 * r;
}

/**
 * @return "#RRGGBB" for 8 bit channels
 */
inline std::string rgb2hex(int r, int g, int b) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02X%02X%02X", r & 0xFF, g & 0xFF, b & 0xFF);
    return std::string(buf);
}
