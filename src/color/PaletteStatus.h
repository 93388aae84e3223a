#pragma once

enum class PaletteStatus {
    OK,
    /** malformed parameters: bad sample count, non-positive gamma, inverted light range, or a lone hue */
    INVALID_PARAMETER,
    /** name is neither in the catalog nor a reversed catalog name */
    UNKNOWN_PALETTE
};

inline const char *statusName(PaletteStatus status) {
    switch (status) {
        case PaletteStatus::OK:
            return "ok";
        case PaletteStatus::INVALID_PARAMETER:
            return "invalid parameter";
        case PaletteStatus::UNKNOWN_PALETTE:
            return "unknown palette";
    }
    return "unknown status";
}
