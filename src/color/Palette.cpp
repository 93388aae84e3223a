#include "Palette.h"
#include "utils/color_conversion.hpp"
#include <utility>

Palette::Palette(std::string name, Eigen::MatrixX3i colors, std::string kind) :
    name_(std::move(name)), colors_(std::move(colors)), kind_(std::move(kind)) {
}

const std::string &Palette::name() const {
    return name_;
}

const std::string &Palette::kind() const {
    return kind_;
}

const Eigen::MatrixX3i &Palette::colors() const {
    return colors_;
}

int Palette::number() const {
    return static_cast<int>(colors_.rows());
}

Palette Palette::reversed(const std::string &name) const {
    return Palette(name, Eigen::MatrixX3i(colors_.colwise().reverse()), kind_);
}

std::vector<std::string> Palette::hex_colors() const {
    std::vector<std::string> hex;
    hex.reserve(colors_.rows());
    for (int i=0; i<colors_.rows(); ++i) {
        hex.push_back(rgb2hex(colors_(i, 0), colors_(i, 1), colors_(i, 2)));
    }
    return hex;
}

Eigen::MatrixX3d Palette::normalized_colors() const {
    return colors_.cast<double>() / 255.0;
}

std::ostream &operator<<(std::ostream &o, const Palette &palette) {
    o << palette.name() << " (" << palette.kind() << ", " << palette.number() << " colors): ";
    std::vector<std::string> hex = palette.hex_colors();
    for (size_t i=0; i<hex.size(); ++i) {
        if (i > 0) o << ", ";
        o << hex[i];
    }
    return o;
}
