#pragma once

#include <Eigen/Dense>
#include <memory>
#include <string>
#include <vector>
#include <ostream>

/**
 * Immutable named sequence of 8 bit RGB colors
 */
class Palette {
public:
    typedef std::shared_ptr<const Palette> Handle;

    /**
     * @param name palette name
     * @param colors (n, 3) matrix, row i is color i with channels in [0, 255]
     * @param kind classification tag, e.g. "sequential"
     */
    Palette(std::string name, Eigen::MatrixX3i colors, std::string kind);

    const std::string &name() const;
    const std::string &kind() const;
    const Eigen::MatrixX3i &colors() const;

    /**
     * @return number of colors
     */
    int number() const;

    /**
     * Copy of this palette with the row order reversed, under a new name
     */
    Palette reversed(const std::string &name) const;

    /**
     * @return colors as "#RRGGBB" strings
     */
    std::vector<std::string> hex_colors() const;

    /**
     * @return colors scaled to [0, 1]
     */
    Eigen::MatrixX3d normalized_colors() const;

private:
    std::string name_;
    Eigen::MatrixX3i colors_;
    std::string kind_;
};

std::ostream &operator<<(std::ostream &o, const Palette &palette);
