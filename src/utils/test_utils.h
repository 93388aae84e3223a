#pragma once
#include <iostream>
#include <string>
#include <cmath>
#include <Eigen/Dense>

inline bool assertPrint(bool condition, const std::string &message) {
    if (!condition) {
        std::cerr << message << std::endl;
    }
    return condition;
}

template <class T1, class T2>
bool isApprox(T1 a, T2 b, double eps=1e-6) {
    return std::fabs(a-b) <= eps;
}

template <class T1, class T2>
bool assertApproxEquals(T1 val1, T2 val2, const std::string &name, double eps=1e-6) {
    if (!isApprox(val1, val2, eps)) {
        std::cerr << name << " is " << val1 << ", should be " << val2 << std::endl;
        return false;
    }
    return true;
}

template <class T1, class T2>
bool assertEquals(T1 val1, T2 val2, const std::string &name) {
    if (val1 != val2) {
        std::cerr << name << " is " << val1 << ", should be " << val2 << std::endl;
        return false;
    }
    return true;
}

/** exact comparison of two color tables, reporting the first differing row */
inline bool assertColorsEqual(const Eigen::MatrixX3i &colors, const Eigen::MatrixX3i &expected, const std::string &name) {
    if (colors.rows() != expected.rows()) {
        std::cerr << name << " has " << colors.rows() << " colors, should have " << expected.rows() << std::endl;
        return false;
    }
    for (int i=0; i<colors.rows(); ++i) {
        if (colors.row(i) != expected.row(i)) {
            std::cerr << name << " row " << i << " is (" << colors.row(i) << "), should be (" << expected.row(i) << ")" << std::endl;
            return false;
        }
    }
    return true;
}

/** every channel of every color lies in [0, 255] */
inline bool assertChannelsInRange(const Eigen::MatrixX3i &colors, const std::string &name) {
    if (colors.size() > 0 && (colors.minCoeff() < 0 || colors.maxCoeff() > 255)) {
        std::cerr << name << " has channels outside [0, 255]: min " << colors.minCoeff() << ", max " << colors.maxCoeff() << std::endl;
        return false;
    }
    return true;
}
