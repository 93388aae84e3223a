#pragma once

#include <string>
#include <ostream>

struct CubehelixParameters {
    std::string name = "custom";
    /** starting position on the red/green/blue color wheel (0=blue, 1=red, 2=green) */
    double start = 0.5;
    /** number of R->G->B rotations from start to end; negative rotates the other way */
    double rotation = -1.5;
    /** hue angles in degrees, [-360, 360]; override start and rotation only when both are set */
    double start_hue = 0.0;
    double end_hue = 0.0;
    bool has_start_hue = false;
    bool has_end_hue = false;
    /** exponent applied to lightness; < 1 emphasizes low intensities, > 1 high ones */
    double gamma = 1.0;
    /** constant saturation, overrides min_sat/max_sat when set */
    double sat = 1.2;
    bool has_sat = false;
    double min_sat = 1.2;
    double max_sat = 1.2;
    double min_light = 0.0;
    double max_light = 1.0;
    int sample_count = 256;
    /** produce colors from highest to lowest intensity */
    bool reverse = false;

    void setSat(double s);
    void setHues(double start_h, double end_h);
    bool useHues() const;

    /**
     * Load parameters from a key=value file ('#' starts a comment), then validate them.
     * @return true if every line parsed and the result is a valid parameter set
     */
    bool parse_file(const std::string &settings_filename);
    /** @return false if the key is unknown or the value does not parse */
    bool store_line(const std::string &key, const std::string &value);
};

std::ostream &operator<<(std::ostream &o, const CubehelixParameters &p);
