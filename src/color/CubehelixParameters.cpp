#include "CubehelixParameters.h"
#include "cubehelix.h"
#include <iostream>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace {

std::string trim(const std::string &s) {
    const char *ws = " \t\r\n";
    size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

double parse_double(const std::string &value) {
    size_t pos = 0;
    double result = std::stod(value, &pos);
    if (pos != value.size()) {
        throw std::invalid_argument("trailing characters");
    }
    return result;
}

int parse_int(const std::string &value) {
    size_t pos = 0;
    int result = std::stoi(value, &pos);
    if (pos != value.size()) {
        throw std::invalid_argument("trailing characters");
    }
    return result;
}

bool parse_bool(const std::string &value) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true" || lower == "yes") return true;
    if (lower == "false" || lower == "no") return false;
    return parse_int(value) != 0;
}

}

void CubehelixParameters::setSat(double s) {
    sat = s;
    has_sat = true;
}

void CubehelixParameters::setHues(double start_h, double end_h) {
    start_hue = start_h;
    end_hue = end_h;
    has_start_hue = true;
    has_end_hue = true;
}

bool CubehelixParameters::useHues() const {
    return has_start_hue && has_end_hue;
}

std::ostream &operator<<(std::ostream &o, const CubehelixParameters &p) {
    o << "Cubehelix parameters: " << p.name << std::endl;
    if (p.useHues()) {
        o << "start hue: " << p.start_hue << std::endl;
        o << "end hue: " << p.end_hue << std::endl;
    } else {
        o << "start: " << p.start << std::endl;
        o << "rotation: " << p.rotation << std::endl;
    }
    o << "gamma: " << p.gamma << std::endl;
    if (p.has_sat) {
        o << "saturation: " << p.sat << std::endl;
    } else {
        o << "min saturation: " << p.min_sat << std::endl;
        o << "max saturation: " << p.max_sat << std::endl;
    }
    o << "min light: " << p.min_light << std::endl;
    o << "max light: " << p.max_light << std::endl;
    o << "sample count: " << p.sample_count << std::endl;
    o << "reverse: " << (p.reverse ? "true" : "false") << std::endl;
    return o;
}

bool CubehelixParameters::store_line(const std::string &key_in, const std::string &value_in) {
    std::string key = trim(key_in);
    std::string value = trim(value_in);
    try {
        if (key == "name") {
            this->name = value;
        } else if (key == "start") {
            this->start = parse_double(value);
        } else if (key == "rotation") {
            this->rotation = parse_double(value);
        } else if (key == "start_hue") {
            this->start_hue = parse_double(value);
            this->has_start_hue = true;
        } else if (key == "end_hue") {
            this->end_hue = parse_double(value);
            this->has_end_hue = true;
        } else if (key == "gamma") {
            this->gamma = parse_double(value);
        } else if (key == "sat") {
            setSat(parse_double(value));
        } else if (key == "min_sat") {
            this->min_sat = parse_double(value);
        } else if (key == "max_sat") {
            this->max_sat = parse_double(value);
        } else if (key == "min_light") {
            this->min_light = parse_double(value);
        } else if (key == "max_light") {
            this->max_light = parse_double(value);
        } else if (key == "sample_count") {
            this->sample_count = parse_int(value);
        } else if (key == "reverse") {
            this->reverse = parse_bool(value);
        } else {
            return false;
        }
    } catch (std::exception &e) {
        std::cout << "parse error (" << e.what() << "): " << key << "=" << value << std::endl;
        return false;
    }
    return true;
}

bool CubehelixParameters::parse_file(const std::string &settings_filename) {
    std::ifstream if_config(settings_filename);
    if (!if_config) {
        std::cout << "failed to load config file " << settings_filename << std::endl;
        return false;
    }
    std::string line;
    while (std::getline(if_config, line)) {
        size_t found = line.find('#');
        if (found != std::string::npos) {
            line = line.substr(0, found);
        }
        std::istringstream is_line(line);
        std::string key;
        if (std::getline(is_line, key, '=')) {
            std::string value;
            if (std::getline(is_line, value)) {
                if (!store_line(key, value)) {
                    std::cout << "invalid setting: " << line << std::endl;
                    return false;
                }
            } else if (!trim(key).empty()) {
                std::cout << "invalid setting: " << line << std::endl;
                return false;
            }
        }
    }
    if (has_start_hue != has_end_hue) {
        std::cerr << "WARNING: " << settings_filename << " sets only one of start_hue/end_hue" << std::endl;
    }
    return validate(*this) == PaletteStatus::OK;
}
