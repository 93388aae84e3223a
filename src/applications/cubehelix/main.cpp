#include <iostream>
#include <string>
#include "color/PaletteRegistry.h"
#include "color/CubehelixParameters.h"

void usage(const char *program) {
    std::cout << "usage: " << program << " list" << std::endl;
    std::cout << "       " << program << " show <palette name>" << std::endl;
    std::cout << "       " << program << " custom <settings file>" << std::endl;
}

void print_palette(const Palette &palette) {
    std::cout << palette.name() << " (" << palette.kind() << ")" << std::endl;
    const Eigen::MatrixX3i &colors = palette.colors();
    std::vector<std::string> hex = palette.hex_colors();
    for (int i=0; i<colors.rows(); ++i) {
        std::cout << hex[i] << "  " << colors.row(i) << std::endl;
    }
}

int main(int argc, char **argv) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }
    std::string command = argv[1];
    if (command == "list" && argc == 2) {
        for (const auto &entry : PaletteRegistry::builtin().listNames()) {
            std::cout << entry.first << " (" << entry.second << ")" << std::endl;
        }
        return 0;
    } else if (command == "show" && argc == 3) {
        Palette::Handle palette;
        if (PaletteRegistry::builtin().lookup(argv[2], palette) != PaletteStatus::OK) {
            return 1;
        }
        print_palette(*palette);
        return 0;
    } else if (command == "custom" && argc == 3) {
        CubehelixParameters params;
        if (!params.parse_file(argv[2])) {
            return 1;
        }
        std::cout << params;
        Palette::Handle palette;
        PaletteStatus status = PaletteRegistry::makeCustom(params, palette);
        if (status != PaletteStatus::OK) {
            std::cerr << "failed to generate palette: " << statusName(status) << std::endl;
            return 1;
        }
        print_palette(*palette);
        return 0;
    }
    usage(argv[0]);
    return 1;
}
