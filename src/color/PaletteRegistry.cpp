#include "PaletteRegistry.h"
#include "cubehelix.h"
#include <iostream>
#include <memory>

const std::string PaletteRegistry::REVERSED_SUFFIX = "_r";

namespace {

PaletteRegistry::Entry makeEntry(const std::string &name, double start, double rotation) {
    PaletteRegistry::Entry entry;
    entry.name = name;
    entry.kind = "sequential";
    entry.params.name = name;
    entry.params.start = start;
    entry.params.rotation = rotation;
    entry.params.sample_count = 16;
    return entry;
}

PaletteRegistry::Entry makeSaturatedEntry(const std::string &name, double start, double rotation, double sat) {
    PaletteRegistry::Entry entry = makeEntry(name, start, rotation);
    entry.params.setSat(sat);
    return entry;
}

}

std::vector<PaletteRegistry::Entry> PaletteRegistry::builtinCatalog() {
    std::vector<Entry> catalog;
    catalog.push_back(makeEntry("classic_16", 0.5, -1.5));

    Entry rainbow = makeEntry("perceptual_rainbow_16", 0.5, -1.5);
    rainbow.params.setHues(240, -300);
    rainbow.params.min_sat = 1.0;
    rainbow.params.max_sat = 2.5;
    rainbow.params.min_light = 0.3;
    rainbow.params.max_light = 0.8;
    rainbow.params.gamma = 0.9;
    catalog.push_back(rainbow);

    catalog.push_back(makeEntry("purple_16", 0.0, 0.0));
    catalog.push_back(makeEntry("jim_special_16", 0.3, -0.5));
    catalog.push_back(makeEntry("red_16", 0.0, 0.5));
    catalog.push_back(makeSaturatedEntry("cubehelix1_16", 1.5, -1.0, 1.5));
    catalog.push_back(makeSaturatedEntry("cubehelix2_16", 2.0, -1.0, 1.5));
    catalog.push_back(makeSaturatedEntry("cubehelix3_16", 2.0, 1.0, 1.5));
    return catalog;
}

PaletteRegistry::PaletteRegistry(const std::vector<Entry> &catalog) {
    for (const auto &entry : catalog) {
        std::string reversed_name = entry.name + REVERSED_SUFFIX;
        if (contains(entry.name) || contains(reversed_name)) {
            std::cerr << "WARNING: duplicate palette name " << entry.name << ", skipping" << std::endl;
            continue;
        }
        CubehelixParameters params = entry.params;
        params.name = entry.name;
        Eigen::MatrixX3i colors;
        if (cubehelix(params, colors) != PaletteStatus::OK) {
            std::cerr << "WARNING: invalid parameters for palette " << entry.name << ", skipping" << std::endl;
            continue;
        }
        auto palette = std::make_shared<const Palette>(entry.name, std::move(colors), entry.kind);
        auto reversed = std::make_shared<const Palette>(palette->reversed(reversed_name));
        names_.push_back(entry.name);
        names_.push_back(reversed_name);
        palettes_[entry.name] = std::move(palette);
        palettes_[reversed_name] = std::move(reversed);
    }
}

const PaletteRegistry &PaletteRegistry::builtin() {
    static const PaletteRegistry registry(builtinCatalog());
    return registry;
}

PaletteStatus PaletteRegistry::makeCustom(const CubehelixParameters &params, Palette::Handle &palette) {
    Eigen::MatrixX3i colors;
    PaletteStatus status = cubehelix(params, colors);
    if (status != PaletteStatus::OK) {
        return status;
    }
    palette = std::make_shared<const Palette>(params.name, std::move(colors), "custom");
    return PaletteStatus::OK;
}

PaletteStatus PaletteRegistry::lookup(const std::string &name, Palette::Handle &palette) const {
    auto it = palettes_.find(name);
    if (it == palettes_.end()) {
        std::cerr << "unknown palette " << name << std::endl;
        return PaletteStatus::UNKNOWN_PALETTE;
    }
    palette = it->second;
    return PaletteStatus::OK;
}

bool PaletteRegistry::contains(const std::string &name) const {
    return palettes_.find(name) != palettes_.end();
}

std::vector<std::pair<std::string, std::string>> PaletteRegistry::listNames() const {
    std::vector<std::pair<std::string, std::string>> names;
    names.reserve(names_.size());
    for (const auto &name : names_) {
        names.emplace_back(name, palettes_.at(name)->kind());
    }
    return names;
}

size_t PaletteRegistry::size() const {
    return names_.size();
}
