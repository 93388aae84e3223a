#pragma once

#include <string>
#include <vector>
#include <utility>
#include <unordered_map>
#include "Palette.h"
#include "CubehelixParameters.h"
#include "PaletteStatus.h"

/**
 * Catalog of named Cubehelix palettes. Every catalog entry P is accompanied by P_r, which holds
 * the same colors in reverse order. Entries are generated once when the registry is constructed
 * and never modified afterward, so a registry may be read from any number of threads.
 */
class PaletteRegistry {
public:
    struct Entry {
        std::string name;
        CubehelixParameters params;
        std::string kind;
    };

    static const std::string REVERSED_SUFFIX;

    /**
     * Materialize every entry of the given catalog along with its reversed variant.
     * Entries whose parameters fail validation are skipped with a warning.
     */
    explicit PaletteRegistry(const std::vector<Entry> &catalog);

    /**
     * Process-wide registry over the built-in catalog, constructed on first use
     */
    static const PaletteRegistry &builtin();

    /**
     * The built-in catalog, in declaration order
     */
    static std::vector<Entry> builtinCatalog();

    /**
     * Generate a palette outside of any registry, named after params.name with kind "custom"
     * @param palette receives the new palette on success
     * @return OK or INVALID_PARAMETER
     */
    static PaletteStatus makeCustom(const CubehelixParameters &params, Palette::Handle &palette);

    /**
     * @param palette receives the registered palette on success
     * @return OK or UNKNOWN_PALETTE
     */
    PaletteStatus lookup(const std::string &name, Palette::Handle &palette) const;

    bool contains(const std::string &name) const;

    /**
     * @return (name, kind) of every entry in catalog order, each name followed by its reversed variant
     */
    std::vector<std::pair<std::string, std::string>> listNames() const;

    size_t size() const;

private:
    std::vector<std::string> names_;
    std::unordered_map<std::string, Palette::Handle> palettes_;
};
