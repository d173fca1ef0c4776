#pragma once

#include "world/GridMap.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace delve {

/// Source of the level grid. The generation algorithm lives behind this
/// interface; the core only sees the resulting GridMap.
class MapProvider {
public:
    virtual ~MapProvider() = default;

    /// Produce the grid and its spawn cells
    virtual GridMap generate() = 0;
};

/// Builds a map from ASCII rows. Used for fixed layouts and tests.
///
/// | Glyph | Cell                         |
/// |-------|------------------------------|
/// | `#`   | wall                         |
/// | `.`   | floor, cost 1                |
/// | `,`   | rough floor, cost 2          |
/// | `~`   | shallow water, cost 3        |
/// | `S`   | floor, cost 1, spawn point   |
/// | `1-9` | floor with that digit as cost |
///
/// Any other glyph is treated as a wall. Short rows are padded with walls.
class AsciiMapProvider : public MapProvider {
public:
    explicit AsciiMapProvider(std::vector<std::string> rows);

    GridMap generate() override;

private:
    std::vector<std::string> m_rows;
};

/// A single bordered room with scattered one-cell pillars (~5% of the area).
/// Every floor cell is a spawn point. Deterministic for a given seed.
class RoomMapProvider : public MapProvider {
public:
    RoomMapProvider(int width, int height, uint32_t seed);

    GridMap generate() override;

private:
    int m_width;
    int m_height;
    uint32_t m_seed;
};

} // namespace delve
