#include "world/MapProvider.hpp"
#include "engine/Log.hpp"

#include <algorithm>
#include <random>

namespace delve {

// ============================================================================
// AsciiMapProvider
// ============================================================================

AsciiMapProvider::AsciiMapProvider(std::vector<std::string> rows)
    : m_rows(std::move(rows)) {}

GridMap AsciiMapProvider::generate() {
    int height = static_cast<int>(m_rows.size());
    int width = 0;
    for (const auto& row : m_rows) {
        width = std::max(width, static_cast<int>(row.size()));
    }

    GridMap map(width, height, MapCell::wall());
    for (int y = 0; y < height; ++y) {
        const std::string& row = m_rows[static_cast<std::size_t>(y)];
        for (int x = 0; x < static_cast<int>(row.size()); ++x) {
            char glyph = row[static_cast<std::size_t>(x)];
            GridPos pos{x, y};
            switch (glyph) {
                case '.': map.setCell(pos, MapCell::floor()); break;
                case ',': map.setCell(pos, MapCell::floor(2.0f)); break;
                case '~': map.setCell(pos, MapCell::floor(3.0f)); break;
                case 'S':
                    map.setCell(pos, MapCell::floor());
                    map.addSpawnPoint(pos);
                    break;
                default:
                    if (glyph >= '1' && glyph <= '9') {
                        map.setCell(pos, MapCell::floor(static_cast<float>(glyph - '0')));
                    }
                    break;
            }
        }
    }
    return map;
}

// ============================================================================
// RoomMapProvider
// ============================================================================

RoomMapProvider::RoomMapProvider(int width, int height, uint32_t seed)
    : m_width(width), m_height(height), m_seed(seed) {}

GridMap RoomMapProvider::generate() {
    GridMap map(m_width, m_height, MapCell::floor());

    for (int x = 0; x < m_width; ++x) {
        map.setCell({x, 0}, MapCell::wall());
        map.setCell({x, m_height - 1}, MapCell::wall());
    }
    for (int y = 0; y < m_height; ++y) {
        map.setCell({0, y}, MapCell::wall());
        map.setCell({m_width - 1, y}, MapCell::wall());
    }

    // Pillars are kept one cell away from the border so the outer ring
    // of floor stays connected.
    int innerWidth = m_width - 4;
    int innerHeight = m_height - 4;
    if (innerWidth > 0 && innerHeight > 0) {
        std::mt19937 rng(m_seed);
        int pillarCount = (m_width * m_height) / 20;
        for (int i = 0; i < pillarCount; ++i) {
            int x = 2 + static_cast<int>(rng() % static_cast<uint32_t>(innerWidth));
            int y = 2 + static_cast<int>(rng() % static_cast<uint32_t>(innerHeight));
            map.setCell({x, y}, MapCell::wall());
        }
    }

    for (std::size_t i = 0; i < map.cellCount(); ++i) {
        map.addSpawnPoint(map.posOf(i));
    }

    LOG_DEBUG("RoomMapProvider: {}x{} room, seed {}, {} spawn cells",
              m_width, m_height, m_seed, map.spawnPoints().size());
    return map;
}

} // namespace delve
