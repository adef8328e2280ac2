#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <unordered_map>
#include <vector>

namespace gestureflow
{
    struct ProximityHit
    {
        std::size_t index{ 0 };
        float x{ 0.0f };
        float y{ 0.0f };
        float distance{ 0.0f };
    };

    // Transient proximity structure over (index, x, y) references. It owns no
    // particle data and must be cleared and refilled whenever the store moves
    // or removes particles.
    class ProximityIndex
    {
    public:
        virtual ~ProximityIndex() = default;

        virtual void clear() = 0;
        virtual void insert(std::size_t index, float x, float y) = 0;
        // Appends every entry with exact Euclidean distance <= radius to out.
        virtual void query_radius(float cx, float cy, float radius, std::vector<ProximityHit>& out) const = 0;
        [[nodiscard]] virtual std::size_t size() const noexcept = 0;

        [[nodiscard]] std::vector<ProximityHit> query_radius(float cx, float cy, float radius) const
        {
            std::vector<ProximityHit> hits;
            query_radius(cx, cy, radius, hits);
            return hits;
        }
    };

    // Uniform grid hash over the world rectangle. Positions outside the world
    // are bucketed into the nearest edge cell so nothing is ever dropped.
    class SpatialHashGrid final : public ProximityIndex
    {
    public:
        using ProximityIndex::query_radius;

        SpatialHashGrid(float width, float height, float cell_size)
            : m_cell_size{ cell_size > 0.0f ? cell_size : 1.0f }
        {
            resize(width, height);
        }

        void clear() override
        {
            for (auto& entry : m_cells)
            {
                entry.second.clear();
            }
            m_size = 0;
        }

        void insert(std::size_t index, float x, float y) override
        {
            const CellKey key{ column_for(x), row_for(y) };
            m_cells[key].push_back(Entry{ index, x, y });
            ++m_size;
        }

        void query_radius(float cx, float cy, float radius, std::vector<ProximityHit>& out) const override
        {
            if (m_size == 0 || radius < 0.0f)
            {
                return;
            }

            const int min_col = column_for(cx - radius);
            const int max_col = column_for(cx + radius);
            const int min_row = row_for(cy - radius);
            const int max_row = row_for(cy + radius);
            const float radius_sq = radius * radius;

            for (int col = min_col; col <= max_col; ++col)
            {
                for (int row = min_row; row <= max_row; ++row)
                {
                    const auto bucket_it = m_cells.find(CellKey{ col, row });
                    if (bucket_it == m_cells.end())
                    {
                        continue;
                    }

                    for (const auto& entry : bucket_it->second)
                    {
                        const float dx = entry.x - cx;
                        const float dy = entry.y - cy;
                        const float dist_sq = dx * dx + dy * dy;
                        if (dist_sq <= radius_sq)
                        {
                            out.push_back(ProximityHit{ entry.index, entry.x, entry.y, std::sqrt(dist_sq) });
                        }
                    }
                }
            }
        }

        [[nodiscard]] std::size_t size() const noexcept override { return m_size; }

        // Existing entries are dropped; callers rebuild after a resize.
        void resize(float width, float height)
        {
            m_columns = std::max(1, static_cast<int>(std::max(width, 0.0f) / m_cell_size) + 1);
            m_rows = std::max(1, static_cast<int>(std::max(height, 0.0f) / m_cell_size) + 1);
            m_cells.clear();
            m_size = 0;
        }

        [[nodiscard]] float cell_size() const noexcept { return m_cell_size; }
        [[nodiscard]] int columns() const noexcept { return m_columns; }
        [[nodiscard]] int rows() const noexcept { return m_rows; }

        [[nodiscard]] std::size_t occupied_cells() const noexcept
        {
            return static_cast<std::size_t>(std::count_if(m_cells.begin(), m_cells.end(), [](const auto& entry) {
                return !entry.second.empty();
            }));
        }

    private:
        struct CellKey
        {
            int col{ 0 };
            int row{ 0 };

            bool operator==(const CellKey& other) const noexcept
            {
                return col == other.col && row == other.row;
            }
        };

        struct CellKeyHasher
        {
            std::size_t operator()(const CellKey& key) const noexcept
            {
                const auto mix = (static_cast<std::size_t>(key.col) * 73856093u) ^ (static_cast<std::size_t>(key.row) * 19349663u);
                return mix;
            }
        };

        struct Entry
        {
            std::size_t index{ 0 };
            float x{ 0.0f };
            float y{ 0.0f };
        };

        [[nodiscard]] int column_for(float x) const noexcept
        {
            return clamp_cell(x, m_columns);
        }

        [[nodiscard]] int row_for(float y) const noexcept
        {
            return clamp_cell(y, m_rows);
        }

        [[nodiscard]] int clamp_cell(float coordinate, int count) const noexcept
        {
            const float cell = std::floor(coordinate / m_cell_size);
            if (!(cell > 0.0f)) return 0;
            if (cell >= static_cast<float>(count - 1)) return count - 1;
            return static_cast<int>(cell);
        }

        float m_cell_size{ 50.0f };
        int m_columns{ 1 };
        int m_rows{ 1 };
        std::size_t m_size{ 0 };
        std::unordered_map<CellKey, std::vector<Entry>, CellKeyHasher> m_cells{};
    };
} // namespace gestureflow
