#pragma once

/// @file brick_table.hpp
/// @brief Flat, row-major table of every brick in a tiling, with CSV interchange.

#include "core/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace skybricks::tiling
{
    struct BrickGrid;

    /// @brief One brick of the table. Angles in degrees, area in square degrees.
    struct BrickRecord
    {
        std::string name;   ///< BRICKNAME (8 characters)
        i32 id;             ///< BRICKID (1-based, row-major)
        i16 quadrant;       ///< BRICKQ
        i32 row;            ///< BRICKROW
        i32 col;            ///< BRICKCOL
        f64 ra;             ///< RA   (center)
        f64 dec;            ///< DEC  (center)
        f64 ra1;            ///< RA1  (lower RA edge)
        f64 ra2;            ///< RA2  (upper RA edge)
        f64 dec1;           ///< DEC1 (lower Dec edge)
        f64 dec2;           ///< DEC2 (upper Dec edge)
        f64 area;           ///< AREA
    };

    /// @brief Tabular materialization of a BrickGrid.
    ///
    /// Columns: BRICKNAME, BRICKID, BRICKQ, BRICKROW, BRICKCOL,
    /// RA, DEC, RA1, RA2, DEC1, DEC2, AREA.
    class BrickTable
    {
    public:
        /// @brief CSV header line, in column order.
        static constexpr std::string_view kCsvHeader =
            "BRICKNAME,BRICKID,BRICKQ,BRICKROW,BRICKCOL,RA,DEC,RA1,RA2,DEC1,DEC2,AREA";

        /// @brief Unit of RA, DEC, RA1, RA2, DEC1, DEC2 (AREA is in deg^2).
        static constexpr std::string_view kAngleUnit = "deg";

        BrickTable(f64 brick_size_deg, std::vector<BrickRecord> records);

        /// @brief Flatten grid row-major. BRICKQ follows BrickGrid::brick_quadrant.
        [[nodiscard]] static BrickTable from_grid(const BrickGrid& grid);

        /// @brief Brick size of the tiling this table describes (degrees).
        [[nodiscard]] f64 brick_size_deg() const { return m_brick_size_deg; }

        [[nodiscard]] std::size_t size() const { return m_records.size(); }
        [[nodiscard]] bool empty() const { return m_records.empty(); }
        [[nodiscard]] const std::vector<BrickRecord>& records() const { return m_records; }
        [[nodiscard]] const BrickRecord& operator[](std::size_t i) const { return m_records[i]; }

        [[nodiscard]] auto begin() const { return m_records.begin(); }
        [[nodiscard]] auto end() const { return m_records.end(); }

        /// @brief Write the table as CSV.
        ///
        /// The file opens with the metadata comments "# bricksize = <deg>" and
        /// "# units = deg", then kCsvHeader, then one line per brick. Reals are
        /// written with round-trip precision.
        ///
        /// @return false (and an error log) if the file cannot be written.
        [[nodiscard]] bool write_csv(const std::filesystem::path& path) const;

        /// @brief Read a table written by write_csv().
        ///
        /// Leading '#' lines are metadata; the header row is required.
        /// Malformed lines are logged and skipped. Without a bricksize comment
        /// the brick size is taken as twice the Dec extent of the south polar
        /// cap (row 0).
        ///
        /// @return The table, or std::nullopt if the file cannot be opened,
        ///         is empty, or holds no valid record.
        [[nodiscard]] static std::optional<BrickTable> load_csv(const std::filesystem::path& path);

    private:
        [[nodiscard]] static std::optional<BrickRecord> parse_record(std::string_view line);

        /// @brief Value of a "# bricksize = <deg>" comment, if line is one.
        [[nodiscard]] static std::optional<f64> parse_brick_size_comment(std::string_view line);

        /// @brief Trim leading and trailing whitespace from a string_view.
        [[nodiscard]] static std::string_view trim(std::string_view sv);

        template <typename T>
        [[nodiscard]] static std::optional<T> parse_number(std::string_view sv);

        f64 m_brick_size_deg;
        std::vector<BrickRecord> m_records;
    };

} // namespace skybricks::tiling
