/// @file brick_table.cpp
/// @brief Table materialization and CSV interchange.

#include "tiling/brick_table.hpp"

#include "core/logger.hpp"
#include "tiling/brick_grid.hpp"
#include "tiling/brick_name.hpp"

#include <spdlog/fmt/fmt.h>

#include <array>
#include <charconv>
#include <fstream>
#include <string>
#include <utility>

namespace skybricks::tiling
{

namespace
{

constexpr std::size_t kColumnCount = 12;
constexpr std::string_view kBrickSizeKey = "bricksize";
constexpr std::string_view kUnitsKey = "units";

} // anonymous namespace

BrickTable::BrickTable(f64 brick_size_deg, std::vector<BrickRecord> records)
    : m_brick_size_deg{brick_size_deg}
    , m_records{std::move(records)}
{
}

// -----------------------------------------------------------------
// Flatten the grid row-major; BRICKID is the running position + 1
// -----------------------------------------------------------------

BrickTable BrickTable::from_grid(const BrickGrid& grid)
{
    std::vector<BrickRecord> records;
    records.reserve(grid.brick_count());

    for (std::size_t row = 0; row < grid.row_count(); ++row)
    {
        const BrickRow& band = grid.rows[row];
        const auto cells = grid.row_cells(row);

        for (std::size_t col = 0; col < cells.size(); ++col)
        {
            const BrickCell& cell = cells[col];
            records.push_back(BrickRecord{
                .name     = cell.name,
                .id       = grid.brick_id(row, col),
                .quadrant = grid.brick_quadrant(row, col),
                .row      = static_cast<i32>(row),
                .col      = static_cast<i32>(col),
                .ra       = cell.ra_center,
                .dec      = band.dec_center,
                .ra1      = cell.ra_min,
                .ra2      = cell.ra_max,
                .dec1     = band.dec_min,
                .dec2     = band.dec_max,
                .area     = cell.area,
            });
        }
    }

    SKB_CORE_DEBUG("BrickTable: materialized {} bricks", records.size());

    return BrickTable(grid.brick_size_deg(), std::move(records));
}

// -----------------------------------------------------------------
// Write CSV
// -----------------------------------------------------------------

bool BrickTable::write_csv(const std::filesystem::path& path) const
{
    std::ofstream file(path);
    if (!file.is_open())
    {
        SKB_CORE_ERROR("BrickTable: Failed to open file for writing: {}", path.string());
        return false;
    }

    file << fmt::format("# {} = {}\n", kBrickSizeKey, m_brick_size_deg);
    file << fmt::format("# {} = {}\n", kUnitsKey, kAngleUnit);
    file << kCsvHeader << '\n';

    for (const BrickRecord& r : m_records)
    {
        file << fmt::format("{},{},{},{},{},{},{},{},{},{},{},{}\n",
                            r.name, r.id, r.quadrant, r.row, r.col,
                            r.ra, r.dec, r.ra1, r.ra2, r.dec1, r.dec2, r.area);
    }

    file.flush();
    if (!file)
    {
        SKB_CORE_ERROR("BrickTable: Write failed: {}", path.string());
        return false;
    }

    SKB_CORE_INFO("BrickTable: Wrote {} bricks to {}", m_records.size(), path.string());
    return true;
}

// -----------------------------------------------------------------
// Load CSV: optional '#' metadata lines, header, records
// -----------------------------------------------------------------

std::optional<BrickTable> BrickTable::load_csv(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        SKB_CORE_ERROR("BrickTable: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    std::string line;
    std::optional<f64> brick_size;

    // Metadata comments, then the header line
    bool have_header = false;
    u32 line_number = 0;
    while (std::getline(file, line))
    {
        ++line_number;
        const std::string_view text = trim(line);
        if (text.starts_with('#'))
        {
            if (const auto size = parse_brick_size_comment(text))
            {
                brick_size = size;
            }
            continue;
        }
        if (text != kCsvHeader)
        {
            SKB_CORE_ERROR("BrickTable: Unexpected header on line {} of {}: {}",
                           line_number, path.string(), line);
            return std::nullopt;
        }
        have_header = true;
        break;
    }

    if (!have_header)
    {
        SKB_CORE_ERROR("BrickTable: File is empty: {}", path.string());
        return std::nullopt;
    }

    std::vector<BrickRecord> records;
    u32 skipped = 0;

    while (std::getline(file, line))
    {
        ++line_number;

        if (trim(line).empty())
        {
            continue;
        }

        auto record = parse_record(line);
        if (!record)
        {
            SKB_CORE_WARN("BrickTable: Malformed line {}: {}", line_number, line);
            ++skipped;
            continue;
        }
        records.push_back(std::move(*record));
    }

    if (records.empty())
    {
        SKB_CORE_ERROR("BrickTable: No valid bricks found in: {}", path.string());
        return std::nullopt;
    }

    if (skipped > 0)
    {
        SKB_CORE_WARN("BrickTable: Skipped {} malformed lines", skipped);
    }

    if (!brick_size)
    {
        brick_size = 0.0;
        for (const BrickRecord& r : records)
        {
            if (r.row == 0)
            {
                brick_size = 2.0 * (r.dec2 - r.dec1);
                break;
            }
        }
        SKB_CORE_DEBUG("BrickTable: No bricksize comment, inferred {}", *brick_size);
    }

    SKB_CORE_INFO("BrickTable: Loaded {} bricks from {}", records.size(), path.string());

    return BrickTable(*brick_size, std::move(records));
}

// -----------------------------------------------------------------
// One CSV record: exactly kColumnCount comma-separated fields
// -----------------------------------------------------------------

std::optional<BrickRecord> BrickTable::parse_record(std::string_view line)
{
    std::array<std::string_view, kColumnCount> fields;
    std::size_t count = 0;

    while (true)
    {
        const std::size_t comma = line.find(',');
        if (count == kColumnCount)
        {
            return std::nullopt;
        }
        fields[count++] = trim(line.substr(0, comma));
        if (comma == std::string_view::npos)
        {
            break;
        }
        line.remove_prefix(comma + 1);
    }

    if (count != kColumnCount || fields[0].size() != kBrickNameLength)
    {
        return std::nullopt;
    }

    const auto id       = parse_number<i32>(fields[1]);
    const auto quadrant = parse_number<i16>(fields[2]);
    const auto row      = parse_number<i32>(fields[3]);
    const auto col      = parse_number<i32>(fields[4]);
    const auto ra       = parse_number<f64>(fields[5]);
    const auto dec      = parse_number<f64>(fields[6]);
    const auto ra1      = parse_number<f64>(fields[7]);
    const auto ra2      = parse_number<f64>(fields[8]);
    const auto dec1     = parse_number<f64>(fields[9]);
    const auto dec2     = parse_number<f64>(fields[10]);
    const auto area     = parse_number<f64>(fields[11]);

    if (!id || !quadrant || !row || !col || !ra || !dec ||
        !ra1 || !ra2 || !dec1 || !dec2 || !area)
    {
        return std::nullopt;
    }

    return BrickRecord{
        .name     = std::string(fields[0]),
        .id       = *id,
        .quadrant = *quadrant,
        .row      = *row,
        .col      = *col,
        .ra       = *ra,
        .dec      = *dec,
        .ra1      = *ra1,
        .ra2      = *ra2,
        .dec1     = *dec1,
        .dec2     = *dec2,
        .area     = *area,
    };
}

// -----------------------------------------------------------------
// "# bricksize = 0.25"
// -----------------------------------------------------------------

std::optional<f64> BrickTable::parse_brick_size_comment(std::string_view line)
{
    line = trim(line.substr(1));
    if (!line.starts_with(kBrickSizeKey))
    {
        return std::nullopt;
    }
    line = trim(line.substr(kBrickSizeKey.size()));
    if (!line.starts_with('='))
    {
        return std::nullopt;
    }
    return parse_number<f64>(trim(line.substr(1)));
}

// -----------------------------------------------------------------
// Utility: trim whitespace
// -----------------------------------------------------------------

std::string_view BrickTable::trim(std::string_view sv)
{
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t' || sv.front() == '\r'))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    {
        sv.remove_suffix(1);
    }
    return sv;
}

// -----------------------------------------------------------------
// Utility: parse a whole field as a number
// -----------------------------------------------------------------

template <typename T>
std::optional<T> BrickTable::parse_number(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    T value{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }

    return value;
}

} // namespace skybricks::tiling
