/// @file cli_app.cpp
/// @brief skybricks-cli subcommands.

#include "cli/cli_app.hpp"

#include "core/logger.hpp"
#include "tiling/brick_index.hpp"
#include "tiling/errors.hpp"
#include "tiling/tiling_config.hpp"

#include <CLI/CLI.hpp>

#include <exception>
#include <iomanip>
#include <numeric>
#include <ostream>
#include <string>

namespace skybricks::cli
{

using namespace skybricks::tiling;

namespace
{

int run_lookup(const BrickIndex& index, f64 ra, f64 dec, std::ostream& out)
{
    const BrickLocation loc = index.locate(ra, dec);
    const Vec2d centre = index.center(ra, dec);
    const BrickVertices corners = index.vertices(ra, dec);

    out << std::fixed << std::setprecision(6)
        << "Brick:    " << index.name(ra, dec) << "\n"
        << "  BRICKID:  " << index.id(ra, dec) << "\n"
        << "  BRICKQ:   " << index.quadrant(ra, dec) << "\n"
        << "  Row/Col:  " << loc.row << " / " << loc.col
        << " (of " << index.col_count(loc.row) << ")\n"
        << "  Centre:   RA " << centre.x << "  Dec " << centre.y << "\n"
        << "  Area:     " << index.area(ra, dec) << " deg^2\n"
        << "  Vertices:\n";
    for (const Vec2d& v : corners)
    {
        out << "    (" << v.x << ", " << v.y << ")\n";
    }
    return 0;
}

int run_table(const BrickIndex& index, const std::string& output, std::ostream& out)
{
    const BrickTable& table = index.to_table();
    if (!table.write_csv(output))
    {
        SKB_ERROR("Could not write brick table to {}", output);
        return 1;
    }
    out << "Wrote " << table.size() << " bricks to " << output << "\n";
    return 0;
}

int run_info(const BrickIndex& index, std::ostream& out)
{
    const auto& records = index.to_table().records();
    const f64 total_area = std::accumulate(records.begin(), records.end(), 0.0,
                                           [](f64 sum, const BrickRecord& r) { return sum + r.area; });

    out << index.to_string() << "\n"
        << "  Brick size:  " << index.brick_size_deg() << " deg\n"
        << "  Rows:        " << index.row_count() << "\n"
        << "  Bricks:      " << index.brick_count() << "\n"
        << "  Total area:  " << std::fixed << std::setprecision(3)
        << total_area << " deg^2 (sphere "
        << astro_constants::kSphereAreaDeg2 << ")\n";
    return 0;
}

} // anonymous namespace

int run(int argc, const char* const* argv, std::ostream& out, std::ostream& err)
{
    CLI::App app{"SkyBricks: brick tiling of the celestial sphere"};

    f64 brick_size = kDefaultBrickSizeDeg;
    std::string log_file;
    std::string log_level = "warn";

    app.add_option("--bricksize", brick_size, "Brick size in degrees")->capture_default_str();
    app.add_option("--log-file", log_file, "Also log to this rotating file");
    app.add_option("--log-level", log_level, "trace|debug|info|warn|error")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}))
        ->capture_default_str();
    app.require_subcommand(1);

    f64 ra = 0.0;
    f64 dec = 0.0;
    auto lookup_cmd = app.add_subcommand("lookup", "Show the brick containing a coordinate");
    lookup_cmd->add_option("ra", ra, "Right ascension (degrees)")->required();
    lookup_cmd->add_option("dec", dec, "Declination (degrees, -90..90)")->required();

    std::string output;
    auto table_cmd = app.add_subcommand("table", "Write the full brick table as CSV");
    table_cmd->add_option("output", output, "Output CSV path")->required();

    auto info_cmd = app.add_subcommand("info", "Summarize the tiling");

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError& e)
    {
        return app.exit(e, out, err);
    }

    int status = 1;
    try
    {
        core::Logger::init({
            .level = spdlog::level::from_str(log_level),
            .log_file = log_file,
        });

        const BrickIndex index(TilingConfig{.brick_size_deg = brick_size});
        SKB_INFO("Using {}", index.to_string());

        if (lookup_cmd->parsed())
        {
            status = run_lookup(index, ra, dec, out);
        }
        else if (table_cmd->parsed())
        {
            status = run_table(index, output, out);
        }
        else if (info_cmd->parsed())
        {
            status = run_info(index, out);
        }
    }
    catch (const BrickError& e)
    {
        SKB_ERROR("{}", e.what());
        status = 1;
    }
    catch (const std::exception& e)
    {
        // The logger itself may be what failed
        err << "skybricks-cli: " << e.what() << "\n";
        status = 1;
    }

    core::Logger::shutdown();
    return status;
}

} // namespace skybricks::cli
