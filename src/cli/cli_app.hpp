#pragma once

/// @file cli_app.hpp
/// @brief skybricks-cli front end, callable in-process.
///
/// Subcommands:
///  lookup <ra> <dec>   brick containing a coordinate
///  table <out.csv>     full brick table as CSV
///  info                summary of the tiling
///
/// Global options: --bricksize <deg>, --log-file <path>, --log-level <level>.

#include <iosfwd>

namespace skybricks::cli
{
    /// @brief Parse argv and run one subcommand.
    ///
    /// Reports go to out, usage and fatal errors that precede logger setup go
    /// to err. Everything else is logged through the APP logger.
    ///
    /// @return 0 on success, 1 on a configuration error, an out-of-range
    /// coordinate, an unwritable output or a logger that cannot be opened;
    /// CLI11's exit code on a usage error.
    [[nodiscard]] int run(int argc, const char* const* argv, std::ostream& out, std::ostream& err);

} // namespace skybricks::cli
