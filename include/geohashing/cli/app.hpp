#pragma once

#include <geohashing/engine/engine.hpp>

#include <iosfwd>
#include <optional>
#include <string>

namespace geohashing::cli {

/// Parsed command line of the `geohash` tool.
struct Options {
    std::optional<double> latitude;
    std::optional<double> longitude;
    /// Raw `YYYY-MM-DD`; validated by run().
    std::optional<std::string> date;
    std::optional<std::string> index_value;
    std::optional<hash::Compliance> compliance;
    bool global = false;
    bool centicule = false;
    bool simple = false;
};

/// Compute and print the hash described by `options`.
///
/// Returns the process exit code: 0 on success, 1 on a malformed date, a
/// missing coordinate or when no index value could be obtained.
[[nodiscard]] auto run(const Options& options, const engine::Environment& env, std::ostream& out,
                       std::ostream& err) -> int;

}  // namespace geohashing::cli
