// include/cli_options.hpp
#pragma once

#include <string>
#include <vector>
#include <cstddef>

#include "combine_errors.hpp"

namespace ChunkCombiner
{
    namespace Cli
    {

        struct CliOptions
        {
            std::string input;          // Any one chunk file
            std::string output;         // Empty: derive from the first chunk
            std::string report;         // Empty: no JSON report
            size_t buffer_size_mb = 0;
            bool assume_yes = false;    // Overwrite without prompting
            bool show_help = false;
        };

        // Parse argv (including the program name in argv[0]).
        // Throws UsageError for unknown options, a malformed buffer size or a missing input.
        CliOptions parseArguments(const std::vector<std::string> &args);

        std::string usage(const std::string &program_name);

    } // namespace Cli
} // namespace ChunkCombiner
