// include/combine_app.hpp
#pragma once

#include <string>
#include <vector>
#include <iostream>

namespace ChunkCombiner
{

    // Process exit statuses.
    enum ExitCode
    {
        EXIT_OK = 0,        // Success, or the operator declined to overwrite
        EXIT_FAILED = 1,    // UnrecognizedSuffix, NoChunksFound, IOFailure
        EXIT_USAGE = 2      // Malformed command line
    };

    // Run the whole tool: parse `args`, resolve chunks, confirm overwrite on `in`,
    // combine, and print to `out` / `err`. Returns the process exit status.
    int runCombine(const std::vector<std::string> &args, std::istream &in, std::ostream &out, std::ostream &err);

} // namespace ChunkCombiner
