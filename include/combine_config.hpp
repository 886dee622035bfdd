// include/combine_config.hpp
#pragma once

#include <string>
#include <vector>
#include <cstddef> // For size_t

namespace ChunkCombiner
{
    namespace Config
    {

        class CombineConfig
        {
        public:
            // Default read/write buffer size, in megabytes (8 MiB)
            static const size_t DEFAULT_BUFFER_SIZE_MB = 8;

            // Largest accepted buffer, in megabytes (1 GiB)
            static const size_t MAX_BUFFER_SIZE_MB = 1024;

            // Binary megabyte, used for both the buffer option and size display
            static const size_t BYTES_PER_MB = 1024 * 1024;

            // Appended to a chunk name when no convention suffix can be stripped
            static const std::string COMBINED_SUFFIX;

            // Answers accepted as "yes" by the overwrite prompt
            static const std::vector<std::string> AFFIRMATIVE_ANSWERS;

            // Convert a buffer size given in megabytes to bytes.
            // Throws std::invalid_argument for 0 or for values above MAX_BUFFER_SIZE_MB.
            static size_t bufferBytesFromMegabytes(size_t megabytes);
        };

    } // namespace Config
} // namespace ChunkCombiner
