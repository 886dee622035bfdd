// src/combine_config.cpp
#include "combine_config.hpp"
#include <stdexcept> // For std::invalid_argument

namespace ChunkCombiner
{
    namespace Config
    {

        const size_t CombineConfig::DEFAULT_BUFFER_SIZE_MB;
        const size_t CombineConfig::MAX_BUFFER_SIZE_MB;
        const size_t CombineConfig::BYTES_PER_MB;
        const std::string CombineConfig::COMBINED_SUFFIX = ".combined";
        const std::vector<std::string> CombineConfig::AFFIRMATIVE_ANSWERS = {"y", "Y"};

        size_t CombineConfig::bufferBytesFromMegabytes(size_t megabytes)
        {
            if (megabytes == 0)
            {
                throw std::invalid_argument("Buffer size must be at least 1 MB.");
            }
            if (megabytes > MAX_BUFFER_SIZE_MB)
            {
                throw std::invalid_argument("Buffer size of " + std::to_string(megabytes) + " MB exceeds the " +
                                            std::to_string(MAX_BUFFER_SIZE_MB) + " MB limit.");
            }
            return megabytes * BYTES_PER_MB;
        }

    } // namespace Config
} // namespace ChunkCombiner
