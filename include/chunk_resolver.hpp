// include/chunk_resolver.hpp
#pragma once

#include <string>
#include <vector>
#include <filesystem>

#include "naming_convention.hpp"
#include "combine_errors.hpp"

namespace ChunkCombiner
{
    namespace Chunks
    {

        // Chunks of one split file, in concatenation order.
        // Always non-empty; every entry is an existing regular file in `directory`.
        struct ChunkSet
        {
            std::filesystem::path directory;
            std::string base_name;
            Naming::Convention convention;
            std::vector<std::filesystem::path> chunks;
        };

        // Result of inferBase.
        struct BaseName
        {
            std::string base_name;
            Naming::Convention convention;
        };

        class ChunkResolver
        {
        public:
            // Determine the base name and convention from the final component of `reference_path`.
            // Throws UnrecognizedSuffix when the name carries no known chunk suffix.
            static BaseName inferBase(const std::filesystem::path &reference_path);

            // Every regular file in `directory` named "<base_name>.<suffix>" whose suffix
            // has the shape of `convention`, sorted into concatenation order.
            // Throws NoChunksFound when nothing matches or the directory cannot be listed.
            static ChunkSet discoverChunks(const std::filesystem::path &directory,
                                           const std::string &base_name,
                                           Naming::Convention convention);

            // inferBase followed by discoverChunks in the reference's (absolute) parent directory.
            static ChunkSet resolve(const std::filesystem::path &reference_path);

            // Default output path: the first chunk with its suffix removed, or with
            // ".combined" appended if no suffix can be stripped.
            static std::filesystem::path deriveOutputName(const std::filesystem::path &first_chunk);
        };

    } // namespace Chunks
} // namespace ChunkCombiner
