// src/chunk_resolver.cpp
#include "chunk_resolver.hpp"
#include "combine_config.hpp"
#include <algorithm> // For std::sort
#include <system_error>

namespace fs = std::filesystem;

namespace ChunkCombiner
{
    namespace Chunks
    {

        BaseName ChunkResolver::inferBase(const fs::path &reference_path)
        {
            std::string name = reference_path.filename().string();
            std::optional<Naming::SplitName> split = Naming::splitChunkName(name);
            if (!split)
            {
                throw UnrecognizedSuffix("Could not determine base name from '" + name +
                                         "'. Expected patterns: " + Naming::expectedPatterns());
            }
            return BaseName{split->base, split->convention};
        }

        ChunkSet ChunkResolver::discoverChunks(const fs::path &directory,
                                               const std::string &base_name,
                                               Naming::Convention convention)
        {
            const Naming::ConventionRule &rule = Naming::ruleFor(convention);
            const std::string prefix = base_name + ".";

            // Pair each chunk with its suffix so sorting doesn't re-split names.
            std::vector<std::pair<std::string, fs::path>> found;

            std::error_code ec;
            fs::directory_iterator it(directory, ec);
            if (ec)
            {
                throw NoChunksFound("Cannot list directory " + directory.string() + ": " + ec.message());
            }

            for (const fs::directory_entry &entry : it)
            {
                std::string name = entry.path().filename().string();
                if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0)
                {
                    continue;
                }

                // Only the same convention: a directory may hold unrelated files sharing the prefix.
                std::string suffix = name.substr(prefix.size());
                if (!rule.matches(suffix))
                {
                    continue;
                }

                std::error_code type_ec;
                if (!entry.is_regular_file(type_ec))
                {
                    continue;
                }
                found.emplace_back(suffix, entry.path());
            }

            if (found.empty())
            {
                throw NoChunksFound("No chunk files found matching base name '" + base_name +
                                    "' in " + directory.string());
            }

            std::sort(found.begin(), found.end(),
                      [convention](const auto &lhs, const auto &rhs)
                      { return Naming::suffixLess(convention, lhs.first, rhs.first); });

            ChunkSet chunk_set{directory, base_name, convention, {}};
            chunk_set.chunks.reserve(found.size());
            for (auto &item : found)
            {
                chunk_set.chunks.push_back(std::move(item.second));
            }
            return chunk_set;
        }

        ChunkSet ChunkResolver::resolve(const fs::path &reference_path)
        {
            BaseName base = inferBase(reference_path);

            fs::path directory = fs::absolute(reference_path).parent_path();
            if (directory.empty())
            {
                directory = fs::current_path();
            }
            return discoverChunks(directory, base.base_name, base.convention);
        }

        fs::path ChunkResolver::deriveOutputName(const fs::path &first_chunk)
        {
            std::string name = first_chunk.filename().string();
            std::optional<Naming::SplitName> split = Naming::splitChunkName(name);
            if (split)
            {
                return first_chunk.parent_path() / split->base;
            }
            return first_chunk.parent_path() / (name + Config::CombineConfig::COMBINED_SUFFIX);
        }

    } // namespace Chunks
} // namespace ChunkCombiner
