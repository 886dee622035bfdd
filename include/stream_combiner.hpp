// include/stream_combiner.hpp
#pragma once

#include <string>
#include <filesystem>
#include <functional> // For std::function
#include <cstdint>
#include <cstddef>

#include "chunk_resolver.hpp"
#include "combine_result.hpp"
#include "combine_errors.hpp"

namespace ChunkCombiner
{

    // Snapshot handed to the progress listener.
    struct CombineProgress
    {
        size_t chunk_index;       // 1-based
        size_t chunk_count;
        std::string chunk_name;
        uint64_t chunk_size;
        uint64_t bytes_written;   // Across all chunks so far
        uint64_t total_bytes;     // Sum of all chunk sizes, measured before combining
        bool chunk_started;       // True for the event emitted before a chunk's first read

        // Fraction of total_bytes written; 1.0 when there is nothing to write.
        double fraction() const
        {
            return total_bytes == 0 ? 1.0 : static_cast<double>(bytes_written) / static_cast<double>(total_bytes);
        }
    };

    using ProgressListener = std::function<void(const CombineProgress &)>;

    class StreamCombiner
    {
    public:
        // Concatenate `chunk_set` into `output_path` (created or truncated), reading
        // `buffer_size` bytes at a time, and digest the stream with MD5 and SHA-256.
        // Overwrite confirmation is the caller's responsibility.
        // Throws IOFailure on the first read or write error, leaving the partial output behind.
        // Throws std::invalid_argument for an empty chunk set or a zero buffer size.
        static Report::CombineResult combine(const Chunks::ChunkSet &chunk_set,
                                             const std::filesystem::path &output_path,
                                             size_t buffer_size,
                                             const ProgressListener &on_progress = ProgressListener());

        // Sum of the sizes of all chunks. Throws IOFailure if one cannot be stat'ed.
        static uint64_t totalSize(const Chunks::ChunkSet &chunk_set);
    };

} // namespace ChunkCombiner
