// src/stream_combiner.cpp
#include "stream_combiner.hpp"
#include "digest_utility.hpp"
#include <fstream>
#include <vector>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace ChunkCombiner
{

    namespace
    {
        uint64_t chunkSize(const fs::path &chunk)
        {
            std::error_code ec;
            uint64_t size = fs::file_size(chunk, ec);
            if (ec)
            {
                throw IOFailure("Failed to get size of chunk file " + chunk.string() + ": " + ec.message());
            }
            return size;
        }
    } // namespace

    uint64_t StreamCombiner::totalSize(const Chunks::ChunkSet &chunk_set)
    {
        uint64_t total = 0;
        for (const fs::path &chunk : chunk_set.chunks)
        {
            total += chunkSize(chunk);
        }
        return total;
    }

    Report::CombineResult StreamCombiner::combine(const Chunks::ChunkSet &chunk_set,
                                                  const fs::path &output_path,
                                                  size_t buffer_size,
                                                  const ProgressListener &on_progress)
    {
        if (chunk_set.chunks.empty())
        {
            throw std::invalid_argument("Cannot combine an empty chunk set.");
        }
        if (buffer_size == 0)
        {
            throw std::invalid_argument("Buffer size must be positive.");
        }

        const uint64_t total_bytes = totalSize(chunk_set);
        const size_t chunk_count = chunk_set.chunks.size();

        Digest::StreamDigest md5(Digest::Algorithm::MD5);
        Digest::StreamDigest sha256(Digest::Algorithm::SHA256);
        uint64_t written = 0;
        std::vector<std::string> chunk_names;
        chunk_names.reserve(chunk_count);

        std::ofstream ofs(output_path, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open())
        {
            throw IOFailure("Failed to open output file for writing: " + output_path.string());
        }

        std::vector<char> buffer(buffer_size);

        for (size_t i = 0; i < chunk_count; ++i)
        {
            const fs::path &chunk = chunk_set.chunks[i];
            CombineProgress progress{i + 1, chunk_count, chunk.filename().string(),
                                     chunkSize(chunk), written, total_bytes, true};
            if (on_progress)
            {
                on_progress(progress);
            }
            progress.chunk_started = false;

            std::ifstream ifs(chunk, std::ios::binary);
            if (!ifs.is_open())
            {
                throw IOFailure("Failed to open chunk file for reading: " + chunk.string());
            }

            while (true)
            {
                ifs.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                std::streamsize got = ifs.gcount();
                if (ifs.bad())
                {
                    throw IOFailure("Failed to read data from chunk file: " + chunk.string());
                }
                if (got <= 0)
                {
                    break;
                }

                ofs.write(buffer.data(), got);
                if (!ofs.good())
                {
                    throw IOFailure("Failed to write chunk data to output file: " + output_path.string());
                }
                md5.update(buffer.data(), static_cast<size_t>(got));
                sha256.update(buffer.data(), static_cast<size_t>(got));
                written += static_cast<uint64_t>(got);

                if (on_progress)
                {
                    progress.bytes_written = written;
                    on_progress(progress);
                }

                if (ifs.eof())
                {
                    break;
                }
            }

            chunk_names.push_back(progress.chunk_name);
        }

        ofs.close();
        if (!ofs)
        {
            throw IOFailure("Failed to flush output file: " + output_path.string());
        }

        return Report::CombineResult(output_path, written, md5.finalizeHex(), sha256.finalizeHex(),
                                     std::move(chunk_names));
    }

} // namespace ChunkCombiner
