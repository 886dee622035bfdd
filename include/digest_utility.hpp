// include/digest_utility.hpp
#pragma once

#include <string>
#include <vector>
#include <memory>  // For std::unique_ptr
#include <cstddef>

// Forward declarations keep OpenSSL out of this header.
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace ChunkCombiner
{
    namespace Digest
    {

        enum class Algorithm
        {
            MD5,
            SHA256
        };

        // Incremental digest over a byte stream, backed by OpenSSL's EVP interface.
        // Move-only; the context is released when the object goes out of scope.
        class StreamDigest
        {
        public:
            explicit StreamDigest(Algorithm algorithm);
            ~StreamDigest();

            StreamDigest(StreamDigest &&) noexcept;
            StreamDigest &operator=(StreamDigest &&) noexcept;
            StreamDigest(const StreamDigest &) = delete;
            StreamDigest &operator=(const StreamDigest &) = delete;

            void update(const char *data, size_t size);

            // Lowercase hex digest. The accumulator cannot be updated afterwards.
            std::string finalizeHex();

        private:
            struct ContextDeleter
            {
                void operator()(EVP_MD_CTX *ctx) const;
            };

            std::unique_ptr<EVP_MD_CTX, ContextDeleter> ctx;
            bool finalized;
        };

        // One-shot digest of an in-memory buffer, as lowercase hex.
        std::string hexDigest(const std::vector<char> &data_buffer, Algorithm algorithm);

        // Lowercase hex encoding of raw bytes.
        std::string toHex(const unsigned char *bytes, size_t size);

    } // namespace Digest
} // namespace ChunkCombiner
