// src/digest_utility.cpp
#include "digest_utility.hpp"
#include <iomanip>   // For std::hex, std::setw, std::setfill
#include <sstream>   // For std::stringstream
#include <stdexcept> // For std::runtime_error

// OpenSSL EVP digests; link OpenSSL::Crypto
#include <openssl/evp.h>

namespace ChunkCombiner
{
    namespace Digest
    {

        namespace
        {
            const EVP_MD *evpFor(Algorithm algorithm)
            {
                switch (algorithm)
                {
                case Algorithm::MD5:
                    return EVP_md5();
                case Algorithm::SHA256:
                    return EVP_sha256();
                }
                throw std::invalid_argument("Unknown digest algorithm.");
            }
        } // namespace

        void StreamDigest::ContextDeleter::operator()(EVP_MD_CTX *ctx) const
        {
            EVP_MD_CTX_free(ctx);
        }

        StreamDigest::StreamDigest(Algorithm algorithm) : ctx(EVP_MD_CTX_new()), finalized(false)
        {
            if (!ctx)
            {
                throw std::runtime_error("Failed to allocate digest context.");
            }
            if (EVP_DigestInit_ex(ctx.get(), evpFor(algorithm), nullptr) != 1)
            {
                throw std::runtime_error("Failed to initialize digest context.");
            }
        }

        StreamDigest::~StreamDigest() = default;
        StreamDigest::StreamDigest(StreamDigest &&) noexcept = default;
        StreamDigest &StreamDigest::operator=(StreamDigest &&) noexcept = default;

        void StreamDigest::update(const char *data, size_t size)
        {
            if (finalized)
            {
                throw std::logic_error("Digest updated after it was finalized.");
            }
            if (size == 0)
            {
                return;
            }
            if (EVP_DigestUpdate(ctx.get(), data, size) != 1)
            {
                throw std::runtime_error("Failed to update digest context with data.");
            }
        }

        std::string StreamDigest::finalizeHex()
        {
            if (finalized)
            {
                throw std::logic_error("Digest finalized twice.");
            }
            unsigned char hash[EVP_MAX_MD_SIZE];
            unsigned int hash_len = 0;
            if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1)
            {
                throw std::runtime_error("Failed to finalize digest calculation.");
            }
            finalized = true;
            return toHex(hash, hash_len);
        }

        std::string hexDigest(const std::vector<char> &data_buffer, Algorithm algorithm)
        {
            StreamDigest digest(algorithm);
            digest.update(data_buffer.data(), data_buffer.size());
            return digest.finalizeHex();
        }

        std::string toHex(const unsigned char *bytes, size_t size)
        {
            std::stringstream ss;
            for (size_t i = 0; i < size; i++)
            {
                ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
            }
            return ss.str();
        }

    } // namespace Digest
} // namespace ChunkCombiner
