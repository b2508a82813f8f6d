#include "holysheet/crypto.hpp"

#include <array>
#include <stdexcept>
#include <vector>

#include <sodium.h>

namespace holysheet::crypto
{

    namespace
    {

        // sodium_init() is safe to repeat, a static keeps it to one call per process.
        void require_sodium()
        {
            static const int status = sodium_init();
            if (status < 0)
            {
                throw std::runtime_error("libsodium could not be initialised");
            }
        }

        std::string hex(const unsigned char *data, std::size_t size)
        {
            std::string encoded(size * 2 + 1, '\0');
            sodium_bin2hex(encoded.data(), encoded.size(), data, size);
            encoded.pop_back();
            return encoded;
        }

    } // namespace

    std::string random_id(std::size_t bytes)
    {
        if (bytes == 0)
        {
            throw std::invalid_argument("random_id needs a positive byte count");
        }
        require_sodium();
        std::vector<unsigned char> raw(bytes);
        randombytes_buf(raw.data(), raw.size());
        return hex(raw.data(), raw.size());
    }

    std::string hash_bytes(std::span<const std::byte> data)
    {
        require_sodium();
        crypto_generichash_state state;
        std::array<unsigned char, crypto_generichash_BYTES> digest{};
        if (crypto_generichash_init(&state, nullptr, 0, digest.size()) != 0 ||
            crypto_generichash_update(&state, reinterpret_cast<const unsigned char *>(data.data()), data.size()) != 0 ||
            crypto_generichash_final(&state, digest.data(), digest.size()) != 0)
        {
            throw std::runtime_error("BLAKE2b digest failed");
        }
        return hex(digest.data(), digest.size());
    }

    std::string hash_string(std::string_view text)
    {
        return hash_bytes(std::as_bytes(std::span<const char>(text.data(), text.size())));
    }

} // namespace holysheet::crypto
