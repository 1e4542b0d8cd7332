#include "stuncodec/stun_password_generator.h"

#include <utility>
#include <string>

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include "stuncodec/network_order_storage.h"

namespace
{
    // HMAC refuses a null key, so an empty password hashes with this instead
    constexpr unsigned char c_empty_key = 0;

    const unsigned char* as_uchar(std::span<const std::byte> bytes) noexcept
    {
        return bytes.empty() ? &c_empty_key : reinterpret_cast<const unsigned char*>(bytes.data());
    }

    std::span<const std::byte> as_bytes(std::string_view text) noexcept
    {
        return { reinterpret_cast<const std::byte*>(text.data()), text.size() };
    }
}

namespace stuncodec
{
    stun_password_generator::stun_password_generator(
        saslprep_function saslprep
    ) :
        m_saslprep(std::move(saslprep))
    {
    }

    stun_result<std::vector<std::byte>> stun_password_generator::generate_short_term_key(
        std::string_view password
    ) const
    {
        if (!m_saslprep)
        {
            auto bytes = as_bytes(password);
            return std::vector<std::byte>(bytes.begin(), bytes.end());
        }

        auto prepared = m_saslprep(password);
        if (!prepared)
        {
            return std::unexpected(prepared.error());
        }

        auto bytes = as_bytes(*prepared);
        return std::vector<std::byte>(bytes.begin(), bytes.end());
    }

    stun_result<std::array<std::byte, 16>> stun_password_generator::generate_long_term_md5_key(
        std::string_view username,
        std::string_view realm,
        std::string_view password
    ) const
    {
        auto prepared = generate_short_term_key(password);
        if (!prepared)
        {
            return std::unexpected(prepared.error());
        }

        std::string key;
        key.reserve(username.size() + realm.size() + prepared->size() + 2);
        key.append(username);
        key.push_back(':');
        key.append(realm);
        key.push_back(':');
        key.append(reinterpret_cast<const char*>(prepared->data()), prepared->size());

        std::array<std::byte, 16> hash_buffer{};
        unsigned int hash_size = 0;

        auto res = EVP_Digest(
            key.data(),
            key.size(),
            reinterpret_cast<unsigned char*>(hash_buffer.data()),
            &hash_size,
            EVP_md5(),
            nullptr
        );

        if (res != 1 || hash_size != hash_buffer.size())
        {
            return make_unexpected(stun_integrity_error::crypto_failure);
        }

        return hash_buffer;
    }

    stun_result<std::vector<std::byte>> stun_password_generator::derive_key(
        std::string_view password,
        std::optional<std::string_view> realm,
        std::optional<std::string_view> username
    ) const
    {
        if (!realm)
        {
            return generate_short_term_key(password);
        }

        if (!username)
        {
            return make_unexpected(stun_integrity_error::missing_username);
        }

        auto key = generate_long_term_md5_key(*username, *realm, password);
        if (!key)
        {
            return std::unexpected(key.error());
        }

        return std::vector<std::byte>(key->begin(), key->end());
    }

    stun_result<std::array<std::byte, c_stun_integrity_size>> stun_password_generator::compute_integrity_sha1(
        std::span<const std::byte> key,
        std::span<const std::byte> message
    ) const
    {
        if (message.size() < c_stun_header_size)
        {
            return make_unexpected(stun_header_error::read_failure);
        }

        auto patched_length = message.size() - c_stun_header_size + c_stun_integrity_attribute_size;
        if (patched_length > 0xFFFF)
        {
            return make_unexpected(stun_message_error::message_too_large);
        }

        // The length field has to include the MESSAGE-INTEGRITY attribute
        // itself, so hash a copy with the length rewritten.
        std::vector<std::byte> buffer(message.begin(), message.end());
        util::store_network_ordered<std::uint16_t>(
            std::span<std::byte>{ buffer }.subspan(2, 2),
            static_cast<std::uint16_t>(patched_length)
        );

        std::array<std::byte, c_stun_integrity_size> hmac{};
        unsigned int hmac_size = 0;

        auto res = HMAC(
            EVP_sha1(),
            as_uchar(key),
            static_cast<int>(key.size()),
            reinterpret_cast<const unsigned char*>(buffer.data()),
            buffer.size(),
            reinterpret_cast<unsigned char*>(hmac.data()),
            &hmac_size
        );

        if (res == nullptr || hmac_size != hmac.size())
        {
            return make_unexpected(stun_integrity_error::crypto_failure);
        }

        return hmac;
    }

    stun_result<transaction_id> stun_password_generator::generate_id() noexcept
    {
        transaction_id id{};
        if (RAND_bytes(reinterpret_cast<unsigned char*>(id.data()), static_cast<int>(id.size())) != 1)
        {
            return make_unexpected(stun_integrity_error::crypto_failure);
        }

        return id;
    }
}
