#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "stun_error_category.h"
#include "stun_message_types.h"
#include "stun_saslprep.h"

namespace stuncodec
{
    class stun_password_generator
    {
    public:
        explicit stun_password_generator(
            saslprep_function saslprep = stuncodec::saslprep
        );

        // For short-term credentials, the Hash-Based Message Authentication
        //     Code (HMAC) key is defined as follow:
        //
        // key = SASLprep(password)
        stun_result<std::vector<std::byte>> generate_short_term_key(
            std::string_view password
        ) const;

        // This password algorithm is taken from [RFC1321].
        //
        // The key length is 16 bytes.
        //
        // key = MD5(username ":" realm ":" SASLprep(password))
        stun_result<std::array<std::byte, 16>> generate_long_term_md5_key(
            std::string_view username,
            std::string_view realm,
            std::string_view password
        ) const;

        // Picks the short-term or long-term form. A realm without a username
        // is rejected with stun_integrity_error::missing_username.
        stun_result<std::vector<std::byte>> derive_key(
            std::string_view password,
            std::optional<std::string_view> realm,
            std::optional<std::string_view> username
        ) const;

        // HMAC-SHA1 over the message up to (but excluding) the
        // MESSAGE-INTEGRITY attribute. The header length in the computation
        // covers the MESSAGE-INTEGRITY attribute; message is left untouched.
        stun_result<std::array<std::byte, c_stun_integrity_size>> compute_integrity_sha1(
            std::span<const std::byte> key,
            std::span<const std::byte> message
        ) const;

        static stun_result<transaction_id> generate_id() noexcept;

    private:
        saslprep_function m_saslprep;
    };
}
