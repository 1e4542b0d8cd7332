// https://datatracker.ietf.org/doc/html/rfc5389
#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "stun_attribute.h"
#include "stun_error_category.h"
#include "stun_header.h"
#include "stun_message_types.h"
#include "stun_saslprep.h"

namespace stuncodec
{
    struct stun_codec_options
    {
        // Applied to passwords before they are turned into HMAC keys
        saslprep_function saslprep{ stuncodec::saslprep };

        // This is only intended to be used for the tests where the padding values are non-zero
        std::byte padding{ 0 };
    };

    class stun_message
    {
    public:
        // Binding request with an all zero transaction id
        stun_message() = default;

        stun_message(
            stun_method method,
            stun_message_class message_class,
            const transaction_id& id
        ) noexcept;

        // Uses a random transaction id
        static stun_result<stun_message> create(
            stun_method method,
            stun_message_class message_class
        );

        static stun_result<stun_message> create_request(
            stun_method method = stun_method::binding
        );

        static stun_message create_success_response(
            stun_method method,
            const transaction_id& id
        ) noexcept;

        static stun_message create_error_response(
            stun_method method,
            const transaction_id& id
        ) noexcept;

        static stun_result<stun_message> create_indication(
            stun_method method = stun_method::binding
        );

        // This method should not generally be called. It is primarily here for testing
        stun_message& set_transaction_id(
            const transaction_id& id
        ) noexcept;

        stun_message& set_message_class(
            stun_message_class message_class
        ) noexcept;

        stun_message& set_message_method(
            stun_method method
        ) noexcept;

        stun_message& add_attribute(
            stun_attribute attribute
        );

        // Appends a FINGERPRINT placeholder, computed during encode
        stun_message& add_fingerprint();

        // Appends a MESSAGE-INTEGRITY placeholder, computed during encode from
        // the password given to encode() and any USERNAME and REALM before it
        stun_message& add_message_integrity();

        stun_message& add_error_code(
            stun_error_code error
        );

        // Appends USERNAME and REALM (both run through SASLprep) followed by a
        // MESSAGE-INTEGRITY placeholder. Nothing is appended on failure.
        stun_result<void> add_long_term_credential_message_integrity(
            std::string_view username,
            std::string_view realm,
            const saslprep_function& saslprep = stuncodec::saslprep
        );

        const stun_header& get_header() const noexcept { return m_header; }
        const std::vector<stun_attribute>& get_attributes() const noexcept { return m_attributes; }

        // First attribute of the given type, if any
        template <detail::stun_attribute_value attribute_t>
        const attribute_t* find() const noexcept
        {
            for (auto& attribute : m_attributes)
            {
                if (auto value = std::get_if<attribute_t>(&attribute))
                {
                    return value;
                }
            }
            return nullptr;
        }

        // Serializes the message. Placeholder MESSAGE-INTEGRITY and
        // FINGERPRINT values are computed on the way; the password is
        // required when a MESSAGE-INTEGRITY placeholder is present.
        stun_result<std::vector<std::byte>> encode(
            std::optional<std::string_view> integrity_password = std::nullopt,
            const stun_codec_options& options = {}
        ) const;

        // Parses and validates a received message. FINGERPRINT is always
        // verified, MESSAGE-INTEGRITY only when a password is supplied.
        // Attributes following MESSAGE-INTEGRITY, other than FINGERPRINT, are
        // dropped.
        static stun_result<stun_message> decode(
            std::span<const std::byte> buffer,
            std::optional<std::string_view> integrity_password = std::nullopt,
            const stun_codec_options& options = {}
        );

        bool operator==(const stun_message&) const = default;

    private:
        stun_header m_header{};
        std::vector<stun_attribute> m_attributes;
    };
}
