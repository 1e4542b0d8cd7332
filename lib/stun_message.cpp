#include "stuncodec/stun_message.h"

#include <algorithm>
#include <string>
#include <utility>

#include "stuncodec/network_order_storage.h"
#include "stuncodec/stun_fingerprint.h"
#include "stuncodec/stun_password_generator.h"

namespace
{
    constexpr std::size_t c_max_message_length = 0xFFFF;
    constexpr std::size_t c_message_length_offset = 2;

    std::optional<std::string_view> to_view(const std::optional<std::string>& value) noexcept
    {
        if (value)
        {
            return std::string_view{ *value };
        }
        return std::nullopt;
    }
}

namespace stuncodec
{
    stun_message::stun_message(
        stun_method method,
        stun_message_class message_class,
        const transaction_id& id
    ) noexcept
    {
        m_header.method = method;
        m_header.message_class = message_class;
        m_header.id = id;
    }

    stun_result<stun_message> stun_message::create(
        stun_method method,
        stun_message_class message_class
    )
    {
        auto id = stun_password_generator::generate_id();
        if (!id)
        {
            return std::unexpected(id.error());
        }

        return stun_message{ method, message_class, *id };
    }

    stun_result<stun_message> stun_message::create_request(
        stun_method method
    )
    {
        return create(method, stun_message_class::request);
    }

    stun_message stun_message::create_success_response(
        stun_method method,
        const transaction_id& id
    ) noexcept
    {
        return stun_message{ method, stun_message_class::success_response, id };
    }

    stun_message stun_message::create_error_response(
        stun_method method,
        const transaction_id& id
    ) noexcept
    {
        return stun_message{ method, stun_message_class::error_response, id };
    }

    stun_result<stun_message> stun_message::create_indication(
        stun_method method
    )
    {
        return create(method, stun_message_class::indication);
    }

    stun_message& stun_message::set_transaction_id(
        const transaction_id& id
    ) noexcept
    {
        m_header.id = id;

        return *this;
    }

    stun_message& stun_message::set_message_class(
        stun_message_class message_class
    ) noexcept
    {
        m_header.message_class = message_class;

        return *this;
    }

    stun_message& stun_message::set_message_method(
        stun_method method
    ) noexcept
    {
        m_header.method = method;

        return *this;
    }

    stun_message& stun_message::add_attribute(
        stun_attribute attribute
    )
    {
        m_attributes.push_back(std::move(attribute));

        return *this;
    }

    stun_message& stun_message::add_fingerprint()
    {
        return add_attribute(fingerprint_attribute{});
    }

    stun_message& stun_message::add_message_integrity()
    {
        return add_attribute(message_integrity_attribute{});
    }

    stun_message& stun_message::add_error_code(
        stun_error_code error
    )
    {
        return add_attribute(error_code_attribute::from_error_code(error));
    }

    stun_result<void> stun_message::add_long_term_credential_message_integrity(
        std::string_view username,
        std::string_view realm,
        const saslprep_function& saslprep
    )
    {
        username_attribute username_attr{ std::string{ username } };
        realm_attribute realm_attr{ std::string{ realm } };

        if (saslprep)
        {
            auto prepared_username = saslprep(username);
            if (!prepared_username)
            {
                return std::unexpected(prepared_username.error());
            }

            auto prepared_realm = saslprep(realm);
            if (!prepared_realm)
            {
                return std::unexpected(prepared_realm.error());
            }

            username_attr.value = std::move(*prepared_username);
            realm_attr.value = std::move(*prepared_realm);
        }

        add_attribute(std::move(username_attr));
        add_attribute(std::move(realm_attr));
        add_message_integrity();

        return {};
    }

    stun_result<std::vector<std::byte>> stun_message::encode(
        std::optional<std::string_view> integrity_password,
        const stun_codec_options& options
    ) const
    {
        std::vector<std::byte> buffer;
        util::stream_writer writer(buffer);

        auto header = m_header;
        header.message_length = 0;
        encode_header(header, writer);

        stun_password_generator generator(options.saslprep);

        bool integrity_present = false;
        std::optional<std::string_view> username;
        std::optional<std::string_view> realm;

        const auto attribute_count = m_attributes.size();
        for (std::size_t index = 0; index < attribute_count; ++index)
        {
            const auto& attribute = m_attributes[index];

            // Placeholder values are swapped for computed ones
            std::optional<stun_attribute> computed;

            if (auto fingerprint = std::get_if<fingerprint_attribute>(&attribute))
            {
                if (index != attribute_count - 1)
                {
                    return make_unexpected(
                        stun_message_error::incorrect_fingerprint_attribute_position,
                        attribute_position_details{ attribute_count, index }
                    );
                }

                if (fingerprint->value == 0)
                {
                    // The length has to cover the FINGERPRINT attribute before the crc is taken
                    auto message_length = writer.size() + c_stun_fingerprint_attribute_size - c_stun_header_size;
                    if (message_length > c_max_message_length)
                    {
                        return make_unexpected(stun_message_error::message_too_large);
                    }

                    writer.patch<std::uint16_t>(c_message_length_offset, static_cast<std::uint16_t>(message_length));
                    computed = fingerprint_attribute{ compute_fingerprint(writer.data()) };
                }
            }
            else if (auto integrity = std::get_if<message_integrity_attribute>(&attribute))
            {
                integrity_present = true;

                if (integrity->hmac.empty())
                {
                    if (!integrity_password)
                    {
                        return make_unexpected(stun_message_error::missing_integrity_password);
                    }

                    auto key = generator.derive_key(*integrity_password, realm, username);
                    if (!key)
                    {
                        return std::unexpected(key.error());
                    }

                    auto hmac = generator.compute_integrity_sha1(*key, writer.data());
                    if (!hmac)
                    {
                        return std::unexpected(hmac.error());
                    }

                    computed = message_integrity_attribute{ { hmac->begin(), hmac->end() } };
                }
            }
            else
            {
                if (integrity_present)
                {
                    return make_unexpected(stun_message_error::attribute_after_integrity);
                }

                if (auto value = std::get_if<username_attribute>(&attribute))
                {
                    username = value->value;
                }
                else if (auto value = std::get_if<realm_attribute>(&attribute))
                {
                    realm = value->value;
                }
            }

            auto result = encode_attribute(computed ? *computed : attribute, m_header.id, writer, options.padding);
            if (!result)
            {
                return std::unexpected(result.error());
            }
        }

        auto message_length = writer.size() - c_stun_header_size;
        if (message_length > c_max_message_length)
        {
            return make_unexpected(stun_message_error::message_too_large);
        }

        writer.patch<std::uint16_t>(c_message_length_offset, static_cast<std::uint16_t>(message_length));

        return buffer;
    }

    stun_result<stun_message> stun_message::decode(
        std::span<const std::byte> buffer,
        std::optional<std::string_view> integrity_password,
        const stun_codec_options& options
    )
    {
        util::stream_reader reader(buffer);

        auto header = decode_header(reader);
        if (!header)
        {
            return std::unexpected(header.error());
        }

        stun_message message;
        message.m_header = *header;

        stun_password_generator generator(options.saslprep);

        bool integrity_seen = false;
        std::optional<std::string> username;
        std::optional<std::string> realm;

        while (!reader.empty())
        {
            const auto attribute_position = reader.position();

            auto attribute = decode_attribute(reader, header->id);
            if (!attribute)
            {
                // Comprehension-optional attributes we don't understand are skipped
                auto& error = attribute.error();
                if (error.code == stun_attribute_error::unrecognized_attribute_type)
                {
                    auto details = error.get_details<unrecognized_value_details>();
                    if (details && !is_comprehension_required(details->value))
                    {
                        continue;
                    }
                }
                return std::unexpected(error);
            }

            // Everything after MESSAGE-INTEGRITY except FINGERPRINT is ignored
            bool keep = !integrity_seen;

            if (auto value = std::get_if<username_attribute>(&*attribute))
            {
                username = value->value;
            }
            else if (auto value = std::get_if<realm_attribute>(&*attribute))
            {
                realm = value->value;
            }
            else if (auto fingerprint = std::get_if<fingerprint_attribute>(&*attribute))
            {
                if (!reader.empty())
                {
                    return make_unexpected(
                        stun_message_error::incorrect_fingerprint_attribute_position,
                        attribute_position_details{ buffer.size(), attribute_position }
                    );
                }

                auto computed = compute_fingerprint(buffer.first(attribute_position));
                if (computed != fingerprint->value)
                {
                    return make_unexpected(
                        stun_message_error::fingerprint_mismatch,
                        fingerprint_mismatch_details{ fingerprint->value, computed }
                    );
                }

                keep = true;
            }
            else if (auto integrity = std::get_if<message_integrity_attribute>(&*attribute))
            {
                integrity_seen = true;

                if (integrity_password)
                {
                    auto key = generator.derive_key(*integrity_password, to_view(realm), to_view(username));
                    if (!key)
                    {
                        return std::unexpected(key.error());
                    }

                    auto hmac = generator.compute_integrity_sha1(*key, buffer.first(attribute_position));
                    if (!hmac)
                    {
                        return std::unexpected(hmac.error());
                    }

                    if (!std::equal(hmac->begin(), hmac->end(), integrity->hmac.begin(), integrity->hmac.end()))
                    {
                        return make_unexpected(
                            stun_message_error::message_integrity_fail,
                            integrity_mismatch_details{ integrity->hmac, { hmac->begin(), hmac->end() } }
                        );
                    }
                }
            }

            if (keep)
            {
                message.m_attributes.push_back(std::move(*attribute));
            }
        }

        return message;
    }
}
