#include "stuncodec/stun_attribute.h"

#include <algorithm>
#include <limits>
#include <type_traits>

#include "utf8.h"

namespace
{
    using stuncodec::stun_attribute_error;
    using stuncodec::make_unexpected;

    constexpr std::size_t c_address_header_size = 4;

    // Magic cookie followed by the transaction id, used to obfuscate XOR
    // addresses. IPv4 only uses the first four bytes.
    std::array<std::byte, 16> make_xor_key(const stuncodec::transaction_id& id) noexcept
    {
        std::array<std::byte, 16> key{};
        stuncodec::util::store_network_ordered(std::span{ key }, stuncodec::c_stun_magic_cookie);
        std::copy(id.begin(), id.end(), key.begin() + 4);
        return key;
    }

    template <typename attribute_t>
    constexpr bool is_xor_address_v = std::is_same_v<attribute_t, stuncodec::xor_mapped_address_attribute>;

    template <stuncodec::detail::address_attribute_value attribute_t>
    stuncodec::stun_result<stuncodec::stun_attribute> decode_address(
        std::span<const std::byte> value,
        const stuncodec::transaction_id& id
    )
    {
        if (value.size() < c_address_header_size + 4)
        {
            return make_unexpected(stun_attribute_error::insufficient_data);
        }

        attribute_t attribute;
        auto& address = attribute.address;

        auto family = static_cast<std::uint8_t>(value[1]);
        address.port = stuncodec::util::load_network_ordered<std::uint16_t>(value.subspan(2));

        switch (family)
        {
        case static_cast<std::uint8_t>(stuncodec::address_family::ipv4):
            address.family = stuncodec::address_family::ipv4;
            break;
        case static_cast<std::uint8_t>(stuncodec::address_family::ipv6):
            address.family = stuncodec::address_family::ipv6;
            break;
        default:
            return make_unexpected(
                stun_attribute_error::invalid_value,
                stuncodec::unrecognized_value_details{ family }
            );
        }

        auto address_bytes = value.subspan(c_address_header_size);
        if (address_bytes.size() < address.address_size())
        {
            return make_unexpected(stun_attribute_error::insufficient_data);
        }

        std::copy_n(address_bytes.begin(), address.address_size(), address.address.begin());

        if constexpr (is_xor_address_v<attribute_t>)
        {
            address.port ^= static_cast<std::uint16_t>(stuncodec::c_stun_magic_cookie >> 16);

            auto key = make_xor_key(id);
            for (std::size_t i = 0; i < address.address_size(); ++i)
            {
                address.address[i] ^= key[i];
            }
        }

        return attribute;
    }

    template <stuncodec::detail::text_attribute_value attribute_t>
    stuncodec::stun_result<stuncodec::stun_attribute> decode_text(
        std::span<const std::byte> value
    )
    {
        if (!stuncodec::detail::is_valid_utf8(value))
        {
            return make_unexpected(stun_attribute_error::invalid_string);
        }

        attribute_t attribute;
        attribute.value.assign(reinterpret_cast<const char*>(value.data()), value.size());
        return attribute;
    }

    template <std::integral T>
    stuncodec::stun_result<T> decode_integral(
        std::span<const std::byte> value
    )
    {
        if (value.size() < sizeof(T))
        {
            return make_unexpected(stun_attribute_error::insufficient_data);
        }
        else if (value.size() > sizeof(T))
        {
            return make_unexpected(
                stun_attribute_error::invalid_value,
                stuncodec::value_too_big_details{ sizeof(T), value.size() }
            );
        }

        return stuncodec::util::load_network_ordered<T>(value);
    }

    stuncodec::stun_result<stuncodec::stun_attribute> decode_error_code(
        std::span<const std::byte> value
    )
    {
        if (value.size() < 4)
        {
            return make_unexpected(stun_attribute_error::insufficient_data);
        }

        auto reason = value.subspan(4);
        if (!stuncodec::detail::is_valid_utf8(reason))
        {
            return make_unexpected(stun_attribute_error::invalid_string);
        }

        stuncodec::error_code_attribute attribute;
        attribute.error_class = static_cast<std::uint8_t>(value[2]);
        attribute.number = static_cast<std::uint8_t>(value[3]);
        attribute.reason.assign(reinterpret_cast<const char*>(reason.data()), reason.size());
        return attribute;
    }

    stuncodec::stun_result<stuncodec::stun_attribute> decode_unknown_attributes(
        std::span<const std::byte> value
    )
    {
        if (value.size() % 2 != 0)
        {
            return make_unexpected(stun_attribute_error::insufficient_data);
        }

        stuncodec::unknown_attributes_attribute attribute;
        stuncodec::util::stream_reader reader(value);
        while (auto type = reader.read<std::uint16_t>())
        {
            attribute.types.push_back(*type);
        }
        return attribute;
    }

    template <typename attribute_t, typename T>
    stuncodec::stun_result<stuncodec::stun_attribute> wrap(
        stuncodec::stun_result<T>&& value,
        T attribute_t::* member
    )
    {
        if (!value)
        {
            return std::unexpected(std::move(value.error()));
        }

        attribute_t attribute;
        attribute.*member = *value;
        return attribute;
    }

    stuncodec::stun_result<void> check_text(
        std::string_view value,
        std::size_t limit
    )
    {
        if (value.size() > limit)
        {
            return make_unexpected(
                stun_attribute_error::utf8_value_too_big,
                stuncodec::value_too_big_details{ limit, value.size() }
            );
        }

        if (!stuncodec::detail::is_valid_utf8(stuncodec::detail::as_bytes(value)))
        {
            return make_unexpected(stun_attribute_error::invalid_string);
        }
        return {};
    }

    void write_text(stuncodec::util::stream_writer& writer, std::string_view value)
    {
        writer.write(stuncodec::detail::as_bytes(value));
    }

    template <stuncodec::detail::address_attribute_value attribute_t>
    stuncodec::stun_result<void> encode_value(
        const attribute_t& attribute,
        const stuncodec::transaction_id& id,
        stuncodec::util::stream_writer& writer
    )
    {
        const auto& address = attribute.address;

        if (address.family != stuncodec::address_family::ipv4 && address.family != stuncodec::address_family::ipv6)
        {
            return make_unexpected(
                stun_attribute_error::invalid_value,
                stuncodec::unrecognized_value_details{ static_cast<std::uint8_t>(address.family) }
            );
        }

        auto port = address.port;
        auto address_bytes = address.address;

        if constexpr (is_xor_address_v<attribute_t>)
        {
            port ^= static_cast<std::uint16_t>(stuncodec::c_stun_magic_cookie >> 16);

            auto key = make_xor_key(id);
            for (std::size_t i = 0; i < address.address_size(); ++i)
            {
                address_bytes[i] ^= key[i];
            }
        }

        writer.write(std::uint8_t{ 0 });
        writer.write(static_cast<std::uint8_t>(address.family));
        writer.write(port);
        writer.write(std::span<const std::byte>{ address_bytes.data(), address.address_size() });
        return {};
    }

    template <stuncodec::detail::text_attribute_value attribute_t>
    stuncodec::stun_result<void> encode_value(
        const attribute_t& attribute,
        const stuncodec::transaction_id&,
        stuncodec::util::stream_writer& writer
    )
    {
        auto checked = check_text(attribute.value, attribute_t::c_max_size);
        if (!checked)
        {
            return checked;
        }

        write_text(writer, attribute.value);
        return {};
    }

    stuncodec::stun_result<void> encode_value(
        const stuncodec::message_integrity_attribute& attribute,
        const stuncodec::transaction_id&,
        stuncodec::util::stream_writer& writer
    )
    {
        writer.write(attribute.hmac);
        return {};
    }

    stuncodec::stun_result<void> encode_value(
        const stuncodec::fingerprint_attribute& attribute,
        const stuncodec::transaction_id&,
        stuncodec::util::stream_writer& writer
    )
    {
        writer.write(attribute.value);
        return {};
    }

    stuncodec::stun_result<void> encode_value(
        const stuncodec::error_code_attribute& attribute,
        const stuncodec::transaction_id&,
        stuncodec::util::stream_writer& writer
    )
    {
        auto checked = check_text(attribute.reason, stuncodec::error_code_attribute::c_max_size);
        if (!checked)
        {
            return checked;
        }

        writer.write(std::uint16_t{ 0 });
        writer.write(attribute.error_class);
        writer.write(attribute.number);
        write_text(writer, attribute.reason);
        return {};
    }

    stuncodec::stun_result<void> encode_value(
        const stuncodec::unknown_attributes_attribute& attribute,
        const stuncodec::transaction_id&,
        stuncodec::util::stream_writer& writer
    )
    {
        for (auto type : attribute.types)
        {
            writer.write(type);
        }
        return {};
    }

    stuncodec::stun_result<void> encode_value(
        const stuncodec::priority_attribute& attribute,
        const stuncodec::transaction_id&,
        stuncodec::util::stream_writer& writer
    )
    {
        writer.write(attribute.value);
        return {};
    }

    stuncodec::stun_result<void> encode_value(
        const stuncodec::use_candidate_attribute&,
        const stuncodec::transaction_id&,
        stuncodec::util::stream_writer&
    )
    {
        return {};
    }

    template <typename attribute_t>
        requires std::is_same_v<attribute_t, stuncodec::ice_controlled_attribute> ||
                 std::is_same_v<attribute_t, stuncodec::ice_controlling_attribute>
    stuncodec::stun_result<void> encode_value(
        const attribute_t& attribute,
        const stuncodec::transaction_id&,
        stuncodec::util::stream_writer& writer
    )
    {
        writer.write(attribute.tie_breaker);
        return {};
    }
}

namespace stuncodec
{
    error_code_attribute error_code_attribute::from_error_code(
        stun_error_code error
    )
    {
        error_code_attribute attribute;

        auto code = static_cast<std::uint16_t>(error);
        attribute.error_class = static_cast<std::uint8_t>(code / 100);
        attribute.number = static_cast<std::uint8_t>(code % 100);
        attribute.reason = get_reason_phrase(error);

        return attribute;
    }

    stun_attribute_type get_attribute_type(
        const stun_attribute& attribute
    ) noexcept
    {
        return std::visit([](const auto& value) noexcept {
            return std::remove_cvref_t<decltype(value)>::c_type;
        }, attribute);
    }

    stun_result<stun_attribute> decode_attribute(
        util::stream_reader& reader,
        const transaction_id& id
    )
    {
        auto type = reader.read<std::uint16_t>();
        auto length = reader.read<std::uint16_t>();
        if (!type || !length)
        {
            return make_unexpected(stun_attribute_error::read_failure);
        }

        auto value = reader.read_bytes(*length);
        if (!value)
        {
            return make_unexpected(stun_attribute_error::read_failure);
        }

        // Padding after the last attribute may be left off
        if (!reader.skip(std::min(detail::padding_size(*length), reader.remaining())))
        {
            return make_unexpected(stun_attribute_error::read_failure);
        }

        // The value has been consumed at this point so the caller can carry
        // on with the next attribute if it chooses to ignore this one.
        auto attribute_type = to_attribute_type(*type);
        if (!attribute_type)
        {
            return make_unexpected(
                stun_attribute_error::unrecognized_attribute_type,
                unrecognized_value_details{ *type }
            );
        }

        switch (*attribute_type)
        {
        case stun_attribute_type::mapped_address:
            return decode_address<mapped_address_attribute>(*value, id);
        case stun_attribute_type::xor_mapped_address:
            return decode_address<xor_mapped_address_attribute>(*value, id);
        case stun_attribute_type::alternate_server:
            return decode_address<alternate_server_attribute>(*value, id);
        case stun_attribute_type::username:
            return decode_text<username_attribute>(*value);
        case stun_attribute_type::realm:
            return decode_text<realm_attribute>(*value);
        case stun_attribute_type::nonce:
            return decode_text<nonce_attribute>(*value);
        case stun_attribute_type::software:
            return decode_text<software_attribute>(*value);
        case stun_attribute_type::message_integrity:
            return message_integrity_attribute{ { value->begin(), value->end() } };
        case stun_attribute_type::fingerprint:
            return wrap(decode_integral<std::uint32_t>(*value), &fingerprint_attribute::value);
        case stun_attribute_type::priority:
            return wrap(decode_integral<std::uint32_t>(*value), &priority_attribute::value);
        case stun_attribute_type::ice_controlled:
            return wrap(decode_integral<std::uint64_t>(*value), &ice_controlled_attribute::tie_breaker);
        case stun_attribute_type::ice_controlling:
            return wrap(decode_integral<std::uint64_t>(*value), &ice_controlling_attribute::tie_breaker);
        case stun_attribute_type::error_code:
            return decode_error_code(*value);
        case stun_attribute_type::unknown_attributes:
            return decode_unknown_attributes(*value);
        case stun_attribute_type::use_candidate:
            return use_candidate_attribute{};
        }

        return make_unexpected(
            stun_attribute_error::unrecognized_attribute_type,
            unrecognized_value_details{ *type }
        );
    }

    stun_result<void> encode_attribute(
        const stun_attribute& attribute,
        const transaction_id& id,
        util::stream_writer& writer,
        std::byte padding
    )
    {
        std::vector<std::byte> value;
        util::stream_writer value_writer(value);

        auto encoded = std::visit([&](const auto& typed) {
            return encode_value(typed, id, value_writer);
        }, attribute);

        if (!encoded)
        {
            return encoded;
        }

        if (value.size() > std::numeric_limits<std::uint16_t>::max())
        {
            return make_unexpected(
                stun_attribute_error::write_failure,
                value_too_big_details{ std::numeric_limits<std::uint16_t>::max(), value.size() }
            );
        }

        writer.write(static_cast<std::uint16_t>(get_attribute_type(attribute)));
        writer.write(static_cast<std::uint16_t>(value.size()));
        writer.write(value);
        writer.write_padding(detail::padding_size(value.size()), padding);

        return {};
    }
}
