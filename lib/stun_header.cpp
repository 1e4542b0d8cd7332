#include "stuncodec/stun_header.h"

#include <algorithm>

namespace
{
    constexpr std::uint16_t c_class_mask = 0x0110;
    constexpr std::uint16_t c_method_mask = 0xFEEF;
    constexpr std::uint16_t c_reserved_mask = 0xC000;

    constexpr std::uint16_t encode_method(
        stuncodec::stun_method method
    ) noexcept
    {
        auto stun_method = static_cast<std::uint16_t>(method) & 0x0FFF;
        return ((stun_method       & 0x000F) |
               ((stun_method << 1) & 0x00E0) |
               ((stun_method << 2) & 0x0E00) |
               ((stun_method << 2) & 0x3000)
        );
    }

    constexpr std::uint16_t decode_method(std::uint16_t message_type) noexcept
    {
        auto stun_method = message_type & c_method_mask;
        return static_cast<std::uint16_t>(
            (stun_method & 0x000F) |
            ((stun_method & 0x00E0) >> 1) |
            ((stun_method & 0x0E00) >> 2) |
            ((stun_method & 0x3000) >> 2)
        );
    }

    static_assert(encode_method(stuncodec::stun_method::binding) == 0x0001);
    static_assert(decode_method(0x0111) == 0x0001);

    std::optional<stuncodec::stun_method> to_method(std::uint16_t method) noexcept
    {
        switch (static_cast<stuncodec::stun_method>(method))
        {
        case stuncodec::stun_method::binding:
            return stuncodec::stun_method::binding;
        }
        return std::nullopt;
    }

    std::optional<stuncodec::stun_message_class> to_message_class(std::uint16_t message_class) noexcept
    {
        switch (static_cast<stuncodec::stun_message_class>(message_class))
        {
        case stuncodec::stun_message_class::request:
        case stuncodec::stun_message_class::indication:
        case stuncodec::stun_message_class::success_response:
        case stuncodec::stun_message_class::error_response:
            return static_cast<stuncodec::stun_message_class>(message_class);
        }
        return std::nullopt;
    }
}

namespace stuncodec
{
    std::uint16_t encode_message_type(
        stun_method method,
        stun_message_class message_class
    ) noexcept
    {
        return encode_method(method) | static_cast<std::uint16_t>(message_class);
    }

    void encode_header(
        const stun_header& header,
        util::stream_writer& writer
    )
    {
        writer.write(encode_message_type(header.method, header.message_class));
        writer.write(header.message_length);
        writer.write(c_stun_magic_cookie);
        writer.write(header.id);
    }

    stun_result<stun_header> decode_header(
        util::stream_reader& reader
    ) noexcept
    {
        if (reader.remaining() < c_stun_header_size)
        {
            return make_unexpected(stun_header_error::read_failure);
        }

        auto message_type = *reader.read<std::uint16_t>();
        auto message_length = *reader.read<std::uint16_t>();
        auto magic_cookie = *reader.read<std::uint32_t>();
        auto id_bytes = *reader.read_bytes(c_stun_transaction_id_size);

        // Ensure that this is a stun message by checking the magic cookie
        if (magic_cookie != c_stun_magic_cookie)
        {
            return make_unexpected(stun_header_error::magic_cookie_mismatch);
        }

        // The two most significant bits are always zero, anything else can't
        // be a method we know about
        if ((message_type & c_reserved_mask) != 0)
        {
            return make_unexpected(
                stun_header_error::unrecognized_message_method,
                unrecognized_value_details{ static_cast<std::uint16_t>(message_type & c_method_mask) }
            );
        }

        auto method = to_method(decode_method(message_type));
        if (!method)
        {
            return make_unexpected(
                stun_header_error::unrecognized_message_method,
                unrecognized_value_details{ static_cast<std::uint16_t>(message_type & c_method_mask) }
            );
        }

        auto message_class = to_message_class(message_type & c_class_mask);
        if (!message_class)
        {
            return make_unexpected(
                stun_header_error::unrecognized_message_class,
                unrecognized_value_details{ static_cast<std::uint16_t>(message_type & c_class_mask) }
            );
        }

        stun_header header;
        header.message_class = *message_class;
        header.method = *method;
        header.message_length = message_length;
        std::copy(id_bytes.begin(), id_bytes.end(), header.id.begin());

        return header;
    }

    std::optional<stun_header> check_for_stun_message_header(
        std::span<const std::byte> buffer
    ) noexcept
    {
        util::stream_reader reader(buffer);

        auto header = decode_header(reader);
        if (!header)
        {
            return std::nullopt;
        }
        return *header;
    }
}
