// https://datatracker.ietf.org/doc/html/rfc5389#section-6
#pragma once

#include <optional>
#include <span>

#include "network_order_storage.h"
#include "stun_error_category.h"
#include "stun_message_types.h"

namespace stuncodec
{
    // All STUN messages MUST start with a 20-byte header followed by zero
    // or more Attributes.  The STUN header contains a STUN message type,
    // magic cookie, transaction ID, and message length.
    //
    //  0                   1                   2                   3
    //  0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
    // +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    // |0 0|     STUN Message Type     |         Message Length        |
    // +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    // |                         Magic Cookie                          |
    // +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    // |                                                               |
    // |                     Transaction ID (96 bits)                  |
    // |                                                               |
    // +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    //
    // message_length is only meaningful after decoding. It is recomputed
    // every time a message is encoded.
    struct stun_header
    {
        stun_message_class message_class{ stun_message_class::request };
        stun_method method{ stun_method::binding };
        transaction_id id{};
        std::uint16_t message_length{ 0 };

        bool operator==(const stun_header&) const noexcept = default;
    };

    std::uint16_t encode_message_type(
        stun_method method,
        stun_message_class message_class
    ) noexcept;

    void encode_header(
        const stun_header& header,
        util::stream_writer& writer
    );

    stun_result<stun_header> decode_header(
        util::stream_reader& reader
    ) noexcept;

    // Cheap check used to tell STUN apart from other protocols multiplexed
    // on the same socket (RTP, DTLS, ...). Only the header is inspected.
    std::optional<stun_header> check_for_stun_message_header(
        std::span<const std::byte> buffer
    ) noexcept;
}
