// https://datatracker.ietf.org/doc/html/rfc5389#section-15
#pragma once

#include <concepts>
#include <string>
#include <variant>
#include <vector>

#include "network_order_storage.h"
#include "stun_error_category.h"
#include "stun_message_types.h"

namespace stuncodec
{
    // After the STUN header are zero or more attributes.  Each attribute
    // MUST be TLV encoded, with a 16-bit type, 16-bit length, and value.
    // Each STUN attribute MUST end on a 32-bit boundary.  As mentioned
    // above, all fields in an attribute are transmitted most significant
    // bit first.
    //
    //  0                   1                   2                   3
    //  0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
    // +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    // |         Type                  |            Length             |
    // +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    // |                         Value (variable)                ....
    // +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+

    // The MAPPED-ADDRESS attribute indicates a reflexive transport address
    // of the client.  It consists of an 8-bit address family and a 16-bit
    // port, followed by a fixed-length value representing the IP address.
    // If the address family is IPv4, the address MUST be 32 bits.  If the
    // address family is IPv6, the address MUST be 128 bits.  All fields
    // must be in network byte order.
    //
    //  0                   1                   2                   3
    //  0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
    // +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    // |0 0 0 0 0 0 0 0|    Family     |           Port                |
    // +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    // |                                                               |
    // |                 Address (32 bits or 128 bits)                 |
    // |                                                               |
    // +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    struct mapped_address_attribute
    {
        inline static constexpr auto c_type = stun_attribute_type::mapped_address;
        socket_address address;

        bool operator==(const mapped_address_attribute&) const noexcept = default;
    };

    // The XOR-MAPPED-ADDRESS attribute is identical to the MAPPED-ADDRESS
    // attribute, except that the reflexive transport address is obfuscated
    // through the XOR function.
    //
    // X-Port is computed by taking the mapped port in host byte order,
    // XOR'ing it with the most significant 16 bits of the magic cookie, and
    // then the converting the result to network byte order.  If the IP
    // address family is IPv4, X-Address is computed by taking the mapped IP
    // address in host byte order, XOR'ing it with the magic cookie, and
    // converting the result to network byte order.  If the IP address
    // family is IPv6, X-Address is computed by taking the mapped IP address
    // in host byte order, XOR'ing it with the concatenation of the magic
    // cookie and the 96-bit transaction ID, and converting the result to
    // network byte order.
    struct xor_mapped_address_attribute
    {
        inline static constexpr auto c_type = stun_attribute_type::xor_mapped_address;
        socket_address address;

        bool operator==(const xor_mapped_address_attribute&) const noexcept = default;
    };

    // The USERNAME attribute is used for message integrity.  It identifies
    // the username and password combination used in the message-integrity
    // check.
    //
    // The value of USERNAME is a variable-length value.  It MUST contain a
    // UTF-8 [RFC3629] encoded sequence of less than 513 bytes, and MUST
    // have been processed using SASLprep [RFC4013].
    struct username_attribute
    {
        inline static constexpr auto c_type = stun_attribute_type::username;
        inline static constexpr auto c_max_size = c_max_username_size;
        std::string value;

        bool operator==(const username_attribute&) const noexcept = default;
    };

    // The MESSAGE-INTEGRITY attribute contains an HMAC-SHA1 [RFC2104] of
    // the STUN message.  The MESSAGE-INTEGRITY attribute can be present in
    // any STUN message type.  Since it uses the SHA1 hash, the HMAC will be
    // 20 bytes.  The text used as input to HMAC is the STUN message,
    // including the header, up to and including the attribute preceding the
    // MESSAGE-INTEGRITY attribute.  With the exception of the FINGERPRINT
    // attribute, which appears after MESSAGE-INTEGRITY, agents MUST ignore
    // all other attributes that follow MESSAGE-INTEGRITY.
    //
    // An empty hmac is a placeholder which is filled in when the message is
    // encoded.
    struct message_integrity_attribute
    {
        inline static constexpr auto c_type = stun_attribute_type::message_integrity;
        std::vector<std::byte> hmac;

        bool operator==(const message_integrity_attribute&) const noexcept = default;
    };

    // The FINGERPRINT attribute MAY be present in all STUN messages.  The
    // value of the attribute is computed as the CRC-32 of the STUN message
    // up to (but excluding) the FINGERPRINT attribute itself, XOR'ed with
    // the 32-bit value 0x5354554e.
    //
    // A value of zero is a placeholder which is filled in when the message
    // is encoded.
    struct fingerprint_attribute
    {
        inline static constexpr auto c_type = stun_attribute_type::fingerprint;
        std::uint32_t value{ 0 };

        bool operator==(const fingerprint_attribute&) const noexcept = default;
    };

    // The ERROR-CODE attribute is used in error response messages.  It
    // contains a numeric error code value in the range of 300 to 699 plus a
    // textual reason phrase encoded in UTF-8 [RFC3629], and is consistent
    // in its code assignments and semantics with SIP [RFC3261] and HTTP
    // [RFC2616].
    //
    //  0                   1                   2                   3
    //  0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
    // +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    // |           Reserved, should be 0         |Class|     Number    |
    // +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    // |      Reason Phrase (variable)                                ..
    // +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    struct error_code_attribute
    {
        inline static constexpr auto c_type = stun_attribute_type::error_code;
        inline static constexpr auto c_max_size = c_max_text_size;
        std::uint8_t error_class{ 0 };
        std::uint8_t number{ 0 };
        std::string reason;

        static error_code_attribute from_error_code(stun_error_code error);

        std::uint16_t error_code() const noexcept { return static_cast<std::uint16_t>(error_class * 100 + number); }

        bool operator==(const error_code_attribute&) const noexcept = default;
    };

    // The REALM attribute may be present in requests and responses.  It
    // contains text that meets the grammar for "realm-value" as described
    // in RFC 3261 [RFC3261] but without the double quotes and their
    // surrounding whitespace.
    struct realm_attribute
    {
        inline static constexpr auto c_type = stun_attribute_type::realm;
        inline static constexpr auto c_max_size = c_max_text_size;
        std::string value;

        bool operator==(const realm_attribute&) const noexcept = default;
    };

    // The NONCE attribute may be present in requests and responses.  It
    // contains a sequence of qdtext or quoted-pair, which are defined in
    // RFC 3261 [RFC3261].
    struct nonce_attribute
    {
        inline static constexpr auto c_type = stun_attribute_type::nonce;
        inline static constexpr auto c_max_size = c_max_text_size;
        std::string value;

        bool operator==(const nonce_attribute&) const noexcept = default;
    };

    // The UNKNOWN-ATTRIBUTES attribute is present only in an error response
    // when the response code in the ERROR-CODE attribute is 420.
    //
    // The attribute contains a list of 16-bit values, each of which
    // represents an attribute type that was not understood by the server.
    struct unknown_attributes_attribute
    {
        inline static constexpr auto c_type = stun_attribute_type::unknown_attributes;
        std::vector<std::uint16_t> types;

        bool operator==(const unknown_attributes_attribute&) const noexcept = default;
    };

    // The SOFTWARE attribute contains a textual description of the software
    // being used by the agent sending the message.
    struct software_attribute
    {
        inline static constexpr auto c_type = stun_attribute_type::software;
        inline static constexpr auto c_max_size = c_max_text_size;
        std::string value;

        bool operator==(const software_attribute&) const noexcept = default;
    };

    // The alternate server represents an alternate transport address
    // identifying a different STUN server that the STUN client should try.
    // It is encoded in the same way as MAPPED-ADDRESS.
    struct alternate_server_attribute
    {
        inline static constexpr auto c_type = stun_attribute_type::alternate_server;
        socket_address address;

        bool operator==(const alternate_server_attribute&) const noexcept = default;
    };

    // The PRIORITY attribute indicates the priority that is to be
    // associated with a peer-reflexive candidate, if one will be discovered
    // by this check.
    struct priority_attribute
    {
        inline static constexpr auto c_type = stun_attribute_type::priority;
        std::uint32_t value{ 0 };

        bool operator==(const priority_attribute&) const noexcept = default;
    };

    // The USE-CANDIDATE attribute indicates that the candidate pair
    // resulting from this check will be used for transmission of data.
    // The attribute has no content.
    struct use_candidate_attribute
    {
        inline static constexpr auto c_type = stun_attribute_type::use_candidate;

        bool operator==(const use_candidate_attribute&) const noexcept = default;
    };

    // The ICE-CONTROLLED attribute is present in a Binding request.  The
    // attribute indicates that the ICE agent believes it is in the
    // controlled role.  The content is a 64-bit tie-breaker value used for
    // role conflict resolution.
    struct ice_controlled_attribute
    {
        inline static constexpr auto c_type = stun_attribute_type::ice_controlled;
        std::uint64_t tie_breaker{ 0 };

        bool operator==(const ice_controlled_attribute&) const noexcept = default;
    };

    // The ICE-CONTROLLING attribute is present in a Binding request.  The
    // attribute indicates that the ICE agent believes it is in the
    // controlling role.
    struct ice_controlling_attribute
    {
        inline static constexpr auto c_type = stun_attribute_type::ice_controlling;
        std::uint64_t tie_breaker{ 0 };

        bool operator==(const ice_controlling_attribute&) const noexcept = default;
    };

    using stun_attribute = std::variant<
        mapped_address_attribute,
        xor_mapped_address_attribute,
        username_attribute,
        message_integrity_attribute,
        fingerprint_attribute,
        error_code_attribute,
        realm_attribute,
        nonce_attribute,
        unknown_attributes_attribute,
        software_attribute,
        alternate_server_attribute,
        priority_attribute,
        use_candidate_attribute,
        ice_controlled_attribute,
        ice_controlling_attribute
    >;

    namespace detail
    {
        template <typename T>
        concept stun_attribute_value = requires {
            { T::c_type } -> std::convertible_to<stun_attribute_type>;
        };

        template <typename T>
        concept text_attribute_value = stun_attribute_value<T> && requires (T t) {
            { t.value } -> std::convertible_to<std::string>;
            T::c_max_size;
        };

        template <typename T>
        concept address_attribute_value = stun_attribute_value<T> && requires (T t) {
            { t.address } -> std::convertible_to<socket_address>;
        };

        // Number of zero bytes needed to bring a value of the given length to
        // a 32-bit boundary.
        constexpr std::size_t padding_size(std::size_t length) noexcept
        {
            return (4 - length % 4) % 4;
        }
    }

    stun_attribute_type get_attribute_type(const stun_attribute& attribute) noexcept;

    // Reads one TLV from the reader. The transaction id is needed to undo the
    // obfuscation of IPv6 XOR-MAPPED-ADDRESS values.
    stun_result<stun_attribute> decode_attribute(
        util::stream_reader& reader,
        const transaction_id& id
    );

    // Appends one TLV to the writer. The value is padded to a 32-bit boundary
    // with the padding byte, which is only meant to be non zero for tests
    // replaying captured messages.
    stun_result<void> encode_attribute(
        const stun_attribute& attribute,
        const transaction_id& id,
        util::stream_writer& writer,
        std::byte padding = std::byte{ 0 }
    );
}
