#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <netinet/in.h>

namespace stuncodec
{
    constexpr std::uint32_t c_stun_magic_cookie = 0x2112A442;
    constexpr std::uint32_t c_stun_fingerprint_xor = 0x5354554E;

    constexpr std::size_t c_stun_header_size = 20;
    constexpr std::size_t c_stun_attribute_header_size = 4;
    constexpr std::size_t c_stun_transaction_id_size = 12;
    constexpr std::size_t c_stun_integrity_size = 20;
    constexpr std::size_t c_stun_integrity_attribute_size = c_stun_attribute_header_size + c_stun_integrity_size;
    constexpr std::size_t c_stun_fingerprint_attribute_size = c_stun_attribute_header_size + 4;

    // USERNAME MUST contain a UTF-8 encoded sequence of less than 513 bytes
    constexpr std::size_t c_max_username_size = 512;

    // SOFTWARE, REALM, NONCE and the ERROR-CODE reason phrase MUST be less
    // than 128 characters, which can be as long as 763 bytes.
    constexpr std::size_t c_max_text_size = 763;

    using transaction_id = std::array<std::byte, c_stun_transaction_id_size>;

    // The class and method are not stored pre-combined because they have to
    // be interleaved into the message type on the wire.
    enum class stun_message_class : std::uint16_t
    {
        request = 0x0000,
        indication = 0x0010,
        success_response = 0x0100,
        error_response = 0x0110,
    };

    enum class stun_method : std::uint16_t
    {
        // STUN RFC 5389
        binding = 0x0001,
    };

    enum class stun_attribute_type : std::uint16_t
    {
        // STUN RFC 5389 Required Range
        mapped_address           = 0x0001,
        username                 = 0x0006,
        message_integrity        = 0x0008,
        error_code               = 0x0009,
        unknown_attributes       = 0x000A,
        realm                    = 0x0014,
        nonce                    = 0x0015,
        xor_mapped_address       = 0x0020,

        // ICE RFC 8445
        priority                 = 0x0024,
        use_candidate            = 0x0025,
        ice_controlled           = 0x8029,
        ice_controlling          = 0x802A,

        // STUN RFC 5389 Optional Range
        software                 = 0x8022,
        alternate_server         = 0x8023,
        fingerprint              = 0x8028,
    };

    // Attributes with type values between 0x0000 and 0x7FFF are
    // comprehension-required attributes, which means that the STUN agent
    // cannot successfully process the message unless it understands the
    // attribute.  Attributes with type values between 0x8000 and 0xFFFF are
    // comprehension-optional attributes, which means that those attributes
    // can be ignored by the STUN agent if it does not understand them.
    constexpr bool is_comprehension_required(std::uint16_t type) noexcept
    {
        return type < 0x8000;
    }

    std::optional<stun_attribute_type> to_attribute_type(std::uint16_t type) noexcept;

    enum class address_family : std::uint8_t
    {
        ipv4 = 0x01,
        ipv6 = 0x02
    };

    enum class stun_error_code : std::uint16_t
    {
        try_alternate = 300,                  // The client should contact an alternate server for
                                              // this request.  This error response MUST only be sent if the
                                              // request included a USERNAME attribute and a valid MESSAGE-
                                              // INTEGRITY attribute; otherwise, it MUST NOT be sent and error
                                              // code 400 (Bad Request) is suggested.

        bad_request = 400,                    // The request was malformed.  The client SHOULD NOT
                                              // retry the request without modification from the previous
                                              // attempt.

        unauthorized = 401,                   // The request did not contain the correct
                                              // credentials to proceed.  The client should retry the request
                                              // with proper credentials.

        unknown_attribute = 420,              // The server received a STUN packet containing
                                              // a comprehension-required attribute that it did not understand.
                                              // The server MUST put this unknown attribute in the UNKNOWN-
                                              // ATTRIBUTE attribute of its error response.

        stale_nonce = 438,                    // The NONCE used by the client was no longer valid.
                                              // The client should retry, using the NONCE provided in the
                                              // response.

        role_conflict = 487,                  // The client asserted an ICE role (controlling or
                                              // controlled) that is in conflict with the role of the server.

        server_error = 500,                   // The server has suffered a temporary error.  The
                                              // client should try again.
    };

    // Reason phrase recommended by the RFCs for a given error code, empty
    // for codes without one.
    std::string_view get_reason_phrase(stun_error_code error) noexcept;

    // A transport address as carried by MAPPED-ADDRESS, XOR-MAPPED-ADDRESS and
    // ALTERNATE-SERVER. Only the first four address bytes are used for IPv4.
    struct socket_address
    {
        address_family family{ address_family::ipv4 };
        std::uint16_t port{ 0 };
        std::array<std::byte, 16> address{};

        static socket_address from_ipv4(const std::array<std::uint8_t, 4>& octets, std::uint16_t port) noexcept;
        static socket_address from_ipv6(const std::array<std::uint16_t, 8>& groups, std::uint16_t port) noexcept;
        static socket_address from_sockaddr(const sockaddr_in& address) noexcept;
        static socket_address from_sockaddr(const sockaddr_in6& address) noexcept;

        // Accepts the textual forms understood by inet_pton
        static std::optional<socket_address> parse(std::string_view ip, std::uint16_t port) noexcept;

        std::size_t address_size() const noexcept { return family == address_family::ipv4 ? 4 : 16; }

        sockaddr_in ipv4_address() const noexcept;
        sockaddr_in6 ipv6_address() const noexcept;

        std::string to_string() const;

        // Bytes past address_size() are not part of the address
        bool operator==(const socket_address& other) const noexcept;
    };
}
