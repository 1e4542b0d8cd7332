#include "stuncodec/stun_message_types.h"

#include <algorithm>
#include <cstring>
#include <utility>

#include <arpa/inet.h>

using namespace std::string_view_literals;

namespace
{
    const std::array c_reason_phrases{
        std::pair{ stuncodec::stun_error_code::try_alternate, "Try Alternate"sv },
        std::pair{ stuncodec::stun_error_code::bad_request, "Bad Request"sv },
        std::pair{ stuncodec::stun_error_code::unauthorized, "Unauthorized"sv },
        std::pair{ stuncodec::stun_error_code::unknown_attribute, "Unknown Attribute"sv },
        std::pair{ stuncodec::stun_error_code::stale_nonce, "Stale Nonce"sv },
        std::pair{ stuncodec::stun_error_code::role_conflict, "Role Conflict"sv },
        std::pair{ stuncodec::stun_error_code::server_error, "Server Error"sv },
    };

    constexpr std::array c_known_attribute_types{
        stuncodec::stun_attribute_type::mapped_address,
        stuncodec::stun_attribute_type::username,
        stuncodec::stun_attribute_type::message_integrity,
        stuncodec::stun_attribute_type::error_code,
        stuncodec::stun_attribute_type::unknown_attributes,
        stuncodec::stun_attribute_type::realm,
        stuncodec::stun_attribute_type::nonce,
        stuncodec::stun_attribute_type::xor_mapped_address,
        stuncodec::stun_attribute_type::priority,
        stuncodec::stun_attribute_type::use_candidate,
        stuncodec::stun_attribute_type::ice_controlled,
        stuncodec::stun_attribute_type::ice_controlling,
        stuncodec::stun_attribute_type::software,
        stuncodec::stun_attribute_type::alternate_server,
        stuncodec::stun_attribute_type::fingerprint,
    };
}

namespace stuncodec
{
    std::optional<stun_attribute_type> to_attribute_type(std::uint16_t type) noexcept
    {
        for (auto known : c_known_attribute_types)
        {
            if (static_cast<std::uint16_t>(known) == type)
            {
                return known;
            }
        }
        return std::nullopt;
    }

    std::string_view get_reason_phrase(stun_error_code error) noexcept
    {
        for (auto& [code, phrase] : c_reason_phrases)
        {
            if (error == code)
            {
                return phrase;
            }
        }
        return {};
    }

    socket_address socket_address::from_ipv4(
        const std::array<std::uint8_t, 4>& octets,
        std::uint16_t port
    ) noexcept
    {
        socket_address result;
        result.family = address_family::ipv4;
        result.port = port;
        std::memcpy(result.address.data(), octets.data(), octets.size());
        return result;
    }

    socket_address socket_address::from_ipv6(
        const std::array<std::uint16_t, 8>& groups,
        std::uint16_t port
    ) noexcept
    {
        socket_address result;
        result.family = address_family::ipv6;
        result.port = port;
        for (std::size_t i = 0; i < groups.size(); ++i)
        {
            result.address[i * 2] = std::byte(groups[i] >> 8);
            result.address[i * 2 + 1] = std::byte(groups[i] & 0xFF);
        }
        return result;
    }

    socket_address socket_address::from_sockaddr(
        const sockaddr_in& address
    ) noexcept
    {
        socket_address result;
        result.family = address_family::ipv4;
        result.port = ntohs(address.sin_port);
        std::memcpy(result.address.data(), &address.sin_addr, 4);
        return result;
    }

    socket_address socket_address::from_sockaddr(
        const sockaddr_in6& address
    ) noexcept
    {
        socket_address result;
        result.family = address_family::ipv6;
        result.port = ntohs(address.sin6_port);
        std::memcpy(result.address.data(), &address.sin6_addr, 16);
        return result;
    }

    std::optional<socket_address> socket_address::parse(
        std::string_view ip,
        std::uint16_t port
    ) noexcept
    {
        // inet_pton needs a null terminated string
        std::array<char, INET6_ADDRSTRLEN> text{};
        if (ip.size() >= text.size())
        {
            return std::nullopt;
        }
        std::memcpy(text.data(), ip.data(), ip.size());

        socket_address result;
        result.port = port;

        if (inet_pton(AF_INET, text.data(), result.address.data()) == 1)
        {
            result.family = address_family::ipv4;
            return result;
        }

        if (inet_pton(AF_INET6, text.data(), result.address.data()) == 1)
        {
            result.family = address_family::ipv6;
            return result;
        }

        return std::nullopt;
    }

    sockaddr_in socket_address::ipv4_address() const noexcept
    {
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        std::memcpy(&addr.sin_addr, address.data(), 4);
        return addr;
    }

    sockaddr_in6 socket_address::ipv6_address() const noexcept
    {
        sockaddr_in6 addr{};
        addr.sin6_family = AF_INET6;
        addr.sin6_port = htons(port);
        std::memcpy(&addr.sin6_addr, address.data(), 16);
        return addr;
    }

    bool socket_address::operator==(const socket_address& other) const noexcept
    {
        if (family != other.family || port != other.port)
        {
            return false;
        }

        return std::equal(address.begin(), address.begin() + address_size(), other.address.begin());
    }

    std::string socket_address::to_string() const
    {
        std::array<char, INET6_ADDRSTRLEN> buffer{};

        const auto af = family == address_family::ipv4 ? AF_INET : AF_INET6;
        if (inet_ntop(af, address.data(), buffer.data(), static_cast<socklen_t>(buffer.size())) == nullptr)
        {
            return {};
        }

        if (family == address_family::ipv4)
        {
            return std::string{ buffer.data() } + ":" + std::to_string(port);
        }

        return "[" + std::string{ buffer.data() } + "]:" + std::to_string(port);
    }
}
