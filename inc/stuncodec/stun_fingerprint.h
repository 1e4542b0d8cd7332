#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace stuncodec
{
    // CRC-32 (ISO HDLC, the polynomial used by Ethernet and zlib).
    std::uint32_t compute_crc32(
        std::span<const std::byte> buffer
    ) noexcept;

    // The FINGERPRINT value is the CRC-32 of the message up to (but excluding)
    // the FINGERPRINT attribute, XOR'ed with 0x5354554e [RFC5389 15.5]. The
    // length field in the buffer must already account for the FINGERPRINT
    // attribute.
    std::uint32_t compute_fingerprint(
        std::span<const std::byte> buffer
    ) noexcept;
}
