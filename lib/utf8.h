#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace stuncodec::detail
{
    // Decodes a single code point starting at offset. Overlong forms,
    // surrogates and values past U+10FFFF are rejected.
    inline std::optional<char32_t> next_code_point(
        std::span<const std::byte> bytes,
        std::size_t& offset
    ) noexcept
    {
        const auto lead = static_cast<std::uint8_t>(bytes[offset]);

        std::size_t length = 0;
        char32_t code_point = 0;
        char32_t minimum = 0;

        if (lead < 0x80)
        {
            ++offset;
            return lead;
        }
        else if ((lead & 0xE0) == 0xC0)
        {
            length = 2;
            code_point = lead & 0x1F;
            minimum = 0x80;
        }
        else if ((lead & 0xF0) == 0xE0)
        {
            length = 3;
            code_point = lead & 0x0F;
            minimum = 0x800;
        }
        else if ((lead & 0xF8) == 0xF0)
        {
            length = 4;
            code_point = lead & 0x07;
            minimum = 0x10000;
        }
        else
        {
            return std::nullopt;
        }

        if (offset + length > bytes.size())
        {
            return std::nullopt;
        }

        for (std::size_t i = 1; i < length; ++i)
        {
            const auto continuation = static_cast<std::uint8_t>(bytes[offset + i]);
            if ((continuation & 0xC0) != 0x80)
            {
                return std::nullopt;
            }
            code_point = (code_point << 6) | (continuation & 0x3F);
        }

        if (code_point < minimum || code_point > 0x10FFFF || (code_point >= 0xD800 && code_point <= 0xDFFF))
        {
            return std::nullopt;
        }

        offset += length;
        return code_point;
    }

    inline bool is_valid_utf8(std::span<const std::byte> bytes) noexcept
    {
        std::size_t offset = 0;
        while (offset < bytes.size())
        {
            if (!next_code_point(bytes, offset))
            {
                return false;
            }
        }
        return true;
    }

    inline std::span<const std::byte> as_bytes(std::string_view text) noexcept
    {
        return { reinterpret_cast<const std::byte*>(text.data()), text.size() };
    }
}
