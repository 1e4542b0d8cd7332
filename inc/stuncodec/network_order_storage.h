#pragma once

#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <vector>

namespace stuncodec::util
{
    template <typename T>
    constexpr T hton(T val)
    {
        if constexpr (std::endian::native == std::endian::little)
        {
            return std::byteswap(val);
        }
        else
        {
            return val;
        }
    }

    template <typename T>
    constexpr T ntoh(T val)
    {
        return hton(val);
    }

    // Reads a network ordered value out of the front of the given bytes. The
    // caller guarantees that at least sizeof(T) bytes are available.
    template <std::integral T>
    T load_network_ordered(std::span<const std::byte> bytes) noexcept
    {
        T value{};
        std::memcpy(&value, bytes.data(), sizeof(T));
        return ntoh(value);
    }

    template <std::integral T>
    void store_network_ordered(std::span<std::byte> bytes, T value) noexcept
    {
        value = hton(value);
        std::memcpy(bytes.data(), &value, sizeof(T));
    }

    // Appends host ordered values to a growing buffer, converting them to
    // the network byte order on the way in.
    class stream_writer
    {
    public:
        explicit stream_writer(std::vector<std::byte>& buffer) noexcept :
            m_buffer{ buffer }
        {
        }

        template <std::integral T>
        void write(T value)
        {
            const auto offset = m_buffer.size();
            m_buffer.resize(offset + sizeof(T));
            store_network_ordered<T>(std::span{ m_buffer }.subspan(offset), value);
        }

        void write(std::span<const std::byte> bytes)
        {
            m_buffer.insert(m_buffer.end(), bytes.begin(), bytes.end());
        }

        void write_padding(std::size_t count, std::byte value)
        {
            m_buffer.insert(m_buffer.end(), count, value);
        }

        // Overwrites a value that has already been written
        template <std::integral T>
        void patch(std::size_t offset, T value) noexcept
        {
            store_network_ordered<T>(std::span{ m_buffer }.subspan(offset, sizeof(T)), value);
        }

        std::size_t size() const noexcept { return m_buffer.size(); }
        std::span<const std::byte> data() const noexcept { return m_buffer; }
        std::span<std::byte> data() noexcept { return m_buffer; }

    private:
        std::vector<std::byte>& m_buffer;
    };

    // Cursor over a received buffer. Every read either returns the whole
    // value or nothing, in which case the cursor does not move.
    class stream_reader
    {
    public:
        explicit stream_reader(std::span<const std::byte> buffer) noexcept :
            m_buffer{ buffer }
        {
        }

        template <std::integral T>
        std::optional<T> read() noexcept
        {
            if (remaining() < sizeof(T))
            {
                return std::nullopt;
            }

            auto value = load_network_ordered<T>(m_buffer.subspan(m_position));
            m_position += sizeof(T);
            return value;
        }

        std::optional<std::span<const std::byte>> read_bytes(std::size_t count) noexcept
        {
            if (remaining() < count)
            {
                return std::nullopt;
            }

            auto bytes = m_buffer.subspan(m_position, count);
            m_position += count;
            return bytes;
        }

        bool skip(std::size_t count) noexcept
        {
            if (remaining() < count)
            {
                return false;
            }

            m_position += count;
            return true;
        }

        std::size_t position() const noexcept { return m_position; }
        std::size_t remaining() const noexcept { return m_buffer.size() - m_position; }
        bool empty() const noexcept { return m_position == m_buffer.size(); }
        std::span<const std::byte> buffer() const noexcept { return m_buffer; }

    private:
        std::span<const std::byte> m_buffer;
        std::size_t m_position{ 0 };
    };
}
