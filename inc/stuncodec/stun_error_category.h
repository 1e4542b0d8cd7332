#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

namespace stuncodec
{
    class stun_header_error_category_type : public std::error_category
    {
    public:
        const char* name() const noexcept override { return "stun_header"; }
        std::string message(int error) const override;
    };

    class stun_attribute_error_category_type : public std::error_category
    {
    public:
        const char* name() const noexcept override { return "stun_attribute"; }
        std::string message(int error) const override;
    };

    class stun_integrity_error_category_type : public std::error_category
    {
    public:
        const char* name() const noexcept override { return "stun_integrity"; }
        std::string message(int error) const override;
    };

    class stun_message_error_category_type : public std::error_category
    {
    public:
        const char* name() const noexcept override { return "stun_message"; }
        std::string message(int error) const override;
    };

    inline const stun_header_error_category_type& stun_header_error_category()
    {
        static stun_header_error_category_type instance;
        return instance;
    }

    inline const stun_attribute_error_category_type& stun_attribute_error_category()
    {
        static stun_attribute_error_category_type instance;
        return instance;
    }

    inline const stun_integrity_error_category_type& stun_integrity_error_category()
    {
        static stun_integrity_error_category_type instance;
        return instance;
    }

    inline const stun_message_error_category_type& stun_message_error_category()
    {
        static stun_message_error_category_type instance;
        return instance;
    }

    enum class stun_header_error : int32_t
    {
        read_failure = 1,
        magic_cookie_mismatch,
        unrecognized_message_method,
        unrecognized_message_class
    };

    enum class stun_attribute_error : int32_t
    {
        read_failure = 1,
        write_failure,
        invalid_string,
        insufficient_data,
        invalid_value,
        unrecognized_attribute_type,
        utf8_value_too_big
    };

    enum class stun_integrity_error : int32_t
    {
        saslprep_failure = 1,
        missing_username,
        crypto_failure
    };

    enum class stun_message_error : int32_t
    {
        fingerprint_mismatch = 1,
        message_integrity_fail,
        incorrect_fingerprint_attribute_position,
        attribute_after_integrity,
        missing_integrity_password,
        message_too_large
    };

    inline std::error_code make_error_code(stun_header_error error)
    {
        return std::error_code(static_cast<int>(error), stun_header_error_category());
    }

    inline std::error_code make_error_code(stun_attribute_error error)
    {
        return std::error_code(static_cast<int>(error), stun_attribute_error_category());
    }

    inline std::error_code make_error_code(stun_integrity_error error)
    {
        return std::error_code(static_cast<int>(error), stun_integrity_error_category());
    }

    inline std::error_code make_error_code(stun_message_error error)
    {
        return std::error_code(static_cast<int>(error), stun_message_error_category());
    }

    struct fingerprint_mismatch_details
    {
        std::uint32_t attribute_value;
        std::uint32_t computed_value;

        bool operator==(const fingerprint_mismatch_details&) const noexcept = default;
    };

    struct integrity_mismatch_details
    {
        std::vector<std::byte> attribute_value;
        std::vector<std::byte> computed_value;

        bool operator==(const integrity_mismatch_details&) const noexcept = default;
    };

    // While decoding, length is the size of the received buffer and position
    // the byte offset of the attribute. While encoding, length is the number
    // of attributes and position the index of the offending one.
    struct attribute_position_details
    {
        std::size_t length;
        std::size_t position;

        bool operator==(const attribute_position_details&) const noexcept = default;
    };

    struct value_too_big_details
    {
        std::size_t limit;
        std::size_t length;

        bool operator==(const value_too_big_details&) const noexcept = default;
    };

    // Raw method, class, attribute type or address family that could not be
    // mapped to a known value.
    struct unrecognized_value_details
    {
        std::uint16_t value;

        bool operator==(const unrecognized_value_details&) const noexcept = default;
    };

    using stun_error_details = std::variant<
        std::monostate,
        fingerprint_mismatch_details,
        integrity_mismatch_details,
        attribute_position_details,
        value_too_big_details,
        unrecognized_value_details
    >;

    struct stun_error
    {
        std::error_code code;
        stun_error_details details{};

        template <typename details_t>
        const details_t* get_details() const noexcept
        {
            return std::get_if<details_t>(&details);
        }

        std::string message() const;
    };

    template <typename error_t>
    std::unexpected<stun_error> make_unexpected(
        error_t error,
        stun_error_details details = {}
    )
    {
        return std::unexpected(stun_error{ make_error_code(error), std::move(details) });
    }

    template <typename T>
    using stun_result = std::expected<T, stun_error>;
}

namespace std
{
    template <> struct is_error_code_enum<stuncodec::stun_header_error> : public true_type {};
    template <> struct is_error_code_enum<stuncodec::stun_attribute_error> : public true_type {};
    template <> struct is_error_code_enum<stuncodec::stun_integrity_error> : public true_type {};
    template <> struct is_error_code_enum<stuncodec::stun_message_error> : public true_type {};
}
