#include "stuncodec/stun_error_category.h"

#include <iomanip>
#include <sstream>
#include <type_traits>

namespace stuncodec
{
    std::string stun_header_error_category_type::message(int error) const
    {
        switch (static_cast<stun_header_error>(error))
        {
        case stun_header_error::read_failure:
            return "buffer is too small to hold a STUN header";
        case stun_header_error::magic_cookie_mismatch:
            return "magic cookie does not match";
        case stun_header_error::unrecognized_message_method:
            return "unrecognized message method";
        case stun_header_error::unrecognized_message_class:
            return "unrecognized message class";
        }
        return "unknown stun_header error";
    }

    std::string stun_attribute_error_category_type::message(int error) const
    {
        switch (static_cast<stun_attribute_error>(error))
        {
        case stun_attribute_error::read_failure:
            return "attribute extends past the end of the buffer";
        case stun_attribute_error::write_failure:
            return "attribute value does not fit in the length field";
        case stun_attribute_error::invalid_string:
            return "attribute value is not valid UTF-8";
        case stun_attribute_error::insufficient_data:
            return "attribute value is too short";
        case stun_attribute_error::invalid_value:
            return "attribute value is invalid";
        case stun_attribute_error::unrecognized_attribute_type:
            return "unrecognized attribute type";
        case stun_attribute_error::utf8_value_too_big:
            return "attribute value exceeds its maximum length";
        }
        return "unknown stun_attribute error";
    }

    std::string stun_integrity_error_category_type::message(int error) const
    {
        switch (static_cast<stun_integrity_error>(error))
        {
        case stun_integrity_error::saslprep_failure:
            return "SASLprep rejected the credential";
        case stun_integrity_error::missing_username:
            return "long-term credentials require a username";
        case stun_integrity_error::crypto_failure:
            return "cryptographic operation failed";
        }
        return "unknown stun_integrity error";
    }

    std::string stun_message_error_category_type::message(int error) const
    {
        switch (static_cast<stun_message_error>(error))
        {
        case stun_message_error::fingerprint_mismatch:
            return "FINGERPRINT does not match the message";
        case stun_message_error::message_integrity_fail:
            return "MESSAGE-INTEGRITY does not match the message";
        case stun_message_error::incorrect_fingerprint_attribute_position:
            return "FINGERPRINT is not the last attribute";
        case stun_message_error::attribute_after_integrity:
            return "attribute other than FINGERPRINT follows MESSAGE-INTEGRITY";
        case stun_message_error::missing_integrity_password:
            return "MESSAGE-INTEGRITY requires a password";
        case stun_message_error::message_too_large:
            return "attributes exceed the maximum message length";
        }
        return "unknown stun_message error";
    }

    namespace
    {
        struct details_printer
        {
            std::ostringstream& stream;

            void operator()(std::monostate) const {}

            void operator()(const fingerprint_mismatch_details& details) const
            {
                stream << std::hex << std::setfill('0')
                       << " (attribute 0x" << std::setw(8) << details.attribute_value
                       << ", computed 0x" << std::setw(8) << details.computed_value << ")";
            }

            void operator()(const integrity_mismatch_details& details) const
            {
                auto print = [this](const std::vector<std::byte>& bytes) {
                    for (auto byte : bytes)
                    {
                        stream << std::setw(2) << static_cast<unsigned>(byte);
                    }
                };

                stream << std::hex << std::setfill('0') << " (attribute ";
                print(details.attribute_value);
                stream << ", computed ";
                print(details.computed_value);
                stream << ")";
            }

            void operator()(const attribute_position_details& details) const
            {
                stream << " (position " << details.position << " of " << details.length << ")";
            }

            void operator()(const value_too_big_details& details) const
            {
                stream << " (length " << details.length << ", limit " << details.limit << ")";
            }

            void operator()(const unrecognized_value_details& details) const
            {
                stream << " (value 0x" << std::hex << std::setfill('0') << std::setw(4) << details.value << ")";
            }
        };
    }

    std::string stun_error::message() const
    {
        std::ostringstream stream;
        stream << code.category().name() << ": " << code.message();
        std::visit(details_printer{ stream }, details);
        return stream.str();
    }
}
