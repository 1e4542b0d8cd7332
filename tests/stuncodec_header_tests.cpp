#include <gtest/gtest.h>

#include <array>
#include <vector>

#include "stuncodec/stun_header.h"

namespace
{
    constexpr stuncodec::transaction_id c_transaction_id{
        std::byte{0x0D}, std::byte{0xF0}, std::byte{0xAD}, std::byte{0x0B},
        std::byte{0xEF}, std::byte{0xBE}, std::byte{0xAD}, std::byte{0xDE},
        std::byte{0x0D}, std::byte{0xF0}, std::byte{0xED}, std::byte{0xFE},
    };
}

TEST(stun_header, message_type) {
    using stuncodec::stun_message_class;
    using stuncodec::stun_method;

    EXPECT_EQ(stuncodec::encode_message_type(stun_method::binding, stun_message_class::request), 0x0001);
    EXPECT_EQ(stuncodec::encode_message_type(stun_method::binding, stun_message_class::indication), 0x0011);
    EXPECT_EQ(stuncodec::encode_message_type(stun_method::binding, stun_message_class::success_response), 0x0101);
    EXPECT_EQ(stuncodec::encode_message_type(stun_method::binding, stun_message_class::error_response), 0x0111);
}

TEST(stun_header, encode_binding_request) {
    stuncodec::stun_header header;
    header.id = c_transaction_id;

    std::vector<std::byte> buffer;
    stuncodec::util::stream_writer writer(buffer);
    stuncodec::encode_header(header, writer);

    const std::vector c_expected_bytes{
        std::byte{0x00}, std::byte{0x01}, std::byte{0x00}, std::byte{0x00}, // Binding Request, Size 0
        std::byte{0x21}, std::byte{0x12}, std::byte{0xa4}, std::byte{0x42}, // Magic Cookie
        std::byte{0x0D}, std::byte{0xF0}, std::byte{0xAD}, std::byte{0x0B}, // Tranaction Id
        std::byte{0xEF}, std::byte{0xBE}, std::byte{0xAD}, std::byte{0xDE}, // Tranaction Id
        std::byte{0x0D}, std::byte{0xF0}, std::byte{0xED}, std::byte{0xFE}, // Tranaction Id
    };

    EXPECT_EQ(buffer, c_expected_bytes) << "Generated header data did not match";
}

TEST(stun_header, decode_error_response) {
    const std::array c_message_bytes{
        std::byte{0x01}, std::byte{0x11}, std::byte{0x00}, std::byte{0x10}, // Binding Error, Size 16
        std::byte{0x21}, std::byte{0x12}, std::byte{0xa4}, std::byte{0x42}, // Magic Cookie
        std::byte{0x0D}, std::byte{0xF0}, std::byte{0xAD}, std::byte{0x0B}, // Tranaction Id
        std::byte{0xEF}, std::byte{0xBE}, std::byte{0xAD}, std::byte{0xDE}, // Tranaction Id
        std::byte{0x0D}, std::byte{0xF0}, std::byte{0xED}, std::byte{0xFE}, // Tranaction Id
    };

    stuncodec::util::stream_reader reader(c_message_bytes);
    auto result = stuncodec::decode_header(reader);

    if (result)
    {
        EXPECT_EQ(result->method, stuncodec::stun_method::binding);
        EXPECT_EQ(result->message_class, stuncodec::stun_message_class::error_response);
        EXPECT_EQ(result->message_length, 16);
        EXPECT_EQ(result->id, c_transaction_id);
        EXPECT_TRUE(reader.empty());
    }
    else
    {
        FAIL() << result.error().message();
    }
}

TEST(stun_header, decode_short_buffer) {
    const std::array c_message_bytes{
        std::byte{0x00}, std::byte{0x01}, std::byte{0x00}, std::byte{0x00}, // Binding Request, Size 0
        std::byte{0x21}, std::byte{0x12}, std::byte{0xa4}, std::byte{0x42}, // Magic Cookie
    };

    stuncodec::util::stream_reader reader(c_message_bytes);
    auto result = stuncodec::decode_header(reader);

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, stuncodec::stun_header_error::read_failure);
}

TEST(stun_header, decode_magic_cookie_mismatch) {
    const std::array c_message_bytes{
        std::byte{0x00}, std::byte{0x01}, std::byte{0x00}, std::byte{0x00}, // Binding Request, Size 0
        std::byte{0x21}, std::byte{0x12}, std::byte{0xa4}, std::byte{0x43}, // Bad Magic Cookie
        std::byte{0x0D}, std::byte{0xF0}, std::byte{0xAD}, std::byte{0x0B}, // Tranaction Id
        std::byte{0xEF}, std::byte{0xBE}, std::byte{0xAD}, std::byte{0xDE}, // Tranaction Id
        std::byte{0x0D}, std::byte{0xF0}, std::byte{0xED}, std::byte{0xFE}, // Tranaction Id
    };

    stuncodec::util::stream_reader reader(c_message_bytes);
    auto result = stuncodec::decode_header(reader);

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, stuncodec::stun_header_error::magic_cookie_mismatch);
}

TEST(stun_header, decode_unknown_method) {
    const std::array c_message_bytes{
        std::byte{0x00}, std::byte{0x03}, std::byte{0x00}, std::byte{0x00}, // Allocate Request, Size 0
        std::byte{0x21}, std::byte{0x12}, std::byte{0xa4}, std::byte{0x42}, // Magic Cookie
        std::byte{0x0D}, std::byte{0xF0}, std::byte{0xAD}, std::byte{0x0B}, // Tranaction Id
        std::byte{0xEF}, std::byte{0xBE}, std::byte{0xAD}, std::byte{0xDE}, // Tranaction Id
        std::byte{0x0D}, std::byte{0xF0}, std::byte{0xED}, std::byte{0xFE}, // Tranaction Id
    };

    stuncodec::util::stream_reader reader(c_message_bytes);
    auto result = stuncodec::decode_header(reader);

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, stuncodec::stun_header_error::unrecognized_message_method);

    auto details = result.error().get_details<stuncodec::unrecognized_value_details>();
    ASSERT_NE(details, nullptr);
    EXPECT_EQ(details->value, 0x0003);
}

TEST(stun_header, decode_high_bits_set) {
    const std::array c_message_bytes{
        std::byte{0x80}, std::byte{0x01}, std::byte{0x00}, std::byte{0x00}, // Not STUN, the top bits are set
        std::byte{0x21}, std::byte{0x12}, std::byte{0xa4}, std::byte{0x42}, // Magic Cookie
        std::byte{0x0D}, std::byte{0xF0}, std::byte{0xAD}, std::byte{0x0B}, // Tranaction Id
        std::byte{0xEF}, std::byte{0xBE}, std::byte{0xAD}, std::byte{0xDE}, // Tranaction Id
        std::byte{0x0D}, std::byte{0xF0}, std::byte{0xED}, std::byte{0xFE}, // Tranaction Id
    };

    stuncodec::util::stream_reader reader(c_message_bytes);
    auto result = stuncodec::decode_header(reader);

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, stuncodec::stun_header_error::unrecognized_message_method);
}

TEST(stun_header, check_for_stun_message_header) {
    const std::array c_message_bytes{
        std::byte{0x00}, std::byte{0x11}, std::byte{0x00}, std::byte{0x00}, // Binding Indication, Size 0
        std::byte{0x21}, std::byte{0x12}, std::byte{0xa4}, std::byte{0x42}, // Magic Cookie
        std::byte{0x0D}, std::byte{0xF0}, std::byte{0xAD}, std::byte{0x0B}, // Tranaction Id
        std::byte{0xEF}, std::byte{0xBE}, std::byte{0xAD}, std::byte{0xDE}, // Tranaction Id
        std::byte{0x0D}, std::byte{0xF0}, std::byte{0xED}, std::byte{0xFE}, // Tranaction Id
    };

    auto header = stuncodec::check_for_stun_message_header(c_message_bytes);
    ASSERT_TRUE(header);
    EXPECT_EQ(header->message_class, stuncodec::stun_message_class::indication);

    // First bytes of an RTP packet
    const std::array c_rtp_bytes{
        std::byte{0x80}, std::byte{0x60}, std::byte{0x12}, std::byte{0x34},
        std::byte{0x00}, std::byte{0x00}, std::byte{0x00}, std::byte{0x01},
        std::byte{0xDE}, std::byte{0xAD}, std::byte{0xBE}, std::byte{0xEF},
    };

    EXPECT_FALSE(stuncodec::check_for_stun_message_header(c_rtp_bytes));
}
