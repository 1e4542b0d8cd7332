#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <string>
#include <vector>

#include "stuncodec/stun_fingerprint.h"
#include "stuncodec/stun_password_generator.h"
#include "stuncodec/stun_saslprep.h"

using namespace std::string_view_literals;

namespace
{
    std::span<const std::byte> as_bytes(std::string_view text)
    {
        return { reinterpret_cast<const std::byte*>(text.data()), text.size() };
    }
}

TEST(stun_fingerprint, crc32) {
    EXPECT_EQ(stuncodec::compute_crc32(as_bytes("123456789")), 0xcbf43926u);
    EXPECT_EQ(stuncodec::compute_crc32({}), 0u);
}

TEST(stun_fingerprint, binding_request) {
    const std::array c_message_bytes{
        std::byte{0x00}, std::byte{0x01}, std::byte{0x00}, std::byte{0x08}, // Binding Request, Size 8
        std::byte{0x21}, std::byte{0x12}, std::byte{0xa4}, std::byte{0x42}, // Magic Cookie
        std::byte{0x0D}, std::byte{0xF0}, std::byte{0xAD}, std::byte{0x0B}, // Tranaction Id
        std::byte{0xEF}, std::byte{0xBE}, std::byte{0xAD}, std::byte{0xDE}, // Tranaction Id
        std::byte{0x0D}, std::byte{0xF0}, std::byte{0xED}, std::byte{0xFE}, // Tranaction Id
    };

    EXPECT_EQ(stuncodec::compute_fingerprint(c_message_bytes), 0x34b3b947u);
}

TEST(stun_saslprep, mapping) {
    auto result = stuncodec::saslprep("user");
    ASSERT_TRUE(result);
    EXPECT_EQ(*result, "user");

    // SOFT HYPHEN maps to nothing
    result = stuncodec::saslprep("I\xC2\xADX");
    ASSERT_TRUE(result);
    EXPECT_EQ(*result, "IX");

    // NO-BREAK SPACE maps to SPACE
    result = stuncodec::saslprep("a\xC2\xA0" "b");
    ASSERT_TRUE(result);
    EXPECT_EQ(*result, "a b");

    // Non ASCII characters that aren't mapped or prohibited pass through
    result = stuncodec::saslprep("\xe3\x83\x9e\xe3\x83\x88\xe3\x83\xaa\xe3\x83\x83\xe3\x82\xaf\xe3\x82\xb9");
    ASSERT_TRUE(result);
    EXPECT_EQ(*result, "\xe3\x83\x9e\xe3\x83\x88\xe3\x83\xaa\xe3\x83\x83\xe3\x82\xaf\xe3\x82\xb9");

    result = stuncodec::saslprep("");
    ASSERT_TRUE(result);
    EXPECT_TRUE(result->empty());
}

// Examples from RFC 4013 section 3
TEST(stun_saslprep, normalization) {
    auto result = stuncodec::saslprep("USER");
    ASSERT_TRUE(result);
    EXPECT_EQ(*result, "USER");

    // FEMININE ORDINAL INDICATOR
    result = stuncodec::saslprep("\xC2\xAA");
    ASSERT_TRUE(result);
    EXPECT_EQ(*result, "a");

    // ROMAN NUMERAL NINE
    result = stuncodec::saslprep("\xE2\x85\xA8");
    ASSERT_TRUE(result);
    EXPECT_EQ(*result, "IX");

    result = stuncodec::saslprep("The\xC2\xADM\xC2\xAAtr\xE2\x85\xA8");
    ASSERT_TRUE(result);
    EXPECT_EQ(*result, "TheMatrIX");

    // Only characters mapped to nothing
    result = stuncodec::saslprep("\xC2\xAD\xC2\xAD");
    ASSERT_TRUE(result);
    EXPECT_TRUE(result->empty());
}

TEST(stun_saslprep, bidirectional) {
    // ARABIC LETTER ALEF followed by DIGIT ONE does not end in a RandALCat
    auto result = stuncodec::saslprep("\xD8\xA7" "1");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, stuncodec::stun_integrity_error::saslprep_failure);

    // RandALCat mixed with LCat
    result = stuncodec::saslprep("\xD8\xA7" "a" "\xD8\xA7");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, stuncodec::stun_integrity_error::saslprep_failure);

    result = stuncodec::saslprep("\xD8\xA7" "1" "\xD8\xA8");
    ASSERT_TRUE(result);
    EXPECT_EQ(*result, "\xD8\xA7" "1" "\xD8\xA8");
}

TEST(stun_saslprep, prohibited) {
    // ASCII control character
    auto result = stuncodec::saslprep("pass\x07word");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, stuncodec::stun_integrity_error::saslprep_failure);

    // Private use
    result = stuncodec::saslprep("\xEE\x80\x80");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, stuncodec::stun_integrity_error::saslprep_failure);

    // Non-character
    result = stuncodec::saslprep("\xEF\xBF\xBE");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, stuncodec::stun_integrity_error::saslprep_failure);

    // Not UTF-8
    result = stuncodec::saslprep("\xFF\xFE");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, stuncodec::stun_integrity_error::saslprep_failure);
}

TEST(stun_password_generator, short_term_key) {
    stuncodec::stun_password_generator generator{};

    auto key = generator.generate_short_term_key("VOkJxbRl1RmTxUk/WvJxBt");
    if (key)
    {
        auto expected = as_bytes("VOkJxbRl1RmTxUk/WvJxBt");
        EXPECT_TRUE(std::equal(key->begin(), key->end(), expected.begin(), expected.end())) << "Short-term key must be the prepared password";
    }
    else
    {
        FAIL() << key.error().message();
    }
}

TEST(stun_password_generator, long_term_md5_key) {
    stuncodec::stun_password_generator generator{};

    constexpr std::array c_expected_key{
        std::byte{0x84}, std::byte{0x93}, std::byte{0xfb}, std::byte{0xc5},
        std::byte{0x3b}, std::byte{0xa5}, std::byte{0x82}, std::byte{0xfb},
        std::byte{0x4c}, std::byte{0x04}, std::byte{0x4c}, std::byte{0x45},
        std::byte{0x6b}, std::byte{0xdc}, std::byte{0x40}, std::byte{0xeb},
    };

    auto key = generator.generate_long_term_md5_key("user", "realm", "pass");
    if (key)
    {
        EXPECT_EQ(*key, c_expected_key) << "MD5(user:realm:pass) did not match";
    }
    else
    {
        FAIL() << key.error().message();
    }

    auto derived = generator.derive_key("pass", "realm"sv, "user"sv);
    if (derived)
    {
        EXPECT_TRUE(std::equal(derived->begin(), derived->end(), c_expected_key.begin(), c_expected_key.end()));
    }
    else
    {
        FAIL() << derived.error().message();
    }
}

TEST(stun_password_generator, derive_key_requires_username) {
    stuncodec::stun_password_generator generator{};

    auto key = generator.derive_key("pass", "realm"sv, std::nullopt);
    ASSERT_FALSE(key);
    EXPECT_EQ(key.error().code, stuncodec::stun_integrity_error::missing_username);

    // A username on its own still means short-term credentials
    key = generator.derive_key("pass", std::nullopt, "user"sv);
    ASSERT_TRUE(key);
    EXPECT_EQ(key->size(), 4u);
}

TEST(stun_password_generator, custom_saslprep) {
    stuncodec::stun_password_generator failing{
        [](std::string_view) -> stuncodec::stun_result<std::string> {
            return stuncodec::make_unexpected(stuncodec::stun_integrity_error::saslprep_failure);
        }
    };

    auto key = failing.derive_key("pass", std::nullopt, std::nullopt);
    ASSERT_FALSE(key);
    EXPECT_EQ(key.error().code, stuncodec::stun_integrity_error::saslprep_failure);

    stuncodec::stun_password_generator upper{
        [](std::string_view value) -> stuncodec::stun_result<std::string> {
            std::string result{ value };
            for (auto& c : result)
            {
                c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            }
            return result;
        }
    };

    key = upper.derive_key("pass", std::nullopt, std::nullopt);
    ASSERT_TRUE(key);
    auto expected = as_bytes("PASS");
    EXPECT_TRUE(std::equal(key->begin(), key->end(), expected.begin(), expected.end()));
}

TEST(stun_password_generator, compute_integrity_sha1) {
    stuncodec::stun_password_generator generator{};

    // RFC 5769 sample request up to the MESSAGE-INTEGRITY attribute. The
    // length still counts the FINGERPRINT attribute, which the hash must not.
    const std::array c_message_bytes{
        std::byte{ 0x00 }, std::byte{ 0x01 }, std::byte{ 0x00 }, std::byte{ 0x58 }, // Binding request, Size 88
        std::byte{ 0x21 }, std::byte{ 0x12 }, std::byte{ 0xa4 }, std::byte{ 0x42 }, // Magic Cookie
        std::byte{ 0xb7 }, std::byte{ 0xe7 }, std::byte{ 0xa7 }, std::byte{ 0x01 }, // Tranaction Id
        std::byte{ 0xbc }, std::byte{ 0x34 }, std::byte{ 0xd6 }, std::byte{ 0x86 }, // Tranaction Id
        std::byte{ 0xfa }, std::byte{ 0x87 }, std::byte{ 0xdf }, std::byte{ 0xae }, // Tranaction Id
        std::byte{ 0x80 }, std::byte{ 0x22 }, std::byte{ 0x00 }, std::byte{ 0x10 }, // Attribute: Software, Size: 16
        std::byte{ 0x53 }, std::byte{ 0x54 }, std::byte{ 0x55 }, std::byte{ 0x4e }, // "STUN"
        std::byte{ 0x20 }, std::byte{ 0x74 }, std::byte{ 0x65 }, std::byte{ 0x73 }, // " tes"
        std::byte{ 0x74 }, std::byte{ 0x20 }, std::byte{ 0x63 }, std::byte{ 0x6c }, // "t cl"
        std::byte{ 0x69 }, std::byte{ 0x65 }, std::byte{ 0x6e }, std::byte{ 0x74 }, // "ient"
        std::byte{ 0x00 }, std::byte{ 0x24 }, std::byte{ 0x00 }, std::byte{ 0x04 }, // Attribute: Priority, Size: 4
        std::byte{ 0x6e }, std::byte{ 0x00 }, std::byte{ 0x01 }, std::byte{ 0xff }, // Priority
        std::byte{ 0x80 }, std::byte{ 0x29 }, std::byte{ 0x00 }, std::byte{ 0x08 }, // Attribute: Ice Controlled, Size: 8
        std::byte{ 0x93 }, std::byte{ 0x2f }, std::byte{ 0xf9 }, std::byte{ 0xb1 }, // Tie breaker
        std::byte{ 0x51 }, std::byte{ 0x26 }, std::byte{ 0x3b }, std::byte{ 0x36 }, // Tie breaker
        std::byte{ 0x00 }, std::byte{ 0x06 }, std::byte{ 0x00 }, std::byte{ 0x09 }, // Attribute: Username, Size: 9
        std::byte{ 0x65 }, std::byte{ 0x76 }, std::byte{ 0x74 }, std::byte{ 0x6a }, // "evtj"
        std::byte{ 0x3a }, std::byte{ 0x68 }, std::byte{ 0x36 }, std::byte{ 0x76 }, // ":h6v"
        std::byte{ 0x59 }, std::byte{ 0x20 }, std::byte{ 0x20 }, std::byte{ 0x20 }, // "Y   "
    };

    constexpr std::array c_expected_hmac{
        std::byte{ 0x9a }, std::byte{ 0xea }, std::byte{ 0xa7 }, std::byte{ 0x0c },
        std::byte{ 0xbf }, std::byte{ 0xd8 }, std::byte{ 0xcb }, std::byte{ 0x56 },
        std::byte{ 0x78 }, std::byte{ 0x1e }, std::byte{ 0xf2 }, std::byte{ 0xb5 },
        std::byte{ 0xb2 }, std::byte{ 0xd3 }, std::byte{ 0xf2 }, std::byte{ 0x49 },
        std::byte{ 0xc1 }, std::byte{ 0xb5 }, std::byte{ 0x71 }, std::byte{ 0xa2 },
    };

    auto key = generator.generate_short_term_key("VOkJxbRl1RmTxUk/WvJxBt");
    ASSERT_TRUE(key);

    auto hmac = generator.compute_integrity_sha1(*key, c_message_bytes);
    if (hmac)
    {
        EXPECT_EQ(*hmac, c_expected_hmac) << "HMAC-SHA1 did not match";
        EXPECT_EQ(c_message_bytes[3], std::byte{ 0x58 }) << "Input buffer must not be modified";
    }
    else
    {
        FAIL() << hmac.error().message();
    }

    auto short_message = generator.compute_integrity_sha1(*key, std::span{ c_message_bytes }.first(8));
    ASSERT_FALSE(short_message);
    EXPECT_EQ(short_message.error().code, stuncodec::stun_header_error::read_failure);
}

TEST(stun_password_generator, generate_id) {
    auto first = stuncodec::stun_password_generator::generate_id();
    auto second = stuncodec::stun_password_generator::generate_id();

    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_NE(*first, *second) << "Transaction ids should be random";
}
