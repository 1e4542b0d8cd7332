#include <cctype>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include "stuncodec/stun_message.h"

#include "magic_enum.hpp"

template <>
struct magic_enum::customize::enum_range<stuncodec::stun_attribute_type> {
    static constexpr int min = 0;
    static constexpr int max = 0x802A;
    // (max - min) must be less than UINT16_MAX.
};

namespace
{
    constexpr std::string_view c_usage =
        "usage: stun_dump [--password <password>] [<hex>]\n"
        "       stun_dump --build [--username <username>] [--software <text>] [--password <password>]\n"
        "\n"
        "Decodes a hex encoded STUN message given as an argument or on stdin. With\n"
        "--build a Binding request is encoded and printed as hex instead.\n";

    struct options
    {
        bool build = false;
        std::optional<std::string> password;
        std::optional<std::string> username;
        std::optional<std::string> software;
        std::optional<std::string> hex;
    };

    std::optional<options> parse_arguments(int argc, char** argv)
    {
        options result;

        for (int i = 1; i < argc; ++i)
        {
            std::string_view arg{ argv[i] };

            auto next = [&]() -> std::optional<std::string> {
                if (i + 1 >= argc)
                {
                    return std::nullopt;
                }
                return std::string{ argv[++i] };
            };

            if (arg == "--build")
            {
                result.build = true;
            }
            else if (arg == "--password")
            {
                result.password = next();
                if (!result.password)
                {
                    return std::nullopt;
                }
            }
            else if (arg == "--username")
            {
                result.username = next();
                if (!result.username)
                {
                    return std::nullopt;
                }
            }
            else if (arg == "--software")
            {
                result.software = next();
                if (!result.software)
                {
                    return std::nullopt;
                }
            }
            else if (!arg.starts_with("--") && !result.hex)
            {
                result.hex = std::string{ arg };
            }
            else
            {
                return std::nullopt;
            }
        }

        return result;
    }

    int hex_value(char c) noexcept
    {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    // Whitespace is ignored so the output of xxd -p and friends can be pasted in
    std::optional<std::vector<std::byte>> parse_hex(std::string_view text)
    {
        std::vector<std::byte> bytes;
        int high = -1;

        for (auto c : text)
        {
            if (std::isspace(static_cast<unsigned char>(c)))
            {
                continue;
            }

            auto value = hex_value(c);
            if (value < 0)
            {
                return std::nullopt;
            }

            if (high < 0)
            {
                high = value;
            }
            else
            {
                bytes.push_back(static_cast<std::byte>((high << 4) | value));
                high = -1;
            }
        }

        if (high >= 0)
        {
            return std::nullopt;
        }

        return bytes;
    }

    std::string to_hex(std::span<const std::byte> bytes)
    {
        std::string result;
        result.reserve(bytes.size() * 2);

        for (auto byte : bytes)
        {
            result += fmt::format("{:02x}", std::to_integer<unsigned>(byte));
        }

        return result;
    }

    std::string describe_attribute(const stuncodec::stun_attribute& attribute)
    {
        return std::visit([](const auto& value) -> std::string {
            using attribute_t = std::decay_t<decltype(value)>;

            if constexpr (
                std::is_same_v<attribute_t, stuncodec::mapped_address_attribute> ||
                std::is_same_v<attribute_t, stuncodec::xor_mapped_address_attribute> ||
                std::is_same_v<attribute_t, stuncodec::alternate_server_attribute>)
            {
                return fmt::format("{} {}", magic_enum::enum_name(value.address.family), value.address.to_string());
            }
            else if constexpr (
                std::is_same_v<attribute_t, stuncodec::username_attribute> ||
                std::is_same_v<attribute_t, stuncodec::realm_attribute> ||
                std::is_same_v<attribute_t, stuncodec::nonce_attribute> ||
                std::is_same_v<attribute_t, stuncodec::software_attribute>)
            {
                return fmt::format("\"{}\"", value.value);
            }
            else if constexpr (std::is_same_v<attribute_t, stuncodec::message_integrity_attribute>)
            {
                return to_hex(value.hmac);
            }
            else if constexpr (std::is_same_v<attribute_t, stuncodec::fingerprint_attribute>)
            {
                return fmt::format("0x{:08x}", value.value);
            }
            else if constexpr (std::is_same_v<attribute_t, stuncodec::error_code_attribute>)
            {
                return fmt::format("{} {}", value.error_code(), value.reason);
            }
            else if constexpr (std::is_same_v<attribute_t, stuncodec::unknown_attributes_attribute>)
            {
                std::string result;
                for (auto type : value.types)
                {
                    result += fmt::format("{}0x{:04x}", result.empty() ? "" : " ", type);
                }
                return result;
            }
            else if constexpr (std::is_same_v<attribute_t, stuncodec::priority_attribute>)
            {
                return fmt::format("{}", value.value);
            }
            else if constexpr (
                std::is_same_v<attribute_t, stuncodec::ice_controlled_attribute> ||
                std::is_same_v<attribute_t, stuncodec::ice_controlling_attribute>)
            {
                return fmt::format("0x{:016x}", value.tie_breaker);
            }
            else
            {
                return {};
            }
        }, attribute);
    }

    void print_message(const stuncodec::stun_message& message)
    {
        auto& header = message.get_header();

        std::cout << fmt::format("Method: {}\nClass: {}\nLength: {}\nTransaction Id: {}\nAttributes:\n",
            magic_enum::enum_name(header.method),
            magic_enum::enum_name(header.message_class),
            header.message_length,
            to_hex(header.id)
        );

        std::cout << fmt::format("+{:-<22}+{:-<52}+\n", "", "");
        std::cout << fmt::format("| {:^20} | {:<50} |\n", "Type", "Value");
        std::cout << fmt::format("+{:-<22}+{:-<52}+\n", "", "");

        for (auto& attribute : message.get_attributes())
        {
            std::cout << fmt::format("| {:<20} | {:<50} |\n",
                magic_enum::enum_name(stuncodec::get_attribute_type(attribute)),
                describe_attribute(attribute)
            );
        }

        std::cout << fmt::format("+{:-<22}+{:-<52}+\n", "", "");
    }

    int report(const stuncodec::stun_error& error)
    {
        std::cerr << fmt::format("error: {}\n", error.message());
        return 2;
    }

    int build_request(const options& opts)
    {
        auto message = stuncodec::stun_message::create_request();
        if (!message)
        {
            return report(message.error());
        }

        if (opts.username)
        {
            message->add_attribute(stuncodec::username_attribute{ *opts.username });
        }

        if (opts.software)
        {
            message->add_attribute(stuncodec::software_attribute{ *opts.software });
        }

        if (opts.password)
        {
            message->add_message_integrity();
        }

        message->add_fingerprint();

        auto packet = message->encode(opts.password);
        if (!packet)
        {
            return report(packet.error());
        }

        std::cout << to_hex(*packet) << "\n";
        return 0;
    }

    int dump_message(const options& opts)
    {
        std::string text;
        if (opts.hex)
        {
            text = *opts.hex;
        }
        else
        {
            text.assign(std::istreambuf_iterator<char>{ std::cin }, std::istreambuf_iterator<char>{});
        }

        auto bytes = parse_hex(text);
        if (!bytes)
        {
            std::cerr << "error: input is not valid hex\n";
            return 1;
        }

        auto message = stuncodec::stun_message::decode(*bytes, opts.password);
        if (!message)
        {
            return report(message.error());
        }

        print_message(*message);

        if (opts.password && message->find<stuncodec::message_integrity_attribute>())
        {
            std::cout << "MESSAGE-INTEGRITY verified\n";
        }

        return 0;
    }
}

int main(int argc, char** argv)
{
    auto opts = parse_arguments(argc, argv);
    if (!opts)
    {
        std::cerr << c_usage;
        return 1;
    }

    if (opts->build)
    {
        return build_request(*opts);
    }

    return dump_message(*opts);
}
