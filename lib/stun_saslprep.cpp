#include "stuncodec/stun_saslprep.h"

#include <limits>
#include <memory>
#include <optional>

#include <unicode/usprep.h>
#include <unicode/ustring.h>

namespace
{
    struct profile_deleter
    {
        void operator()(UStringPrepProfile* profile) const noexcept
        {
            usprep_close(profile);
        }
    };

    using profile_ptr = std::unique_ptr<UStringPrepProfile, profile_deleter>;

    // ICU profiles are immutable once opened and safe to share between threads
    const UStringPrepProfile* get_saslprep_profile() noexcept
    {
        static const profile_ptr s_profile = []() {
            UErrorCode status = U_ZERO_ERROR;
            profile_ptr profile{ usprep_openByType(USPREP_RFC4013_SASLPREP, &status) };
            if (U_FAILURE(status))
            {
                return profile_ptr{};
            }
            return profile;
        }();

        return s_profile.get();
    }

    std::optional<std::u16string> to_utf16(std::string_view input)
    {
        // A UTF-16 string never has more code units than the UTF-8 one has bytes
        std::u16string output(input.size(), u'\0');

        UErrorCode status = U_ZERO_ERROR;
        int32_t length = 0;
        u_strFromUTF8(
            output.data(),
            static_cast<int32_t>(output.size()),
            &length,
            input.data(),
            static_cast<int32_t>(input.size()),
            &status
        );

        if (U_FAILURE(status))
        {
            return std::nullopt;
        }

        output.resize(static_cast<std::size_t>(length));
        return output;
    }

    std::optional<std::u16string> prepare(const UStringPrepProfile* profile, const std::u16string& input)
    {
        UErrorCode status = U_ZERO_ERROR;
        UParseError parse_error{};

        // NFKC may grow the string so ask for the size first
        auto length = usprep_prepare(
            profile,
            input.data(), static_cast<int32_t>(input.size()),
            nullptr, 0,
            USPREP_DEFAULT,
            &parse_error,
            &status
        );

        if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status))
        {
            return std::nullopt;
        }

        if (length == 0)
        {
            return std::u16string{};
        }

        std::u16string output(static_cast<std::size_t>(length), u'\0');

        status = U_ZERO_ERROR;
        usprep_prepare(
            profile,
            input.data(), static_cast<int32_t>(input.size()),
            output.data(), static_cast<int32_t>(output.size()),
            USPREP_DEFAULT,
            &parse_error,
            &status
        );

        if (U_FAILURE(status))
        {
            return std::nullopt;
        }

        return output;
    }

    std::optional<std::string> to_utf8(const std::u16string& input)
    {
        UErrorCode status = U_ZERO_ERROR;
        int32_t length = 0;
        u_strToUTF8(nullptr, 0, &length, input.data(), static_cast<int32_t>(input.size()), &status);

        if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status))
        {
            return std::nullopt;
        }

        std::string output(static_cast<std::size_t>(length), '\0');

        status = U_ZERO_ERROR;
        u_strToUTF8(
            output.data(),
            static_cast<int32_t>(output.size()),
            &length,
            input.data(),
            static_cast<int32_t>(input.size()),
            &status
        );

        if (U_FAILURE(status))
        {
            return std::nullopt;
        }

        return output;
    }
}

namespace stuncodec
{
    stun_result<std::string> saslprep(std::string_view input)
    {
        if (input.empty())
        {
            return std::string{};
        }

        if (input.size() > static_cast<std::size_t>(std::numeric_limits<int32_t>::max()))
        {
            return make_unexpected(stun_integrity_error::saslprep_failure);
        }

        auto profile = get_saslprep_profile();
        if (!profile)
        {
            return make_unexpected(stun_integrity_error::saslprep_failure);
        }

        auto utf16 = to_utf16(input);
        if (!utf16)
        {
            return make_unexpected(stun_integrity_error::saslprep_failure);
        }

        auto prepared = prepare(profile, *utf16);
        if (!prepared)
        {
            return make_unexpected(stun_integrity_error::saslprep_failure);
        }

        auto output = to_utf8(*prepared);
        if (!output)
        {
            return make_unexpected(stun_integrity_error::saslprep_failure);
        }

        return *output;
    }
}
