#pragma once

#include <functional>
#include <string>
#include <string_view>

#include "stun_error_category.h"

namespace stuncodec
{
    // Normalizes a credential string before it is used as (or hashed into) an
    // HMAC key. Failures are reported as stun_integrity_error::saslprep_failure.
    using saslprep_function = std::function<stun_result<std::string>(std::string_view)>;

    // SASLprep profile of stringprep [RFC4013] as implemented by ICU. The
    // input is mapped, NFKC normalized and checked for prohibited output and
    // bidirectional text. Unassigned code points are rejected, as required
    // for stored strings.
    stun_result<std::string> saslprep(std::string_view input);
}
