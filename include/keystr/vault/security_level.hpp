#pragma once

#include <cstdint>
#include <string_view>

namespace keystr::vault {

/// Persistence policy for the secret key.
enum class SecurityLevel : uint8_t {
    /// Key lives in memory only; Save() is a no-op.
    NeverPersist = 0,
    /// Key is written encrypted under a non-empty password.
    PersistPasswordRequired = 1,
    /// Key is written encrypted; an empty password is accepted.
    PersistOptionalPassword = 2
};

constexpr std::string_view SecurityLevelName(SecurityLevel level) noexcept {
    switch (level) {
        case SecurityLevel::NeverPersist: return "NeverPersist";
        case SecurityLevel::PersistPasswordRequired: return "PersistPasswordRequired";
        case SecurityLevel::PersistOptionalPassword: return "PersistOptionalPassword";
    }
    return "Unknown";
}

constexpr bool AllowsEmptyPassword(SecurityLevel level) noexcept {
    return level != SecurityLevel::PersistPasswordRequired;
}

}
