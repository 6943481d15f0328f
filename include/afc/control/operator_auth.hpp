#pragma once

/// @file operator_auth.hpp
/// @brief Bearer-token identification of operators on the HTTP routes.

#include "afc/foundation/control_result.hpp"

#include <array>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace afc::control {

/// Maps "Authorization: Bearer <token>" to the operator owning the token.
///
/// Only SHA-256 digests of the tokens are kept. A presented token is hashed
/// and compared against every entry with CRYPTO_memcmp, so the time taken
/// does not depend on which entry (if any) matches or on how many leading
/// bytes agree.
class OperatorAuthenticator {
public:
    /// @param tokens operator id -> token
    explicit OperatorAuthenticator(const std::map<std::string, std::string>& tokens);

    /// Operator id for an Authorization header value.
    /// @return Unauthenticated when the header is empty, not a Bearer
    ///         credential, or matches no operator.
    [[nodiscard]] foundation::ControlResult<std::string> authenticate(
        std::string_view authorization) const;

    [[nodiscard]] bool empty() const { return operators_.empty(); }

private:
    using Digest = std::array<unsigned char, 32>;

    static std::optional<Digest> digest(std::string_view token);

    std::vector<std::pair<std::string, Digest>> operators_;
};

} // namespace afc::control
