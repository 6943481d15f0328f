/// @file operator_auth.cpp
/// @brief OperatorAuthenticator on OpenSSL SHA-256 and CRYPTO_memcmp.

#include "afc/control/operator_auth.hpp"

#include "afc/foundation/control_logger.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <cctype>

namespace afc::control {

using foundation::ControlError;
using foundation::ControlResult;
using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

ControlResult<std::string> unauthenticated(std::string message) {
    return ControlResult<std::string>::err(
        ControlError(ErrorCode::Unauthenticated, std::move(message)));
}

} // namespace

OperatorAuthenticator::OperatorAuthenticator(const std::map<std::string, std::string>& tokens) {
    operators_.reserve(tokens.size());
    for (const auto& [operatorId, token] : tokens) {
        auto hashed = digest(token);
        if (!hashed) {
            AFC_LOG_ERROR(LogCategory::Core,
                          "cannot hash the token of operator " + operatorId + "; ignored");
            continue;
        }
        operators_.emplace_back(operatorId, *hashed);
    }
}

std::optional<OperatorAuthenticator::Digest> OperatorAuthenticator::digest(
    std::string_view token) {
    Digest out{};
    unsigned int len = 0;
    if (EVP_Digest(token.data(), token.size(), out.data(), &len, EVP_sha256(), nullptr) != 1 ||
        len != out.size()) {
        return std::nullopt;
    }
    return out;
}

ControlResult<std::string> OperatorAuthenticator::authenticate(
    std::string_view authorization) const {
    if (operators_.empty()) {
        return unauthenticated("operator routes are disabled: no operator tokens configured");
    }
    if (authorization.empty()) {
        return unauthenticated("missing Authorization header");
    }

    constexpr std::string_view scheme = "bearer";
    auto space = authorization.find(' ');
    if (space == std::string_view::npos ||
        !equalsIgnoreCase(authorization.substr(0, space), scheme)) {
        return unauthenticated("Authorization must be a Bearer credential");
    }
    auto token = authorization.substr(space + 1);
    while (!token.empty() && token.front() == ' ') {
        token.remove_prefix(1);
    }
    while (!token.empty() && token.back() == ' ') {
        token.remove_suffix(1);
    }
    if (token.empty()) {
        return unauthenticated("empty bearer token");
    }

    auto presented = digest(token);
    if (!presented) {
        return unauthenticated("cannot hash bearer token");
    }
    const std::string* match = nullptr;
    for (const auto& [operatorId, expected] : operators_) {
        if (CRYPTO_memcmp(presented->data(), expected.data(), expected.size()) == 0) {
            match = &operatorId;
        }
    }
    if (match == nullptr) {
        return unauthenticated("unknown bearer token");
    }
    return ControlResult<std::string>::ok(*match);
}

} // namespace afc::control
