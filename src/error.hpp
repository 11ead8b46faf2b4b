#pragma once

#include <stdexcept>
#include <string>

namespace assetlock {

class AssetLockError : public std::runtime_error {
public:
    enum class ErrorType {
        InsufficientFunds,
        NetworkError,
        ProofTimeout,
        Cancelled,
        PersistenceError,
        InvalidState,
        InvalidKeyFormat,
        Base58DecodeError,
        SigningFailure,
        MalformedScript,
        RPCError,
        ConfigError,
        PlatformError
    };

    AssetLockError(ErrorType type, const std::string& message = "")
        : std::runtime_error(message.empty() ? default_message(type) : message)
        , type_(type)
    {}

    ErrorType type() const { return type_; }

    static const char* default_message(ErrorType type) {
        switch (type) {
            case ErrorType::InsufficientFunds: return "Insufficient funds";
            case ErrorType::NetworkError: return "Network error";
            case ErrorType::ProofTimeout: return "Timed out waiting for asset lock proof";
            case ErrorType::Cancelled: return "Operation cancelled";
            case ErrorType::PersistenceError: return "Failed to persist state";
            case ErrorType::InvalidState: return "Invalid state";
            case ErrorType::InvalidKeyFormat: return "Invalid key format";
            case ErrorType::Base58DecodeError: return "Invalid Base58 data";
            case ErrorType::SigningFailure: return "Signing failure";
            case ErrorType::MalformedScript: return "Malformed script";
            case ErrorType::RPCError: return "RPC error";
            case ErrorType::ConfigError: return "Configuration error";
            case ErrorType::PlatformError: return "Platform error";
        }
        return "Asset lock error";
    }

private:
    ErrorType type_;
};

} // namespace assetlock
