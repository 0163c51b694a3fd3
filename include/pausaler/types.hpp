#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <stdexcept>
#include <string>

namespace pausaler
{

    /**
     * Error kinds for licensing operations. Expected license lifecycle
     * states (expired, not yet valid, ...) are not errors; they are
     * reported as verdict reasons by the verifier.
     */
    enum class ErrorCode
    {
        MalformedEncoding,
        UnsupportedKeyFormat,
        InvalidPayload,
        InvalidTimestamp,
        SignatureInvalid,
        ActivationCodeMalformed,
        MissingField,
        AppIdMismatch,
        MissingIdentifier,
        ConfigError,
        CryptoError,
        IOError
    };

    inline std::string error_code_to_string(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::MalformedEncoding:
            return "malformed_encoding";
        case ErrorCode::UnsupportedKeyFormat:
            return "unsupported_key_format";
        case ErrorCode::InvalidPayload:
            return "invalid_payload";
        case ErrorCode::InvalidTimestamp:
            return "invalid_timestamp";
        case ErrorCode::SignatureInvalid:
            return "signature_invalid";
        case ErrorCode::ActivationCodeMalformed:
            return "activation_code_malformed";
        case ErrorCode::MissingField:
            return "missing_field";
        case ErrorCode::AppIdMismatch:
            return "app_id_mismatch";
        case ErrorCode::MissingIdentifier:
            return "missing_identifier";
        case ErrorCode::ConfigError:
            return "config_error";
        case ErrorCode::CryptoError:
            return "crypto_error";
        case ErrorCode::IOError:
            return "io_error";
        }
        return "unknown";
    }

    /**
     * Licensing error with code and message
     */
    class LicenseError : public std::runtime_error
    {
    public:
        ErrorCode code;

        LicenseError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static LicenseError encoding(const std::string &msg)
        {
            return LicenseError(ErrorCode::MalformedEncoding, msg);
        }

        static LicenseError key_format(const std::string &msg)
        {
            return LicenseError(ErrorCode::UnsupportedKeyFormat, msg);
        }

        static LicenseError payload(const std::string &msg)
        {
            return LicenseError(ErrorCode::InvalidPayload, msg);
        }

        static LicenseError timestamp(const std::string &msg)
        {
            return LicenseError(ErrorCode::InvalidTimestamp, msg);
        }

        static LicenseError signature(const std::string &msg)
        {
            return LicenseError(ErrorCode::SignatureInvalid, msg);
        }

        static LicenseError activation(const std::string &msg)
        {
            return LicenseError(ErrorCode::ActivationCodeMalformed, msg);
        }

        static LicenseError missing_field(const std::string &msg)
        {
            return LicenseError(ErrorCode::MissingField, msg);
        }

        static LicenseError config(const std::string &msg)
        {
            return LicenseError(ErrorCode::ConfigError, msg);
        }

        static LicenseError crypto(const std::string &msg)
        {
            return LicenseError(ErrorCode::CryptoError, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, LicenseError>;

    /** Wall-clock reading passed explicitly into time-dependent checks */
    using TimePoint = std::chrono::system_clock::time_point;

} // namespace pausaler
