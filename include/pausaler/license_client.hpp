#pragma once

#include "types.hpp"
#include "config.hpp"
#include "license_verifier.hpp"
#include <string>

namespace pausaler
{

    /**
     * Host application side of licensing: produces activation codes for the
     * configured company identifier and checks stored licenses against it.
     * Created once at startup and passed to whatever needs it.
     */
    class LicenseClient
    {
    public:
        LicenseClient(std::string app_id, LicenseVerifier verifier);

        /**
         * Build from config. Uses the public key embedded at build time
         * unless verifier.public_key_path points to another PEM file.
         */
        static Result<LicenseClient> from_config(const LicensingConfig &cfg);

        /**
         * Hash of the trimmed identifier; an empty identifier fails with
         * ErrorCode::MissingIdentifier.
         */
        static Result<std::string> identifier_hash(const std::string &identifier);

        Result<std::string> generate_activation_code(const std::string &identifier, TimePoint now) const;

        /**
         * Check a pasted or stored license for the identifier currently
         * configured in the host. The hash is always recomputed here.
         * An empty license is reported as invalid_format.
         */
        Result<VerificationVerdict> check(const std::string &license,
                                          const std::string &identifier,
                                          TimePoint now) const;

        const std::string &app_id() const { return app_id_; }

        const LicenseVerifier &verifier() const { return verifier_; }

    private:
        std::string app_id_;
        LicenseVerifier verifier_;
    };

} // namespace pausaler
