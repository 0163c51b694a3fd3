#pragma once

namespace pausaler::cli
{

    /** Vendor-side tool: generate, public-key, config-print */
    int run_issuer(int argc, char *argv[]);

    /** Host-side companion: activation-code, check, hash */
    int run_client(int argc, char *argv[]);

} // namespace pausaler::cli
