#include "pausaler/key_codec.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace pausaler::key_codec
{
    namespace
    {
        const std::string kBeginGuard = "-----BEGIN PUBLIC KEY-----";
        const std::string kEndGuard = "-----END PUBLIC KEY-----";
    }

    std::string encode_public_key_pem(const crypto::Ed25519PublicKey &public_key)
    {
        crypto::Bytes der(kEd25519SpkiPrefix.begin(), kEd25519SpkiPrefix.end());
        der.insert(der.end(), public_key.begin(), public_key.end());

        std::string b64 = crypto::Base64::encode(der);
        std::string pem = kBeginGuard + "\n";
        for (size_t i = 0; i < b64.size(); i += kPemLineWidth)
        {
            pem += b64.substr(i, kPemLineWidth);
            pem += '\n';
        }
        pem += kEndGuard + "\n";
        return pem;
    }

    Result<crypto::Ed25519PublicKey> decode_public_key_pem(const std::string &pem)
    {
        std::string b64;
        std::istringstream lines(pem);
        std::string line;
        while (std::getline(lines, line))
        {
            std::string l = crypto::trim(line);
            if (l.empty())
                continue;
            if (l.starts_with("-----BEGIN") || l.starts_with("-----END"))
                continue;
            l.erase(std::remove_if(l.begin(), l.end(), [](unsigned char c) { return std::isspace(c); }), l.end());
            b64 += l;
        }

        auto der = crypto::Base64::decode(b64);
        if (!der)
        {
            return std::unexpected(LicenseError::key_format(std::string("invalid public key pem base64: ") + der.error().what()));
        }

        if (der->size() != kSpkiLength ||
            !std::equal(kEd25519SpkiPrefix.begin(), kEd25519SpkiPrefix.end(), der->begin()))
        {
            return std::unexpected(LicenseError::key_format("unsupported public key format"));
        }

        crypto::Ed25519PublicKey key;
        std::copy(der->begin() + kEd25519SpkiPrefix.size(), der->end(), key.begin());
        return key;
    }

} // namespace pausaler::key_codec
