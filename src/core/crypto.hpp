/**
 * LedgerGate: Period Lock & Posting Engine - Cryptographic Module Header
 * Purpose: SHA-256 seals for journal entries and random record identifiers.
 */

#ifndef LGATE_CRYPTO_HPP
#define LGATE_CRYPTO_HPP

#include <string>

namespace lgate {

class LedgerCrypto {
public:
    static std::string generate_sha256(const std::string& str);

    /**
     * generate_id
     * Record identifiers such as "lock_3f9a0c1b22de" or "je_81c0ffa9d3b1".
     */
    static std::string generate_id(const std::string& prefix);
};

} // namespace lgate

#endif
