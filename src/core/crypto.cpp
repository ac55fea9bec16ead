#include "crypto.hpp"
#include <openssl/evp.h> // Modern OpenSSL API
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace lgate {

std::string LedgerCrypto::generate_sha256(const std::string& str) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;

    EVP_MD_CTX* context = EVP_MD_CTX_new();
    if (context == nullptr) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    bool ok = EVP_DigestInit_ex(context, EVP_sha256(), NULL) == 1 &&
              EVP_DigestUpdate(context, str.data(), str.size()) == 1 &&
              EVP_DigestFinal_ex(context, hash, &length) == 1;
    EVP_MD_CTX_free(context);
    if (!ok) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < length; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
    }
    return ss.str();
}

std::string LedgerCrypto::generate_id(const std::string& prefix) {
    static const char hex[] = "0123456789abcdef";
    std::random_device rd;
    std::mt19937_64 generator(rd());
    std::uniform_int_distribution<int> dist(0, 15);

    std::string id = prefix + "_";
    for (int i = 0; i < 12; ++i) id += hex[dist(generator)];
    return id;
}

} // namespace lgate
