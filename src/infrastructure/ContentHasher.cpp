/**
 * @file ContentHasher.cpp
 * @brief Implementation of ContentHasher using the OpenSSL EVP API.
 */

#include "infrastructure/ContentHasher.hpp"
#include "domain/IngestionErrors.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <memory>
#include <sstream>

namespace distill::infrastructure {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

} // namespace

domain::ContentIdentity ContentHasher::identify(const std::string& bytes) {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw domain::IdentityError("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw domain::IdentityError("EVP_DigestInit_ex failed");
    }
    if (!bytes.empty() && EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1) {
        throw domain::IdentityError("EVP_DigestUpdate failed");
    }

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdLen = 0;
    if (EVP_DigestFinal_ex(ctx.get(), md, &mdLen) != 1) {
        throw domain::IdentityError("EVP_DigestFinal_ex failed");
    }

    std::ostringstream ss;
    for (unsigned int i = 0; i < mdLen; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(md[i]);
    }
    return domain::ContentIdentity(ss.str());
}

} // namespace distill::infrastructure
