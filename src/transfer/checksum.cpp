#include "xfer/transfer/checksum.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <sstream>

namespace xfer::transfer {

void Sha256::CtxDeleter::operator()(EVP_MD_CTX* ctx) const noexcept {
    EVP_MD_CTX_free(ctx);
}

Sha256::Sha256()
    : ctx_(EVP_MD_CTX_new()) {
    ok_ = ctx_ && EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) == 1;
}

Sha256::~Sha256() = default;

void Sha256::update(const std::uint8_t* data, std::size_t size) {
    if (!ok_ || size == 0) {
        return;
    }
    ok_ = EVP_DigestUpdate(ctx_.get(), data, size) == 1;
}

Result<std::string> Sha256::finish() {
    if (!ok_) {
        return Err<std::string>(std::string("SHA-256 digest failed"));
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    ok_ = false;
    if (EVP_DigestFinal_ex(ctx_.get(), digest, &length) != 1) {
        return Err<std::string>(std::string("SHA-256 finalisation failed"));
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return Ok(oss.str());
}

Result<std::string> sha256_hex(const std::vector<std::uint8_t>& data) {
    Sha256 hasher;
    hasher.update(data);
    return hasher.finish();
}

} // namespace xfer::transfer
