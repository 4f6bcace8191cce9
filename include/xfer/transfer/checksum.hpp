#pragma once

#include "xfer/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace xfer::transfer {

/**
 * @brief Incremental SHA-256 over OpenSSL's EVP interface
 *
 * Lets the reassembler hash chunks in sequence order without first
 * concatenating them.
 */
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(const std::uint8_t* data, std::size_t size);
    void update(const std::vector<std::uint8_t>& data) { update(data.data(), data.size()); }

    /// Lower-case hex digest. The object cannot be updated afterwards.
    Result<std::string> finish();

private:
    struct CtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const noexcept;
    };

    std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
    bool ok_ = true;
};

/// SHA-256 of the whole buffer as 64 lower-case hex characters.
Result<std::string> sha256_hex(const std::vector<std::uint8_t>& data);

} // namespace xfer::transfer
