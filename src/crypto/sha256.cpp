#include "crypto/sha256.hpp"

#include <openssl/evp.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <vector>

namespace hotswap {

namespace {

std::string HexEncode(std::span<const std::uint8_t> bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[i * 2] = kHex[(bytes[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

class EvpCtx final {
public:
    EvpCtx() : ctx_(EVP_MD_CTX_new()) {}
    EvpCtx(const EvpCtx&) = delete;
    EvpCtx& operator=(const EvpCtx&) = delete;
    ~EvpCtx() {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }

    EVP_MD_CTX* get() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_ = nullptr;
};

} // namespace

struct Sha256Hasher::Impl {
    EvpCtx ctx;
    bool failed = false;
    bool finalized = false;
};

Sha256Hasher::Sha256Hasher() : impl_(std::make_unique<Impl>()) {
    if (!impl_->ctx.ok() || EVP_DigestInit_ex(impl_->ctx.get(), EVP_sha256(), nullptr) != 1) {
        impl_->failed = true;
    }
}

Sha256Hasher::Sha256Hasher(Sha256Hasher&&) noexcept = default;
Sha256Hasher& Sha256Hasher::operator=(Sha256Hasher&&) noexcept = default;
Sha256Hasher::~Sha256Hasher() = default;

void Sha256Hasher::Update(std::span<const std::uint8_t> data) {
    if (!impl_ || impl_->failed || impl_->finalized || data.empty()) return;
    if (EVP_DigestUpdate(impl_->ctx.get(), data.data(), data.size()) != 1) {
        impl_->failed = true;
    }
}

void Sha256Hasher::Update(std::string_view text) {
    Update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()),
                                         text.size()));
}

std::string Sha256Hasher::FinalHex() {
    if (!impl_ || impl_->failed || impl_->finalized) return {};
    impl_->finalized = true;
    std::array<std::uint8_t, 32> digest{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(impl_->ctx.get(), digest.data(), &len) != 1 || len != digest.size())
        return {};
    return HexEncode(digest);
}

Result HashFileInto(const std::string& path, Sha256Hasher& hasher) {
    std::ifstream is(path, std::ios::binary);
    if (!is.good()) {
        return Result::Fail(errno, "cannot open " + path + " (" + std::strerror(errno) + ")");
    }

    std::vector<char> buf(64 * 1024);
    while (is) {
        is.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const std::streamsize n = is.gcount();
        if (n > 0) {
            hasher.Update(std::span<const std::uint8_t>(
                reinterpret_cast<const std::uint8_t*>(buf.data()), static_cast<size_t>(n)));
        }
    }
    if (is.bad()) {
        return Result::Fail(-1, "read failed: " + path);
    }
    return Result::Ok();
}

} // namespace hotswap
