#include "uuidforge/util/digest.hpp"

#include "uuidforge/util/log.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <utility>

namespace uuidforge::util {
namespace {

auto log_openssl_error(std::string_view where) -> void {
  const auto code = ERR_get_error();
  std::array<char, 256> buf{};
  if (code != 0) {
    ERR_error_string_n(code, buf.data(), buf.size());
  }
  log::error("SHA-1 {} failed: {}", where,
             code != 0 ? buf.data() : "no OpenSSL error queued");
}

} // namespace

auto Sha1::CtxDeleter::operator()(evp_md_ctx_st *ctx) const noexcept -> void {
  EVP_MD_CTX_free(ctx);
}

Sha1::Sha1() : ctx_(EVP_MD_CTX_new()) {
  if (ctx_ && EVP_DigestInit_ex(ctx_.get(), EVP_sha1(), nullptr) != 1) {
    log_openssl_error("init");
    ctx_.reset();
  }
}

Sha1::~Sha1() = default;
Sha1::Sha1(Sha1 &&) noexcept = default;
auto Sha1::operator=(Sha1 &&) noexcept -> Sha1 & = default;

auto Sha1::update(std::span<const std::byte> data) -> Result<void> {
  if (finished_) {
    return fail(Error::InvalidState);
  }
  if (!ctx_) {
    return fail(Error::DigestFailed);
  }
  if (data.empty()) {
    return ok();
  }
  if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
    log_openssl_error("update");
    return fail(Error::DigestFailed);
  }
  return ok();
}

auto Sha1::finish() -> Result<Sha1Digest> {
  if (finished_) {
    return fail(Error::InvalidState);
  }
  if (!ctx_) {
    return fail(Error::DigestFailed);
  }
  finished_ = true;
  Sha1Digest digest{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), digest.data(), &len) != 1 ||
      len != digest.size()) {
    log_openssl_error("final");
    return fail(Error::DigestFailed);
  }
  return ok(digest);
}

} // namespace uuidforge::util
