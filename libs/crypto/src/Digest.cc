// Copyright (C) 2025 Rob Caelers <rob.caelers@gmail.com>
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#include "crypto/Digest.hh"

#include <array>
#include <memory>
#include <utility>

#include <openssl/err.h>
#include <openssl/evp.h>

#include <xmlsec/xmlsec.h>
#include <xmlsec/strings.h>

#include "utils/ScopedPtr.hh"

using namespace infocard::crypto;

namespace
{
  struct DigestAlgorithm
  {
    const xmlChar *href;
    const EVP_MD *(*md)();
  };

  const std::array<DigestAlgorithm, 4> digest_algorithms{{
    {xmlSecHrefSha1, EVP_sha1},
    {xmlSecHrefSha256, EVP_sha256},
    {xmlSecHrefSha384, EVP_sha384},
    {xmlSecHrefSha512, EVP_sha512},
  }};

  const EVP_MD *lookup(const std::string &algorithm)
  {
    for (const auto &entry: digest_algorithms)
      {
        if (algorithm == reinterpret_cast<const char *>(entry.href)) // NOLINT:cppcoreguidelines-pro-type-reinterpret-cast
          {
            return entry.md();
          }
      }
    return nullptr;
  }

  std::string last_openssl_error()
  {
    std::array<char, 256> buffer{};
    ERR_error_string_n(ERR_get_error(), buffer.data(), buffer.size());
    ERR_clear_error();
    return buffer.data();
  }
} // namespace

Digest::Digest(std::string algorithm, const EVP_MD *md)
  : algorithm_uri(std::move(algorithm))
  , md(md)
{
}

outcome::std_result<Digest>
Digest::create(const std::string &algorithm)
{
  const EVP_MD *md = lookup(algorithm);
  if (md == nullptr)
    {
      spdlog::default_logger()->error("unsupported digest algorithm {}", algorithm);
      return DigestErrc::UnsupportedAlgorithm;
    }
  return Digest(algorithm, md);
}

bool
Digest::is_supported(const std::string &algorithm)
{
  return lookup(algorithm) != nullptr;
}

outcome::std_result<std::string>
Digest::compute(std::string_view data) const
{
  std::array<unsigned char, EVP_MAX_MD_SIZE> hash{};
  unsigned int hash_len = 0;

  auto ctx = infocard::utils::make_scoped(EVP_MD_CTX_new(), EVP_MD_CTX_free);
  if (!ctx)
    {
      logger->error("failed to create digest context ({})", last_openssl_error());
      return DigestErrc::InternalFailure;
    }

  if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1)
    {
      logger->error("failed to initialize {} digest ({})", algorithm_uri, last_openssl_error());
      return DigestErrc::InternalFailure;
    }

  if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1)
    {
      logger->error("failed to update {} digest ({})", algorithm_uri, last_openssl_error());
      return DigestErrc::InternalFailure;
    }

  if (EVP_DigestFinal_ex(ctx.get(), hash.data(), &hash_len) != 1)
    {
      logger->error("failed to finalize {} digest ({})", algorithm_uri, last_openssl_error());
      return DigestErrc::InternalFailure;
    }

  return std::string(hash.begin(), hash.begin() + hash_len);
}

const std::string &
Digest::algorithm() const
{
  return algorithm_uri;
}

std::size_t
Digest::size() const
{
  return static_cast<std::size_t>(EVP_MD_size(md));
}
