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

#ifndef CRYPTO_DIGEST_HH
#define CRYPTO_DIGEST_HH

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include <boost/outcome/std_result.hpp>
#include <openssl/evp.h>

#include "crypto/DigestErrors.hh"
#include "utils/Logging.hh"

namespace outcome = boost::outcome_v2;

namespace infocard::crypto
{
  /*
   * Message digest selected by its XML-Signature DigestMethod algorithm URI.
   */
  class Digest
  {
  public:
    static outcome::std_result<Digest> create(const std::string &algorithm);
    static bool is_supported(const std::string &algorithm);

    // Returns the raw digest bytes.
    outcome::std_result<std::string> compute(std::string_view data) const;

    const std::string &algorithm() const;
    std::size_t size() const;

  private:
    Digest(std::string algorithm, const EVP_MD *md);

  private:
    std::string algorithm_uri;
    const EVP_MD *md{nullptr};
    std::shared_ptr<spdlog::logger> logger{infocard::utils::Logging::create("infocard:digest")};
  };
} // namespace infocard::crypto

#endif // CRYPTO_DIGEST_HH
