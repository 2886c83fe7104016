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


#ifndef INFOCARD_REFERENCE_VALIDATOR_HH
#define INFOCARD_REFERENCE_VALIDATOR_HH

#include <memory>
#include <string>
#include <vector>

#include <boost/outcome/std_result.hpp>

#include "infocard/TransformChain.hh"

namespace infocard
{
  struct ReferenceInfo
  {
    std::string uri;
    std::vector<TransformInfo> transforms;
    std::string digest_method;
    // Raw digest bytes. computed_digest stays empty when only inspected.
    std::string expected_digest;
    std::string computed_digest;
  };

  struct SignedInfoResult
  {
    std::string canonicalization_method;
    std::vector<std::string> inclusive_prefixes;
    std::string signature_method;
    std::string canonical_signed_info;
    std::vector<ReferenceInfo> references;
  };

  /*
   * Checks the ds:Reference digests of an enveloped XML signature. The
   * signature value itself is not verified; callers verify it over
   * SignedInfoResult::canonical_signed_info with the key of their choice.
   */
  class ReferenceValidator
  {
  public:
    ReferenceValidator();
    explicit ReferenceValidator(TransformChain::Options options);
    ~ReferenceValidator();

    ReferenceValidator(const ReferenceValidator &) = delete;
    ReferenceValidator &operator=(const ReferenceValidator &) = delete;
    ReferenceValidator(ReferenceValidator &&) noexcept;
    ReferenceValidator &operator=(ReferenceValidator &&) noexcept;

    outcome::std_result<SignedInfoResult> validate(const std::string &signed_xml) const;
    outcome::std_result<SignedInfoResult> inspect(const std::string &signed_xml) const;

  private:
    class Impl;
    std::unique_ptr<Impl> pimpl;
  };
} // namespace infocard

#endif // INFOCARD_REFERENCE_VALIDATOR_HH
