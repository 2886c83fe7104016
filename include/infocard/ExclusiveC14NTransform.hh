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


#ifndef INFOCARD_EXCLUSIVE_C14N_TRANSFORM_HH
#define INFOCARD_EXCLUSIVE_C14N_TRANSFORM_HH

#include <memory>
#include <string>
#include <vector>

#include <boost/outcome/std_result.hpp>

#include "infocard/Transform.hh"
#include "utils/Logging.hh"

namespace infocard
{
  struct CanonicalizationMode
  {
    bool exclusive;
    bool with_comments;
  };

  /*
   * Exclusive XML Canonicalization 1.0 without comments
   * (http://www.w3.org/2001/10/xml-exc-c14n#).
   *
   * Output is UTF-8, uses expanded empty elements, sorted attributes and
   * only the namespace declarations visibly used by each element, so the
   * same logical document yields the same octets regardless of
   * serialization details of the input.
   */
  class ExclusiveC14NTransform : public Transform
  {
  public:
    static constexpr CanonicalizationMode mode{.exclusive = true, .with_comments = false};

    ExclusiveC14NTransform() = default;

    // Prefixes treated as in the InclusiveNamespaces PrefixList. Use
    // "#default" for the default namespace.
    explicit ExclusiveC14NTransform(std::vector<std::string> inclusive_prefixes);

    outcome::std_result<std::string> transform(const std::string &xml) const override;
    std::string algorithm() const override;

    outcome::std_result<std::string> canonicalize(const std::string &xml) const;

    // Canonicalizes only the element whose Id, ID or AssertionID attribute
    // equals element_id, together with its descendants.
    outcome::std_result<std::string> canonicalize_subtree(const std::string &xml, const std::string &element_id) const;

    const std::vector<std::string> &get_inclusive_prefixes() const;

  private:
    std::vector<std::string> inclusive_prefixes;
    std::shared_ptr<spdlog::logger> logger{infocard::utils::Logging::create("infocard:c14n")};
  };
} // namespace infocard

#endif // INFOCARD_EXCLUSIVE_C14N_TRANSFORM_HH
