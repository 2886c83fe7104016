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


#ifndef INFOCARD_TRANSFORM_CHAIN_HH
#define INFOCARD_TRANSFORM_CHAIN_HH

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <boost/outcome/std_result.hpp>

#include "infocard/Transform.hh"
#include "utils/Logging.hh"

namespace infocard
{
  struct TransformInfo
  {
    std::string algorithm;
    std::vector<std::string> inclusive_prefixes;
  };

  class TransformFactory
  {
  public:
    // Returns nullptr for algorithms that are not supported.
    static std::shared_ptr<Transform> create(const std::string &algorithm,
                                             const std::vector<std::string> &inclusive_prefixes);
    static bool is_supported(const std::string &algorithm);
  };

  /*
   * Ordered list of transforms applied to a signed document, as listed in
   * the Transforms element of a ds:Reference.
   */
  class TransformChain
  {
  public:
    static constexpr std::size_t DEFAULT_MAX_DOCUMENT_SIZE = 10U * 1024U * 1024U;

    struct Options
    {
      std::size_t max_document_size{DEFAULT_MAX_DOCUMENT_SIZE};
    };

    TransformChain() = default;
    explicit TransformChain(Options options);

    outcome::std_result<void> add_transform(const std::string &algorithm,
                                            const std::vector<std::string> &inclusive_prefixes = {});
    void add_transform(std::shared_ptr<Transform> transform);

    std::vector<TransformInfo> get_transforms() const;
    std::size_t size() const;
    bool empty() const;

    // Feeds xml through every transform in order. An empty chain returns
    // its input unchanged.
    outcome::std_result<std::string> apply(const std::string &xml) const;

  private:
    struct Step
    {
      TransformInfo info;
      std::shared_ptr<Transform> transform;
    };

    Options options;
    std::vector<Step> steps;
    std::shared_ptr<spdlog::logger> logger{infocard::utils::Logging::create("infocard:chain")};
  };
} // namespace infocard

#endif // INFOCARD_TRANSFORM_CHAIN_HH
