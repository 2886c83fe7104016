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


#include "infocard/TransformChain.hh"

#include <utility>

#include <xmlsec/strings.h>

#include "infocard/EnvelopedSignatureTransform.hh"
#include "infocard/ExclusiveC14NTransform.hh"

using namespace infocard;

namespace
{
  bool is_algorithm(const std::string &algorithm, const xmlChar *href)
  {
    return algorithm == reinterpret_cast<const char *>(href);
  }
} // namespace

std::shared_ptr<Transform>
TransformFactory::create(const std::string &algorithm, const std::vector<std::string> &inclusive_prefixes)
{
  if (is_algorithm(algorithm, xmlSecHrefExcC14N))
    {
      return std::make_shared<ExclusiveC14NTransform>(inclusive_prefixes);
    }
  if (is_algorithm(algorithm, xmlSecHrefEnveloped))
    {
      return std::make_shared<EnvelopedSignatureTransform>();
    }
  return {};
}

bool
TransformFactory::is_supported(const std::string &algorithm)
{
  return is_algorithm(algorithm, xmlSecHrefExcC14N) || is_algorithm(algorithm, xmlSecHrefEnveloped);
}

TransformChain::TransformChain(Options options)
  : options(options)
{
}

outcome::std_result<void>
TransformChain::add_transform(const std::string &algorithm, const std::vector<std::string> &inclusive_prefixes)
{
  auto transform = TransformFactory::create(algorithm, inclusive_prefixes);
  if (!transform)
    {
      logger->error("unsupported transform algorithm '{}'", algorithm);
      return TransformErrc::UnsupportedTransform;
    }

  steps.push_back(Step{TransformInfo{algorithm, inclusive_prefixes}, std::move(transform)});
  return outcome::success();
}

void
TransformChain::add_transform(std::shared_ptr<Transform> transform)
{
  TransformInfo info{transform->algorithm(), {}};
  if (auto c14n = std::dynamic_pointer_cast<ExclusiveC14NTransform>(transform); c14n)
    {
      info.inclusive_prefixes = c14n->get_inclusive_prefixes();
    }
  steps.push_back(Step{std::move(info), std::move(transform)});
}

std::vector<TransformInfo>
TransformChain::get_transforms() const
{
  std::vector<TransformInfo> ret;
  ret.reserve(steps.size());
  for (const auto &step: steps)
    {
      ret.push_back(step.info);
    }
  return ret;
}

std::size_t
TransformChain::size() const
{
  return steps.size();
}

bool
TransformChain::empty() const
{
  return steps.empty();
}

outcome::std_result<std::string>
TransformChain::apply(const std::string &xml) const
{
  if (xml.size() > options.max_document_size)
    {
      logger->error("document of {} bytes exceeds the limit of {} bytes", xml.size(), options.max_document_size);
      return TransformErrc::DocumentTooLarge;
    }

  std::string data = xml;
  for (const auto &step: steps)
    {
      auto result = step.transform->transform(data);
      if (!result)
        {
          logger->error("transform {} failed: {}", step.info.algorithm, result.error().message());
          return result.error();
        }
      data = std::move(result.value());
    }
  return data;
}
