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


#include "infocard/ExclusiveC14NTransform.hh"

#include <utility>

#include <xmlsec/strings.h>

#include "XmlDocument.hh"

using namespace infocard;

ExclusiveC14NTransform::ExclusiveC14NTransform(std::vector<std::string> inclusive_prefixes)
  : inclusive_prefixes(std::move(inclusive_prefixes))
{
}

outcome::std_result<std::string>
ExclusiveC14NTransform::transform(const std::string &xml) const
{
  return canonicalize(xml);
}

std::string
ExclusiveC14NTransform::algorithm() const
{
  return reinterpret_cast<const char *>(xmlSecHrefExcC14N);
}

outcome::std_result<std::string>
ExclusiveC14NTransform::canonicalize(const std::string &xml) const
{
  xml::XmlParser parser(logger);
  auto doc = parser.parse(xml);
  if (!doc)
    {
      return doc.error();
    }

  auto result = doc.value().canonicalize(nullptr, inclusive_prefixes, mode.with_comments);
  if (result)
    {
      logger->debug("canonicalized {} bytes into {} bytes", xml.size(), result.value().size());
    }
  return result;
}

outcome::std_result<std::string>
ExclusiveC14NTransform::canonicalize_subtree(const std::string &xml, const std::string &element_id) const
{
  xml::XmlParser parser(logger);
  auto doc = parser.parse(xml);
  if (!doc)
    {
      return doc.error();
    }

  xmlNodePtr apex = doc.value().find_element_by_id(element_id);
  if (apex == nullptr)
    {
      logger->error("no element with id '{}'", element_id);
      return TransformErrc::ReferenceNotFound;
    }

  return doc.value().canonicalize(apex, inclusive_prefixes, mode.with_comments);
}

const std::vector<std::string> &
ExclusiveC14NTransform::get_inclusive_prefixes() const
{
  return inclusive_prefixes;
}
