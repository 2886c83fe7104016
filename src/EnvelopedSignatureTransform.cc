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


#include "infocard/EnvelopedSignatureTransform.hh"

#include <xmlsec/strings.h>
#include <xmlsec/xmltree.h>

#include "XmlDocument.hh"

using namespace infocard;

outcome::std_result<std::string>
EnvelopedSignatureTransform::transform(const std::string &xml) const
{
  xml::XmlParser parser(logger);
  auto doc = parser.parse(xml);
  if (!doc)
    {
      return doc.error();
    }

  xmlNodePtr signature = xmlSecFindChild(doc.value().root(), xmlSecNodeSignature, xmlSecDSigNs);
  if (signature == nullptr)
    {
      logger->error("no enveloped Signature element below the document element");
      return TransformErrc::SignatureNotFound;
    }

  xmlUnlinkNode(signature);
  xmlFreeNode(signature);

  return doc.value().serialize();
}

std::string
EnvelopedSignatureTransform::algorithm() const
{
  return reinterpret_cast<const char *>(xmlSecHrefEnveloped);
}
