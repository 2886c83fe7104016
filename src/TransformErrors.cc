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

#include "infocard/TransformErrors.hh"

#include <string>

using namespace infocard;

namespace
{
  class TransformErrorCategory : public std::error_category
  {
  public:
    const char *name() const noexcept final
    {
      return "infocard.transform";
    }

    std::string message(int ev) const final
    {
      switch (static_cast<TransformErrc>(ev))
        {
        case TransformErrc::Success:
          return "success";
        case TransformErrc::MalformedInput:
          return "input is not well-formed XML";
        case TransformErrc::CapabilityUnavailable:
          return "XML canonicalization is not available in this environment";
        case TransformErrc::UnsupportedTransform:
          return "unsupported transform algorithm";
        case TransformErrc::SignatureNotFound:
          return "no XML signature found";
        case TransformErrc::ReferenceNotFound:
          return "referenced element not found";
        case TransformErrc::DocumentTooLarge:
          return "document too large";
        case TransformErrc::UnsupportedCanonicalization:
          return "unsupported canonicalization method";
        case TransformErrc::InvalidSignedInfo:
          return "invalid SignedInfo";
        case TransformErrc::DigestMismatch:
          return "digest mismatch";
        case TransformErrc::InternalError:
          return "internal error";
        }
      return "(unknown)";
    }
  };

  const TransformErrorCategory globalTransformErrorCategory{};
} // namespace

const std::error_category &
infocard::transform_error_category()
{
  return globalTransformErrorCategory;
}

std::error_code
infocard::make_error_code(TransformErrc ec)
{
  return std::error_code{static_cast<int>(ec), globalTransformErrorCategory};
}
