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

#ifndef INFOCARD_TRANSFORM_ERRORS_HH
#define INFOCARD_TRANSFORM_ERRORS_HH

#include <system_error>

namespace infocard
{
  enum class TransformErrc
  {
    Success = 0,
    // The input is not well-formed XML. A data fault.
    MalformedInput,
    // No usable canonicalization facility in this process. An environment
    // fault; it affects every call, not just this one.
    CapabilityUnavailable,
    UnsupportedTransform,
    SignatureNotFound,
    ReferenceNotFound,
    DocumentTooLarge,
    UnsupportedCanonicalization,
    InvalidSignedInfo,
    DigestMismatch,
    InternalError,
  };

  const std::error_category &transform_error_category();
  std::error_code make_error_code(TransformErrc ec);
} // namespace infocard

namespace std
{
  template<>
  struct is_error_code_enum<infocard::TransformErrc> : true_type
  {
  };
} // namespace std

#endif // INFOCARD_TRANSFORM_ERRORS_HH
