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

#ifndef INFOCARD_TRANSFORM_HH
#define INFOCARD_TRANSFORM_HH

#include <string>

#include <boost/outcome/std_result.hpp>

#include "infocard/TransformErrors.hh"

namespace infocard
{
  namespace outcome = boost::outcome_v2;

  /*
   * One step of an XML-Signature transform chain: XML octets in, XML (or
   * octet-stream) octets out. Implementations hold no mutable state and may
   * be shared between threads.
   */
  class Transform
  {
  public:
    virtual ~Transform() = default;

    virtual outcome::std_result<std::string> transform(const std::string &xml) const = 0;

    // The XML-Signature Algorithm URI identifying this transform.
    virtual std::string algorithm() const = 0;
  };
} // namespace infocard

#endif // INFOCARD_TRANSFORM_HH
