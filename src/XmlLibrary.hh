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

#ifndef XML_LIBRARY_HH
#define XML_LIBRARY_HH

#include <cstddef>
#include <memory>

#include <boost/outcome/std_result.hpp>

#include "utils/Logging.hh"

namespace outcome = boost::outcome_v2;

namespace infocard::xml
{
  /*
   * Process wide libxml2/xmlsec initialisation. Created on first use and
   * torn down at exit.
   */
  class XmlLibrary
  {
  public:
    static XmlLibrary &instance();

    ~XmlLibrary();

    XmlLibrary(const XmlLibrary &) = delete;
    XmlLibrary &operator=(const XmlLibrary &) = delete;
    XmlLibrary(XmlLibrary &&) = delete;
    XmlLibrary &operator=(XmlLibrary &&) = delete;

    // Fails with TransformErrc::CapabilityUnavailable when canonicalization
    // cannot be performed in this process.
    outcome::std_result<void> check() const;

    // Number of external entity loads refused on the calling thread.
    static std::size_t denied_entity_loads();

  private:
    XmlLibrary();

  private:
    bool c14n_available{false};
    bool xmlsec_initialized{false};
    std::shared_ptr<spdlog::logger> logger{infocard::utils::Logging::create("infocard:xml")};
  };
} // namespace infocard::xml

#endif // XML_LIBRARY_HH
