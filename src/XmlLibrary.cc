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

#include "XmlLibrary.hh"

#include <libxml/parser.h>
#include <libxml/parserInternals.h>
#include <xmlsec/xmlsec.h>

#include "infocard/TransformErrors.hh"

using namespace infocard::xml;

namespace
{
  thread_local std::size_t denied_loads = 0;

  // Signed content must be self-contained: external entities and DTDs are
  // never fetched.
  xmlParserInputPtr deny_external_entity(const char *url, const char * /*id*/, xmlParserCtxtPtr /*context*/)
  {
    spdlog::default_logger()->warn("refusing to load external entity {}", url != nullptr ? url : "(null)");
    denied_loads++;
    return nullptr;
  }
} // namespace

XmlLibrary &
XmlLibrary::instance()
{
  static XmlLibrary library;
  return library;
}

XmlLibrary::XmlLibrary()
{
  xmlInitParser();
  LIBXML_TEST_VERSION;

  c14n_available = xmlHasFeature(XML_WITH_C14N) != 0 && xmlHasFeature(XML_WITH_XPATH) != 0;
  if (!c14n_available)
    {
      logger->critical("libxml2 was built without C14N or XPath support");
    }

  if (xmlSecInit() < 0)
    {
      logger->critical("xmlsec initialization failed");
      return;
    }

  if (xmlSecCheckVersion() != 1)
    {
      logger->critical("loaded xmlsec library version is not compatible");
      xmlSecShutdown();
      return;
    }

  xmlSetExternalEntityLoader(deny_external_entity);
  xmlsec_initialized = true;
}

XmlLibrary::~XmlLibrary()
{
  if (xmlsec_initialized)
    {
      xmlSecShutdown();
    }
  xmlCleanupParser();
}

std::size_t
XmlLibrary::denied_entity_loads()
{
  return denied_loads;
}

outcome::std_result<void>
XmlLibrary::check() const
{
  if (!c14n_available || !xmlsec_initialized)
    {
      logger->critical("XML canonicalization is unavailable in this process");
      return infocard::TransformErrc::CapabilityUnavailable;
    }
  return outcome::success();
}
