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


#ifndef XML_DOCUMENT_HH
#define XML_DOCUMENT_HH

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/outcome/std_result.hpp>
#include <libxml/tree.h>

#include "utils/Logging.hh"

namespace outcome = boost::outcome_v2;

namespace infocard::xml
{
  class XmlParser;

  /*
   * Owning handle of a parsed libxml2 document.
   */
  class XmlDocument
  {
  public:
    ~XmlDocument() = default;

    XmlDocument(const XmlDocument &) = delete;
    XmlDocument &operator=(const XmlDocument &) = delete;
    XmlDocument(XmlDocument &&) noexcept = default;
    XmlDocument &operator=(XmlDocument &&) noexcept = default;

    xmlDocPtr get() const;
    xmlNodePtr root() const;

    // Exclusive XML canonicalization of the whole document (apex == nullptr)
    // or of the subtree rooted at apex.
    outcome::std_result<std::string> canonicalize(xmlNodePtr apex,
                                                  const std::vector<std::string> &inclusive_prefixes,
                                                  bool with_comments) const;

    outcome::std_result<std::string> serialize() const;

    // First element in document order carrying an Id, ID or AssertionID
    // attribute equal to id.
    xmlNodePtr find_element_by_id(const std::string &id) const;

    static std::optional<std::string> get_attribute(xmlNodePtr node, const xmlChar *name);
    static std::optional<std::string> get_id(xmlNodePtr node);
    static std::string get_content(xmlNodePtr node);

  private:
    friend class XmlParser;
    XmlDocument(xmlDocPtr doc, std::shared_ptr<spdlog::logger> logger);

  private:
    std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)> doc;
    std::shared_ptr<spdlog::logger> logger;
  };

  class XmlParser
  {
  public:
    explicit XmlParser(std::shared_ptr<spdlog::logger> logger);

    // Parses xml without network access or external entity loading. Entity
    // references are expanded, CDATA sections become text, and attribute
    // defaults from the internal subset are applied.
    outcome::std_result<XmlDocument> parse(const std::string &xml) const;

  private:
    std::shared_ptr<spdlog::logger> logger;
  };
} // namespace infocard::xml

#endif // XML_DOCUMENT_HH
