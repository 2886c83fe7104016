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


#include "XmlDocument.hh"

#include <array>
#include <limits>
#include <utility>

#include <boost/algorithm/string/trim.hpp>
#include <libxml/c14n.h>
#include <libxml/parser.h>
#include <libxml/xmlerror.h>
#include <libxml/xpath.h>

#include "XmlLibrary.hh"
#include "infocard/TransformErrors.hh"
#include "utils/ScopedPtr.hh"

using namespace infocard::xml;
using infocard::TransformErrc;
using infocard::utils::make_scoped;

namespace
{
  constexpr int PARSE_OPTIONS = XML_PARSE_NOENT | XML_PARSE_DTDATTR | XML_PARSE_NONET | XML_PARSE_NOCDATA
                                | XML_PARSE_NOERROR | XML_PARSE_NOWARNING;

  // All nodes of the subtree rooted at the context node, its attributes and
  // the namespace nodes in scope.
  const auto *const SUBTREE_NODES = reinterpret_cast<const xmlChar *>("(.//. | .//@* | .//namespace::*)");

  constexpr std::array<const char *, 3> ID_ATTRIBUTES{"Id", "ID", "AssertionID"};

  /*
   * Collects libxml2 errors raised on the current thread while in scope.
   */
  class XmlErrorCapture
  {
  public:
    XmlErrorCapture()
      : previous_handler(xmlStructuredError)
      , previous_context(xmlStructuredErrorContext)
    {
      xmlSetStructuredErrorFunc(this, &XmlErrorCapture::on_error);
    }

    ~XmlErrorCapture()
    {
      xmlSetStructuredErrorFunc(previous_context, previous_handler);
    }

    XmlErrorCapture(const XmlErrorCapture &) = delete;
    XmlErrorCapture &operator=(const XmlErrorCapture &) = delete;
    XmlErrorCapture(XmlErrorCapture &&) = delete;
    XmlErrorCapture &operator=(XmlErrorCapture &&) = delete;

    const std::string &last_message() const
    {
      return message;
    }

  private:
    static void on_error(void *context, xmlErrorPtr error)
    {
      auto *self = static_cast<XmlErrorCapture *>(context);
      if (self != nullptr && error != nullptr && error->message != nullptr)
        {
          self->message = boost::algorithm::trim_right_copy(std::string(error->message));
        }
    }

  private:
    xmlStructuredErrorFunc previous_handler;
    void *previous_context;
    std::string message;
  };
} // namespace

XmlDocument::XmlDocument(xmlDocPtr doc, std::shared_ptr<spdlog::logger> logger)
  : doc(doc, xmlFreeDoc)
  , logger(std::move(logger))
{
}

xmlDocPtr
XmlDocument::get() const
{
  return doc.get();
}

xmlNodePtr
XmlDocument::root() const
{
  return xmlDocGetRootElement(doc.get());
}

outcome::std_result<std::string>
XmlDocument::canonicalize(xmlNodePtr apex, const std::vector<std::string> &inclusive_prefixes, bool with_comments) const
{
  XmlErrorCapture errors;

  std::vector<xmlChar *> prefix_list;
  prefix_list.reserve(inclusive_prefixes.size() + 1);
  for (const auto &prefix: inclusive_prefixes)
    {
      prefix_list.push_back(const_cast<xmlChar *>(reinterpret_cast<const xmlChar *>(prefix.c_str())));
    }
  prefix_list.push_back(nullptr);

  std::unique_ptr<xmlXPathContext, decltype(&xmlXPathFreeContext)> context{nullptr, xmlXPathFreeContext};
  std::unique_ptr<xmlXPathObject, decltype(&xmlXPathFreeObject)> selection{nullptr, xmlXPathFreeObject};
  xmlNodeSetPtr nodes = nullptr;

  if (apex != nullptr)
    {
      context.reset(xmlXPathNewContext(doc.get()));
      if (!context)
        {
          logger->error("failed to create XPath context");
          return TransformErrc::InternalError;
        }
      context->node = apex;

      selection.reset(xmlXPathEvalExpression(SUBTREE_NODES, context.get()));
      if (!selection || xmlXPathNodeSetIsEmpty(selection->nodesetval))
        {
          logger->error("failed to select subtree for canonicalization: {}", errors.last_message());
          return TransformErrc::InternalError;
        }
      nodes = selection->nodesetval;
    }

  xmlChar *output = nullptr;
  int size = xmlC14NDocDumpMemory(doc.get(),
                                  nodes,
                                  XML_C14N_EXCLUSIVE_1_0,
                                  inclusive_prefixes.empty() ? nullptr : prefix_list.data(),
                                  with_comments ? 1 : 0,
                                  &output);
  auto scoped_output = make_scoped(output, [](xmlChar *p) { xmlFree(p); });

  if (size < 0)
    {
      logger->error("exclusive canonicalization failed: {}", errors.last_message());
      return TransformErrc::MalformedInput;
    }

  if (output == nullptr)
    {
      return std::string{};
    }
  return std::string(reinterpret_cast<const char *>(output), static_cast<std::size_t>(size));
}

outcome::std_result<std::string>
XmlDocument::serialize() const
{
  xmlChar *buffer = nullptr;
  int size = 0;
  xmlDocDumpMemoryEnc(doc.get(), &buffer, &size, "UTF-8");
  auto scoped_buffer = make_scoped(buffer, [](xmlChar *p) { xmlFree(p); });

  if (buffer == nullptr || size < 0)
    {
      logger->error("failed to serialize XML document");
      return TransformErrc::InternalError;
    }
  return std::string(reinterpret_cast<const char *>(buffer), static_cast<std::size_t>(size));
}

xmlNodePtr
XmlDocument::find_element_by_id(const std::string &id) const
{
  std::vector<xmlNodePtr> pending;
  if (xmlNodePtr top = root(); top != nullptr)
    {
      pending.push_back(top);
    }

  while (!pending.empty())
    {
      xmlNodePtr node = pending.back();
      pending.pop_back();

      if (get_id(node) == id)
        {
          return node;
        }

      for (xmlNodePtr child = node->last; child != nullptr; child = child->prev)
        {
          if (child->type == XML_ELEMENT_NODE)
            {
              pending.push_back(child);
            }
        }
    }
  return nullptr;
}

std::optional<std::string>
XmlDocument::get_attribute(xmlNodePtr node, const xmlChar *name)
{
  xmlChar *value = xmlGetNoNsProp(node, name);
  if (value == nullptr)
    {
      return {};
    }
  std::string ret(reinterpret_cast<const char *>(value));
  xmlFree(value);
  return ret;
}

std::optional<std::string>
XmlDocument::get_id(xmlNodePtr node)
{
  for (const char *name: ID_ATTRIBUTES)
    {
      if (auto value = get_attribute(node, BAD_CAST name); value)
        {
          return value;
        }
    }
  return {};
}

std::string
XmlDocument::get_content(xmlNodePtr node)
{
  xmlChar *content = xmlNodeGetContent(node);
  if (content == nullptr)
    {
      return {};
    }
  std::string ret(reinterpret_cast<const char *>(content));
  xmlFree(content);
  return ret;
}

XmlParser::XmlParser(std::shared_ptr<spdlog::logger> logger)
  : logger(std::move(logger))
{
}

outcome::std_result<XmlDocument>
XmlParser::parse(const std::string &xml) const
{
  if (auto rc = XmlLibrary::instance().check(); !rc)
    {
      return rc.error();
    }

  if (xml.empty())
    {
      logger->error("empty XML input");
      return TransformErrc::MalformedInput;
    }

  if (xml.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
    {
      logger->error("XML input of {} bytes cannot be parsed", xml.size());
      return TransformErrc::DocumentTooLarge;
    }

  XmlErrorCapture errors;
  const std::size_t denied_before = XmlLibrary::denied_entity_loads();

  auto parser = make_scoped(xmlNewParserCtxt(), xmlFreeParserCtxt);
  if (!parser)
    {
      logger->error("failed to create XML parser context");
      return TransformErrc::InternalError;
    }

  auto doc = make_scoped(
    xmlCtxtReadMemory(parser.get(), xml.data(), static_cast<int>(xml.size()), nullptr, nullptr, PARSE_OPTIONS),
    xmlFreeDoc);

  if (!doc || parser->wellFormed == 0 || parser->nsWellFormed == 0)
    {
      const xmlError *error = xmlCtxtGetLastError(parser.get());
      if (error != nullptr && error->message != nullptr)
        {
          logger->error("malformed XML input at line {}: {}",
                        error->line,
                        boost::algorithm::trim_right_copy(std::string(error->message)));
        }
      else
        {
          logger->error("malformed XML input: {}", errors.last_message());
        }
      return TransformErrc::MalformedInput;
    }

  if (XmlLibrary::denied_entity_loads() != denied_before)
    {
      logger->error("XML input depends on external content that was not loaded");
      return TransformErrc::MalformedInput;
    }

  if (xmlDocGetRootElement(doc.get()) == nullptr)
    {
      logger->error("XML input has no document element");
      return TransformErrc::MalformedInput;
    }

  return XmlDocument(doc.release(), logger);
}
