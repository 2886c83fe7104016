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


#include "infocard/ReferenceValidator.hh"

#include <utility>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <openssl/crypto.h>
#include <xmlsec/strings.h>
#include <xmlsec/xmltree.h>

#include "XmlDocument.hh"
#include "crypto/Digest.hh"
#include "utils/Base64.hh"
#include "utils/Logging.hh"

namespace
{
  const std::string EXC_C14N{reinterpret_cast<const char *>(xmlSecHrefExcC14N)};

  bool digests_equal(const std::string &expected, const std::string &computed)
  {
    return expected.size() == computed.size() && CRYPTO_memcmp(expected.data(), computed.data(), expected.size()) == 0;
  }
} // namespace

namespace infocard
{
  class ReferenceValidator::Impl
  {
  public:
    explicit Impl(TransformChain::Options options)
      : options_(options)
    {
    }

    outcome::std_result<SignedInfoResult> validate(const std::string &signed_xml) const
    {
      if (signed_xml.size() > options_.max_document_size)
        {
          logger_->error("document of {} bytes exceeds the limit of {} bytes", signed_xml.size(), options_.max_document_size);
          return outcome::failure(make_error_code(TransformErrc::DocumentTooLarge));
        }

      xml::XmlParser parser(logger_);
      auto doc = parser.parse(signed_xml);
      if (!doc)
        {
          return doc.error();
        }

      auto result = read_signed_info(doc.value());
      if (!result)
        {
          return result.error();
        }

      SignedInfoResult info = std::move(result.value());
      for (auto &reference: info.references)
        {
          auto target = check_reference_target(doc.value(), reference.uri);
          if (!target)
            {
              return target.error();
            }

          auto digest = compute_digest(signed_xml, reference);
          if (!digest)
            {
              return digest.error();
            }
          reference.computed_digest = std::move(digest.value());

          if (!digests_equal(reference.expected_digest, reference.computed_digest))
            {
              logger_->error("digest mismatch for reference '{}'", reference.uri);
              return outcome::failure(make_error_code(TransformErrc::DigestMismatch));
            }
          logger_->debug("reference '{}' digest verified", reference.uri);
        }

      return info;
    }

    outcome::std_result<SignedInfoResult> inspect(const std::string &signed_xml) const
    {
      xml::XmlParser parser(logger_);
      auto doc = parser.parse(signed_xml);
      if (!doc)
        {
          return doc.error();
        }
      return read_signed_info(doc.value());
    }

  private:
    outcome::std_result<SignedInfoResult> read_signed_info(const xml::XmlDocument &doc) const
    {
      xmlNodePtr signature_node = xmlSecFindChild(doc.root(), xmlSecNodeSignature, xmlSecDSigNs);
      if (signature_node == nullptr)
        {
          logger_->error("No XML digital signature found");
          return outcome::failure(make_error_code(TransformErrc::SignatureNotFound));
        }

      xmlNodePtr signed_info_node = xmlSecFindChild(signature_node, xmlSecNodeSignedInfo, xmlSecDSigNs);
      if (signed_info_node == nullptr)
        {
          logger_->error("Signature has no SignedInfo");
          return outcome::failure(make_error_code(TransformErrc::InvalidSignedInfo));
        }

      SignedInfoResult info;

      xmlNodePtr canon_method_node = xmlSecFindChild(signed_info_node, xmlSecNodeCanonicalizationMethod, xmlSecDSigNs);
      if (canon_method_node == nullptr)
        {
          logger_->error("SignedInfo has no CanonicalizationMethod");
          return outcome::failure(make_error_code(TransformErrc::InvalidSignedInfo));
        }
      info.canonicalization_method = xml::XmlDocument::get_attribute(canon_method_node, xmlSecAttrAlgorithm).value_or("");
      if (info.canonicalization_method != EXC_C14N)
        {
          logger_->error("Unsupported canonicalization method '{}'", info.canonicalization_method);
          return outcome::failure(make_error_code(TransformErrc::UnsupportedCanonicalization));
        }
      info.inclusive_prefixes = read_inclusive_prefixes(canon_method_node);

      xmlNodePtr sig_method_node = xmlSecFindChild(signed_info_node, xmlSecNodeSignatureMethod, xmlSecDSigNs);
      if (sig_method_node == nullptr)
        {
          logger_->error("SignedInfo has no SignatureMethod");
          return outcome::failure(make_error_code(TransformErrc::InvalidSignedInfo));
        }
      info.signature_method = xml::XmlDocument::get_attribute(sig_method_node, xmlSecAttrAlgorithm).value_or("");

      for (xmlNodePtr cur = xmlSecGetNextElementNode(signed_info_node->children); cur != nullptr;
           cur = xmlSecGetNextElementNode(cur->next))
        {
          if (xmlSecCheckNodeName(cur, xmlSecNodeReference, xmlSecDSigNs) == 0)
            {
              continue;
            }

          auto reference = read_reference(cur);
          if (!reference)
            {
              return reference.error();
            }
          info.references.push_back(std::move(reference.value()));
        }

      if (info.references.empty())
        {
          logger_->error("SignedInfo has no Reference");
          return outcome::failure(make_error_code(TransformErrc::InvalidSignedInfo));
        }

      auto canonical = doc.canonicalize(signed_info_node, info.inclusive_prefixes, false);
      if (!canonical)
        {
          return canonical.error();
        }
      info.canonical_signed_info = std::move(canonical.value());

      return info;
    }

    outcome::std_result<ReferenceInfo> read_reference(xmlNodePtr reference_node) const
    {
      ReferenceInfo reference;
      reference.uri = xml::XmlDocument::get_attribute(reference_node, xmlSecAttrURI).value_or("");

      xmlNodePtr transforms_node = xmlSecFindChild(reference_node, xmlSecNodeTransforms, xmlSecDSigNs);
      if (transforms_node != nullptr)
        {
          for (xmlNodePtr cur = xmlSecGetNextElementNode(transforms_node->children); cur != nullptr;
               cur = xmlSecGetNextElementNode(cur->next))
            {
              if (xmlSecCheckNodeName(cur, xmlSecNodeTransform, xmlSecDSigNs) == 0)
                {
                  continue;
                }

              auto algorithm = xml::XmlDocument::get_attribute(cur, xmlSecAttrAlgorithm);
              if (!algorithm)
                {
                  logger_->error("Transform without Algorithm in reference '{}'", reference.uri);
                  return outcome::failure(make_error_code(TransformErrc::InvalidSignedInfo));
                }
              reference.transforms.push_back(TransformInfo{*algorithm, read_inclusive_prefixes(cur)});
            }
        }

      xmlNodePtr digest_method_node = xmlSecFindChild(reference_node, xmlSecNodeDigestMethod, xmlSecDSigNs);
      if (digest_method_node == nullptr)
        {
          logger_->error("Reference '{}' has no DigestMethod", reference.uri);
          return outcome::failure(make_error_code(TransformErrc::InvalidSignedInfo));
        }
      reference.digest_method = xml::XmlDocument::get_attribute(digest_method_node, xmlSecAttrAlgorithm).value_or("");

      xmlNodePtr digest_value_node = xmlSecFindChild(reference_node, xmlSecNodeDigestValue, xmlSecDSigNs);
      if (digest_value_node == nullptr)
        {
          logger_->error("Reference '{}' has no DigestValue", reference.uri);
          return outcome::failure(make_error_code(TransformErrc::InvalidSignedInfo));
        }

      try
        {
          reference.expected_digest = utils::Base64::decode(xml::XmlDocument::get_content(digest_value_node));
        }
      catch (const utils::Base64Exception &e)
        {
          logger_->error("Invalid DigestValue in reference '{}': {}", reference.uri, e.what());
          return outcome::failure(make_error_code(TransformErrc::InvalidSignedInfo));
        }

      if (reference.expected_digest.empty())
        {
          logger_->error("Empty DigestValue in reference '{}'", reference.uri);
          return outcome::failure(make_error_code(TransformErrc::InvalidSignedInfo));
        }

      return reference;
    }

    static std::vector<std::string> read_inclusive_prefixes(xmlNodePtr node)
    {
      std::vector<std::string> prefixes;

      xmlNodePtr inclusive_node = xmlSecFindChild(node, xmlSecNodeInclusiveNamespaces, xmlSecNsExcC14N);
      if (inclusive_node == nullptr)
        {
          return prefixes;
        }

      auto list = xml::XmlDocument::get_attribute(inclusive_node, xmlSecAttrPrefixList);
      if (!list)
        {
          return prefixes;
        }

      std::string trimmed = boost::algorithm::trim_copy(*list);
      if (!trimmed.empty())
        {
          boost::algorithm::split(prefixes, trimmed, boost::algorithm::is_space(), boost::algorithm::token_compress_on);
        }
      return prefixes;
    }

    // Only same-document references to the whole document are supported.
    outcome::std_result<void> check_reference_target(const xml::XmlDocument &doc, const std::string &uri) const
    {
      if (uri.empty() || uri == "#xpointer(/)")
        {
          return outcome::success();
        }

      if (uri.front() == '#')
        {
          auto root_id = xml::XmlDocument::get_id(doc.root());
          if (root_id && *root_id == uri.substr(1))
            {
              return outcome::success();
            }
        }

      logger_->error("Reference '{}' does not identify the document element", uri);
      return outcome::failure(make_error_code(TransformErrc::ReferenceNotFound));
    }

    outcome::std_result<std::string> compute_digest(const std::string &signed_xml, const ReferenceInfo &reference) const
    {
      auto digest = crypto::Digest::create(reference.digest_method);
      if (!digest)
        {
          return digest.error();
        }

      TransformChain chain(options_);
      for (const auto &transform: reference.transforms)
        {
          auto rc = chain.add_transform(transform.algorithm, transform.inclusive_prefixes);
          if (!rc)
            {
              return rc.error();
            }
        }

      // Digests are always taken over exclusive canonical octets, also when
      // the Reference lists no transforms.
      if (chain.empty() || chain.get_transforms().back().algorithm != EXC_C14N)
        {
          auto rc = chain.add_transform(EXC_C14N);
          if (!rc)
            {
              return rc.error();
            }
        }

      auto transformed = chain.apply(signed_xml);
      if (!transformed)
        {
          return transformed.error();
        }

      return digest.value().compute(transformed.value());
    }

    TransformChain::Options options_;
    std::shared_ptr<spdlog::logger> logger_{utils::Logging::create("infocard:reference")};
  };

  ReferenceValidator::ReferenceValidator()
    : pimpl(std::make_unique<Impl>(TransformChain::Options{}))
  {
  }

  ReferenceValidator::ReferenceValidator(TransformChain::Options options)
    : pimpl(std::make_unique<Impl>(options))
  {
  }

  ReferenceValidator::~ReferenceValidator() = default;

  ReferenceValidator::ReferenceValidator(ReferenceValidator &&) noexcept = default;
  ReferenceValidator &ReferenceValidator::operator=(ReferenceValidator &&) noexcept = default;

  outcome::std_result<SignedInfoResult> ReferenceValidator::validate(const std::string &signed_xml) const
  {
    return pimpl->validate(signed_xml);
  }

  outcome::std_result<SignedInfoResult> ReferenceValidator::inspect(const std::string &signed_xml) const
  {
    return pimpl->inspect(signed_xml);
  }
} // namespace infocard
