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


#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <string>
#include <thread>
#include <vector>

#include "infocard/ExclusiveC14NTransform.hh"
#include "utils/TestUtils.hh"

using namespace infocard;

namespace
{
  std::string canonical(const std::string &xml, std::vector<std::string> prefixes = {})
  {
    ExclusiveC14NTransform c14n(std::move(prefixes));
    auto result = c14n.transform(xml);
    EXPECT_TRUE(result.has_value()) << xml;
    return result ? result.value() : std::string{};
  }
} // namespace

TEST(ExclusiveC14NTest, foo_bar_scenario)
{
  EXPECT_EQ(canonical(R"(<a:Foo xmlns:a="urn:x" xmlns:b="urn:y" b:id="1"><a:Bar/></a:Foo>)"),
            R"(<a:Foo xmlns:a="urn:x" xmlns:b="urn:y" b:id="1"><a:Bar></a:Bar></a:Foo>)");
}

TEST(ExclusiveC14NTest, deterministic)
{
  const std::string xml = read_test_data_file("infocard-assertion-unsigned.xml");

  ExclusiveC14NTransform c14n;
  auto first = c14n.transform(xml);
  auto second = c14n.transform(xml);
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(first.value(), second.value());
}

TEST(ExclusiveC14NTest, realistic_assertion)
{
  EXPECT_EQ(canonical(read_test_data_file("infocard-assertion-unsigned.xml")),
            read_test_data_file("infocard-assertion-unsigned.c14n"));
}

TEST(ExclusiveC14NTest, lexical_invariance)
{
  const std::string expected = R"(<a:Foo xmlns:a="urn:x" xmlns:b="urn:y" b:id="1"><a:Bar></a:Bar></a:Foo>)";

  EXPECT_EQ(canonical(R"(<a:Foo b:id='1'  xmlns:b="urn:y" xmlns:a="urn:x" ><a:Bar></a:Bar></a:Foo>)"), expected);
  EXPECT_EQ(canonical("<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<a:Foo\n  xmlns:a='urn:x'\n  xmlns:b='urn:y'\n  b:id = \"1\"><a:Bar\n/></a:Foo>"),
            expected);
  EXPECT_EQ(canonical(R"(<a:Foo xmlns:a="urn:x" b:id="1" xmlns:b="urn:y"><a:Bar xmlns:a="urn:x"/></a:Foo>)"), expected);
}

TEST(ExclusiveC14NTest, comments_removed)
{
  EXPECT_EQ(canonical("<!-- leading --><r><!-- inner --><x/>text<!-- more --></r><!-- trailing -->"), "<r><x></x>text</r>");
}

TEST(ExclusiveC14NTest, xml_declaration_removed)
{
  EXPECT_EQ(canonical("<?xml version=\"1.0\" encoding=\"utf-8\" standalone=\"yes\"?><r/>"), "<r></r>");
}

TEST(ExclusiveC14NTest, unused_namespaces_not_rendered)
{
  EXPECT_EQ(canonical(R"(<root xmlns:u="urn:unused" xmlns:p="urn:p"><p:child/></root>)"),
            R"(<root><p:child xmlns:p="urn:p"></p:child></root>)");
}

TEST(ExclusiveC14NTest, unused_default_namespace_not_rendered)
{
  EXPECT_EQ(canonical(R"(<x:root xmlns="urn:d" xmlns:x="urn:x"><x:child/></x:root>)"),
            R"(<x:root xmlns:x="urn:x"><x:child></x:child></x:root>)");
}

TEST(ExclusiveC14NTest, inclusive_prefix_list)
{
  EXPECT_EQ(canonical(R"(<root xmlns:u="urn:unused"><child/></root>)", {"u"}),
            R"(<root xmlns:u="urn:unused"><child></child></root>)");
}

TEST(ExclusiveC14NTest, inclusive_prefix_list_default_namespace)
{
  EXPECT_EQ(canonical(R"(<x:root xmlns="urn:d" xmlns:x="urn:x"><x:child/></x:root>)", {"#default"}),
            R"(<x:root xmlns="urn:d" xmlns:x="urn:x"><x:child></x:child></x:root>)");
}

TEST(ExclusiveC14NTest, inclusive_prefix_list_is_reported)
{
  ExclusiveC14NTransform c14n({"ic", "wsu"});
  EXPECT_THAT(c14n.get_inclusive_prefixes(), ::testing::ElementsAre("ic", "wsu"));
}

TEST(ExclusiveC14NTest, cdata_replaced_by_escaped_text)
{
  EXPECT_EQ(canonical("<r><![CDATA[a < b & c > d]]></r>"), "<r>a &lt; b &amp; c &gt; d</r>");
}

TEST(ExclusiveC14NTest, internal_entities_expanded_and_defaults_applied)
{
  EXPECT_EQ(canonical(R"(<!DOCTYPE r [<!ENTITY e "expanded"><!ATTLIST r a CDATA "dflt">]><r>&e;</r>)"),
            R"(<r a="dflt">expanded</r>)");
}

TEST(ExclusiveC14NTest, special_characters_escaped)
{
  EXPECT_EQ(canonical("<r b=\"&lt;&quot;&gt;\" a=\"x&#10;y&#9;z\">&#13;t</r>"),
            "<r a=\"x&#xA;y&#x9;z\" b=\"&lt;&quot;>\">&#xD;t</r>");
}

TEST(ExclusiveC14NTest, external_entity_not_loaded)
{
  const std::string xml = "<!DOCTYPE r [<!ENTITY ext SYSTEM \"file://" + find_test_data_file("external-entity.txt")
                          + "\">]><r>&ext;</r>";

  ExclusiveC14NTransform c14n;
  auto result = c14n.transform(xml);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), TransformErrc::MalformedInput);
}

TEST(ExclusiveC14NTest, external_entity_not_dropped_silently)
{
  ExclusiveC14NTransform c14n;
  auto result = c14n.transform(R"(<!DOCTYPE r [<!ENTITY ext SYSTEM "file:///etc/hostname">]><r>before&ext;after</r>)");
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), TransformErrc::MalformedInput);

  EXPECT_EQ(canonical("<r>before after</r>"), "<r>before after</r>");
}

TEST(ExclusiveC14NTest, invalid_encoding)
{
  ExclusiveC14NTransform c14n;
  auto result = c14n.transform("<r>a\xff\xfe</r>");
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), TransformErrc::MalformedInput);
}

TEST(ExclusiveC14NTest, invalid_character)
{
  ExclusiveC14NTransform c14n;
  auto result = c14n.transform("<r>a\x01</r>");
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), TransformErrc::MalformedInput);
}

TEST(ExclusiveC14NTest, line_endings_normalized)
{
  EXPECT_EQ(canonical("<r a=\"x\r\ny\">1\r\n2\r3</r>"), "<r a=\"x y\">1\n2\n3</r>");
}

TEST(ExclusiveC14NTest, idempotent)
{
  const std::vector<std::string> inputs = {
    R"(<a:Foo xmlns:a="urn:x" xmlns:b="urn:y" b:id="1"><a:Bar/></a:Foo>)",
    "<r><![CDATA[a < b]]><!-- c --></r>",
    R"(<root xmlns:u="urn:unused" xmlns:p="urn:p"><p:child/></root>)",
    read_test_data_file("infocard-assertion-unsigned.xml"),
  };

  for (const auto &xml: inputs)
    {
      std::string once = canonical(xml);
      EXPECT_EQ(canonical(once), once);
    }
}

TEST(ExclusiveC14NTest, malformed_input)
{
  ExclusiveC14NTransform c14n;

  auto result = c14n.transform("<a><b></a>");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), TransformErrc::MalformedInput);
  EXPECT_NE(result.error(), TransformErrc::CapabilityUnavailable);
}

TEST(ExclusiveC14NTest, empty_input)
{
  ExclusiveC14NTransform c14n;

  auto result = c14n.transform("");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), TransformErrc::MalformedInput);
}

TEST(ExclusiveC14NTest, undeclared_prefix)
{
  ExclusiveC14NTransform c14n;

  auto result = c14n.transform("<p:a/>");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), TransformErrc::MalformedInput);
}

TEST(ExclusiveC14NTest, trailing_garbage)
{
  ExclusiveC14NTransform c14n;

  auto result = c14n.transform("<a/><b/>");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), TransformErrc::MalformedInput);
}

TEST(ExclusiveC14NTest, canonicalize_equals_transform)
{
  const std::string xml = R"(<a:Foo xmlns:a="urn:x"><a:Bar/></a:Foo>)";

  ExclusiveC14NTransform c14n;
  auto canonicalized = c14n.canonicalize(xml);
  auto transformed = c14n.transform(xml);
  ASSERT_TRUE(canonicalized.has_value());
  ASSERT_TRUE(transformed.has_value());
  EXPECT_EQ(canonicalized.value(), transformed.value());
}

TEST(ExclusiveC14NTest, algorithm)
{
  ExclusiveC14NTransform c14n;
  EXPECT_EQ(c14n.algorithm(), "http://www.w3.org/2001/10/xml-exc-c14n#");
  EXPECT_TRUE(ExclusiveC14NTransform::mode.exclusive);
  EXPECT_FALSE(ExclusiveC14NTransform::mode.with_comments);
}

TEST(ExclusiveC14NTest, subtree)
{
  ExclusiveC14NTransform c14n;

  auto result = c14n.canonicalize_subtree(R"(<r xmlns:p="urn:p"><p:s Id="s1" xmlns:q="urn:q"><q:t/><u/></p:s></r>)", "s1");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result.value(), R"(<p:s xmlns:p="urn:p" Id="s1"><q:t xmlns:q="urn:q"></q:t><u></u></p:s>)");
}

TEST(ExclusiveC14NTest, subtree_by_assertion_id)
{
  ExclusiveC14NTransform c14n;

  auto result = c14n.canonicalize_subtree(
    R"(<env xmlns:saml="urn:oasis:names:tc:SAML:1.0:assertion"><saml:Assertion AssertionID="a-1"><!-- c --><saml:Subject/></saml:Assertion></env>)",
    "a-1");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result.value(),
            R"(<saml:Assertion xmlns:saml="urn:oasis:names:tc:SAML:1.0:assertion" AssertionID="a-1"><saml:Subject></saml:Subject></saml:Assertion>)");
}

TEST(ExclusiveC14NTest, subtree_unknown_id)
{
  ExclusiveC14NTransform c14n;

  auto result = c14n.canonicalize_subtree(R"(<r><s Id="s1"/></r>)", "s2");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), TransformErrc::ReferenceNotFound);
}

TEST(ExclusiveC14NTest, concurrent_use)
{
  const std::string xml = read_test_data_file("infocard-assertion-unsigned.xml");
  const std::string expected = read_test_data_file("infocard-assertion-unsigned.c14n");

  const ExclusiveC14NTransform c14n;
  std::vector<int> matches(8, 0);
  std::vector<std::thread> threads;

  for (std::size_t i = 0; i < matches.size(); i++)
    {
      threads.emplace_back([&, i]() {
        for (int n = 0; n < 25; n++)
          {
            auto result = c14n.transform(xml);
            if (result && result.value() == expected)
              {
                matches[i]++;
              }
          }
      });
    }

  for (auto &t: threads)
    {
      t.join();
    }

  for (int count: matches)
    {
      EXPECT_EQ(count, 25);
    }
}
