/**
 * pacs adapter - version 1.00
 * --------------------------------------------------------
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#include "pacs_sanitize.hpp"

#include <gtest/gtest.h>

using namespace pacs;

/**
 * @given the classic XXE payload
 * @when it is sanitized
 * @then both the DOCTYPE and the ENTITY declaration are gone and the body stays
 */
TEST(SanitizeTest, StripsDoctypeWithInternalSubset) {
  const std::string in =
      "<?xml version=\"1.0\"?>\n"
      "<!DOCTYPE foo [<!ENTITY xxe SYSTEM \"file:///etc/passwd\">]>\n"
      "<Document><MsgId>&xxe;</MsgId></Document>";
  const std::string out = sanitize_xml(in);

  EXPECT_EQ(out.find("<!DOCTYPE"), std::string::npos);
  EXPECT_EQ(out.find("<!ENTITY"), std::string::npos);
  EXPECT_EQ(out.find("]>"), std::string::npos);
  EXPECT_NE(out.find("<Document><MsgId>&xxe;</MsgId></Document>"), std::string::npos);
  EXPECT_TRUE(has_dangerous_declarations(in));
  EXPECT_FALSE(has_dangerous_declarations(out));
}

/**
 * @given declarations in mixed case, with quoted '>' and a stray ENTITY
 * @when they are sanitized
 * @then every one of them is removed
 */
TEST(SanitizeTest, StripsMixedCaseAndStrayEntities) {
  EXPECT_EQ(sanitize_xml("<!doctype x SYSTEM \"a>b.dtd\"><r/>"), "<r/>");
  EXPECT_EQ(sanitize_xml("<!EnTiTy e 'v>w'><r/>"), "<r/>");
  EXPECT_EQ(sanitize_xml("<!DOCTYPE r [<!ENTITY a \"]>\"><!ENTITY b \"x\">]><r/>"), "<r/>");
}

/**
 * @given comments and CDATA that mention DOCTYPE
 * @when they are sanitized
 * @then they are copied through verbatim
 */
TEST(SanitizeTest, KeepsCommentsAndCdata) {
  const std::string in = "<r><!-- <!DOCTYPE x> --><![CDATA[<!ENTITY y \"z\">]]></r>";
  EXPECT_EQ(sanitize_xml(in), in);
}

/**
 * @given a DOCTYPE that never closes
 * @when it is sanitized
 * @then the rest of the input is dropped
 */
TEST(SanitizeTest, UnterminatedDoctypeSwallowsRest) {
  EXPECT_EQ(sanitize_xml("<a/><!DOCTYPE x [ <r/>"), "<a/>");
}

/**
 * @given input without declarations
 * @when it is sanitized
 * @then it is unchanged
 */
TEST(SanitizeTest, LeavesPlainXmlAlone) {
  const std::string in = "<?xml version=\"1.0\"?><a b=\"<!x>\">1 &lt; 2</a>";
  EXPECT_EQ(sanitize_xml(in), in);
  EXPECT_EQ(sanitize_xml(""), "");
}

/**
 * @given valid and invalid UTF-8 sequences
 * @then only the valid ones pass
 */
TEST(SanitizeTest, Utf8Validation) {
  EXPECT_TRUE(is_valid_utf8("plain ascii"));
  EXPECT_TRUE(is_valid_utf8("M\xC3\xBCller \xE2\x82\xAC \xF0\x9F\x92\xB6"));
  EXPECT_FALSE(is_valid_utf8("\xC3\x28"));           // bad continuation
  EXPECT_FALSE(is_valid_utf8("\xC0\xAF"));           // overlong '/'
  EXPECT_FALSE(is_valid_utf8("\xED\xA0\x80"));       // surrogate
  EXPECT_FALSE(is_valid_utf8("\xF4\x90\x80\x80"));   // above U+10FFFF
  EXPECT_FALSE(is_valid_utf8("\xE2\x82"));           // truncated
}

TEST(SanitizeTest, Blank) {
  EXPECT_TRUE(is_blank(""));
  EXPECT_TRUE(is_blank(" \r\n\t"));
  EXPECT_FALSE(is_blank(" x "));
}

/**
 * @given DOCTYPE and ENTITY text inside a comment or CDATA only
 * @then it is not reported as a declaration, but a real one still is
 */
TEST(SanitizeTest, DetectionIgnoresCommentsAndCdata) {
  EXPECT_FALSE(has_dangerous_declarations("<r><!-- <!DOCTYPE x> --></r>"));
  EXPECT_FALSE(has_dangerous_declarations("<r><![CDATA[<!ENTITY y \"z\">]]></r>"));
  EXPECT_FALSE(has_dangerous_declarations("<r><!-- unterminated <!DOCTYPE x>"));
  EXPECT_TRUE(has_dangerous_declarations("<!-- c --><!doctype r><r/>"));
}
