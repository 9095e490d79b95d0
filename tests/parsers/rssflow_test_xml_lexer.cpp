#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "rssflow/parsers/xml_lexer.hpp"
#include <string>
#include <vector>

using namespace rssflow::parsers::xml;

namespace
{
/// Scan a complete document into (kind, name-or-text) pairs.
std::vector<std::pair<TokenKind, std::string>> scanAll(std::string_view doc)
{
  Lexer lexer;
  std::vector<std::pair<TokenKind, std::string>> out;
  while (true)
  {
    Token tok;
    auto r = lexer.scan(doc, true, tok);
    if (r.status == ScanStatus::End)
    {
      break;
    }
    REQUIRE(r.consumed > 0);
    if (r.status == ScanStatus::Token)
    {
      bool named = tok.kind == TokenKind::StartElement || tok.kind == TokenKind::EndElement ||
                   tok.kind == TokenKind::EmptyElement;
      out.emplace_back(tok.kind, std::string(named ? tok.name : tok.text));
    }
    else
    {
      out.emplace_back(TokenKind::Invalid, std::string(doc.substr(0, r.consumed)));
    }
    doc.remove_prefix(r.consumed);
  }
  return out;
}
} // namespace

TEST_CASE("XML Lexer - Basic tokens", "[xml][lexer][basic]")
{
  Lexer lexer;
  Token tok;

  SECTION("Start tag")
  {
    auto r = lexer.scan("<title>hi</title>", true, tok);
    REQUIRE(r.status == ScanStatus::Token);
    REQUIRE(r.consumed == 7);
    REQUIRE(tok.kind == TokenKind::StartElement);
    REQUIRE(tok.name == "title");
  }

  SECTION("Text stops at the next tag")
  {
    auto r = lexer.scan("hello<", false, tok);
    REQUIRE(r.status == ScanStatus::Token);
    REQUIRE(tok.kind == TokenKind::Text);
    REQUIRE(tok.text == "hello");
    REQUIRE(r.consumed == 5);
  }

  SECTION("End tag with trailing space")
  {
    auto r = lexer.scan("</item >", true, tok);
    REQUIRE(r.status == ScanStatus::Token);
    REQUIRE(tok.kind == TokenKind::EndElement);
    REQUIRE(tok.name == "item");
    REQUIRE(r.consumed == 8);
  }

  SECTION("Self-closing element with attributes")
  {
    auto r = lexer.scan("<enclosure url=\"http://x/a.mp3\" length='12'/>", true, tok);
    REQUIRE(r.status == ScanStatus::Token);
    REQUIRE(tok.kind == TokenKind::EmptyElement);
    REQUIRE(tok.selfClosing);
    REQUIRE(tok.attributes.size() == 2);
    REQUIRE(tok.attributes[0].name == "url");
    REQUIRE(tok.attributes[0].value == "http://x/a.mp3");
    REQUIRE(tok.attributes[1].name == "length");
    REQUIRE(tok.attributes[1].value == "12");
  }

  SECTION("CDATA keeps markup verbatim")
  {
    auto r = lexer.scan("<![CDATA[a <b>bold</b> & more]]>", true, tok);
    REQUIRE(r.status == ScanStatus::Token);
    REQUIRE(tok.kind == TokenKind::CData);
    REQUIRE(tok.text == "a <b>bold</b> & more");
  }

  SECTION("Declaration, comment, PI and DOCTYPE")
  {
    auto tokens = scanAll("<?xml version=\"1.0\"?><!-- c --><?style x?>"
                          "<!DOCTYPE rss [<!ENTITY e \"v\">]><rss/>");
    REQUIRE(tokens.size() == 5);
    REQUIRE(tokens[0].first == TokenKind::XmlDecl);
    REQUIRE(tokens[1].first == TokenKind::Comment);
    REQUIRE(tokens[1].second == " c ");
    REQUIRE(tokens[2].first == TokenKind::ProcessingInstruction);
    REQUIRE(tokens[3].first == TokenKind::Doctype);
    REQUIRE(tokens[4].first == TokenKind::EmptyElement);
    REQUIRE(tokens[4].second == "rss");
  }

  SECTION("Empty final window ends the stream")
  {
    REQUIRE(lexer.scan("", true, tok).status == ScanStatus::End);
    REQUIRE(lexer.scan("", false, tok).status == ScanStatus::NeedMore);
  }
}

TEST_CASE("XML Lexer - Incomplete windows", "[xml][lexer][incremental]")
{
  Lexer lexer;
  Token tok;
  const std::string doc = "<item a=\"1\"><title>T &amp; U</title><![CDATA[x]]><!-- c --></item>";

  SECTION("Every proper prefix of a token asks for more without consuming")
  {
    // Each prefix of the first token (the start tag) must be NeedMore
    for (std::size_t len = 1; len < 12; ++len)
    {
      auto r = lexer.scan(std::string_view(doc).substr(0, len), false, tok);
      INFO("prefix length " << len);
      REQUIRE(r.status == ScanStatus::NeedMore);
      REQUIRE(r.consumed == 0);
    }
    auto r = lexer.scan(std::string_view(doc).substr(0, 12), false, tok);
    REQUIRE(r.status == ScanStatus::Token);
    REQUIRE(r.consumed == 12);
  }

  SECTION("Partial declaration prefixes are not misread")
  {
    REQUIRE(lexer.scan("<!", false, tok).status == ScanStatus::NeedMore);
    REQUIRE(lexer.scan("<![CD", false, tok).status == ScanStatus::NeedMore);
    REQUIRE(lexer.scan("<!-", false, tok).status == ScanStatus::NeedMore);
    REQUIRE(lexer.scan("<!DOC", false, tok).status == ScanStatus::NeedMore);
  }

  SECTION("Text is not emitted until its end is known")
  {
    REQUIRE(lexer.scan("partial te", false, tok).status == ScanStatus::NeedMore);
    auto r = lexer.scan("partial te", true, tok);
    REQUIRE(r.status == ScanStatus::Token);
    REQUIRE(tok.text == "partial te");
  }

  SECTION("Unterminated tail in a final window is malformed")
  {
    auto r = lexer.scan("<title", true, tok);
    REQUIRE(r.status == ScanStatus::Malformed);
    REQUIRE(r.consumed == 6);
  }
}

TEST_CASE("XML Lexer - Malformed markup", "[xml][lexer][malformed]")
{
  Lexer lexer;
  Token tok;

  SECTION("Bad tag name skips through the closing bracket")
  {
    auto r = lexer.scan("<1bad>after", true, tok);
    REQUIRE(r.status == ScanStatus::Malformed);
    REQUIRE(r.consumed == 6);
  }

  SECTION("Broken tag stops before the next tag")
  {
    auto r = lexer.scan("<a b=c<next>", true, tok);
    REQUIRE(r.status == ScanStatus::Malformed);
    REQUIRE(r.consumed == 6);
  }

  SECTION("Unterminated attribute value stops at the next tag")
  {
    const std::string doc = "<title a=\"x>A</title><b>";
    auto r = lexer.scan(doc, false, tok);
    REQUIRE(r.status == ScanStatus::Malformed);
    REQUIRE(r.consumed == 13);
    r = lexer.scan(doc, true, tok);
    REQUIRE(r.status == ScanStatus::Malformed);
    REQUIRE(r.consumed == 13);
    REQUIRE(lexer.scan("<title a=\"x>A", false, tok).status == ScanStatus::NeedMore);
  }

  SECTION("Tags cut off at end of input are malformed")
  {
    auto r = lexer.scan("<a b=\"x", true, tok);
    REQUIRE(r.status == ScanStatus::Malformed);
    REQUIRE(r.consumed == 7);
    r = lexer.scan("</a", true, tok);
    REQUIRE(r.status == ScanStatus::Malformed);
    REQUIRE(r.consumed == 3);
  }

  SECTION("Unsupported declaration")
  {
    auto r = lexer.scan("<!ELEMENT x><a>", true, tok);
    REQUIRE(r.status == ScanStatus::Malformed);
    REQUIRE(r.consumed == 12);
  }

  SECTION("Token span limit")
  {
    Options opt;
    opt.maxTokenSpan = 16;
    Lexer small(opt);
    std::string big(64, 'x');
    auto r = small.scan(big, false, tok);
    REQUIRE(r.status == ScanStatus::Malformed);
    REQUIRE(r.consumed == big.size());
  }
}

TEST_CASE("XML Lexer - Entity decoding", "[xml][lexer][entities]")
{
  std::string out;

  SECTION("Predefined and numeric references")
  {
    REQUIRE(Lexer::decodeEntities("a &lt;b&gt; &amp; &quot;c&apos; &#65;&#x42;", out));
    REQUIRE(out == "a <b> & \"c' AB");
  }

  SECTION("Multi-byte character reference")
  {
    REQUIRE(Lexer::decodeEntities("&#x20AC;", out));
    REQUIRE(out == "\xE2\x82\xAC");
  }

  SECTION("Strict mode rejects unknown entities")
  {
    Error err;
    REQUIRE_FALSE(Lexer::decodeEntities("x &nbsp; y", out, false, &err));
    REQUIRE(err.offset == 2);
    REQUIRE(err.message == "unknown entity");
    REQUIRE_FALSE(Lexer::decodeEntities("Tom &amp Jerry", out));
    REQUIRE_FALSE(Lexer::decodeEntities("&#xD800;", out));
  }

  SECTION("Lenient mode keeps them verbatim")
  {
    REQUIRE(Lexer::decodeEntities("x &nbsp; &amp; y", out, true));
    REQUIRE(out == "x &nbsp; & y");
  }
}
