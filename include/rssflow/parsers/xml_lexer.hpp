#pragma once
/// \file xml_lexer.hpp
/// \brief Non-validating, restartable XML lexer for C++17.
///
/// The lexer scans one token at the start of a byte window and reports how
/// many bytes it covers. It never keeps pointers into the window between
/// calls, so callers may grow, compact or refill their buffer freely and scan
/// again from the same logical position. When the window ends inside a token
/// the lexer answers NeedMore instead of failing; once the caller marks the
/// window as final, an unterminated tail is reported as Malformed.
///
/// Example:
/// \code
/// rssflow::parsers::xml::Lexer lexer;
/// rssflow::parsers::xml::Token tok;
/// auto r = lexer.scan("<title>hi</title>", true, tok);
/// // r.status == ScanStatus::Token, tok.kind == TokenKind::StartElement,
/// // tok.name == "title", r.consumed == 7
/// \endcode
///
/// SPDX-License-Identifier: MPL-2.0

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace rssflow
{
namespace parsers
{
namespace xml
{
/// \brief Token kinds produced by the lexer.
enum class TokenKind
{
  Invalid,
  XmlDecl,
  Doctype,
  StartElement,
  EndElement,
  EmptyElement,
  Text,
  CData,
  Comment,
  ProcessingInstruction
};

/// \brief Outcome of a single scan() call.
enum class ScanStatus
{
  Token,     ///< A complete token was recognised
  NeedMore,  ///< The window ends inside a token; nothing consumed
  Malformed, ///< An unusable run was found; skip `consumed` bytes
  End        ///< Final window fully consumed
};

/// \brief Lexer limits.
struct Options
{
  std::size_t maxNameLength{1024};     ///< Max length of element or attribute names
  std::size_t maxAttrsPerElement{256}; ///< Max attributes per element
  std::size_t maxTokenSpan{1u << 20};  ///< Max bytes a single token may span (1 MiB)
};

/// \brief Attribute view (name/value). Values are raw slices of the window.
struct Attribute
{
  std::string_view name;
  std::string_view value;
};

/// \brief Token recognised by the lexer. Views point into the scanned window
/// and are valid until the caller modifies it.
struct Token
{
  TokenKind kind{TokenKind::Invalid};
  std::string_view name;             ///< Element name or PI target
  std::string_view text;             ///< Raw text for Text/CData/Comment/PI/Doctype
  std::vector<Attribute> attributes; ///< For StartElement/EmptyElement
  bool selfClosing{false};
};

struct ScanResult
{
  ScanStatus status{ScanStatus::NeedMore};
  std::size_t consumed{0};
  const char *reason{""}; ///< Static description for Malformed results
};

/// \brief Error details for entity decoding failures.
struct Error
{
  std::size_t offset{0};
  std::string message;
};

class Lexer
{
public:
  explicit Lexer(const Options &opt = Options{}) : _opt(opt) {}

  const Options &options() const { return _opt; }

  /// \brief Scan one token at the start of \p window.
  /// \param final true when no further bytes will follow the window
  ScanResult scan(std::string_view window, bool final, Token &out) const
  {
    out = Token{};
    if (window.empty())
    {
      return {final ? ScanStatus::End : ScanStatus::NeedMore, 0, ""};
    }
    if (window[0] != '<')
    {
      return scanText(window, final, out);
    }
    if (window.size() < 2)
    {
      return incomplete(window, final, "unexpected end after '<'");
    }
    switch (window[1])
    {
    case '?':
      return scanProcessingInstruction(window, final, out);
    case '!':
      return scanDeclaration(window, final, out);
    case '/':
      return scanEndTag(window, final, out);
    default:
      return scanStartTag(window, final, out);
    }
  }

  /// \brief Decode predefined entities and numeric char refs in a slice.
  ///
  /// In lenient mode unknown or unterminated references are copied verbatim
  /// and decoding never fails.
  static bool decodeEntities(std::string_view in, std::string &out, bool lenient = false,
                             Error *err = nullptr)
  {
    out.clear();
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size();)
    {
      char ch = in[i];
      if (ch != '&')
      {
        out.push_back(ch);
        ++i;
        continue;
      }
      std::size_t semi = in.find(';', i + 1);
      const char *problem = nullptr;
      if (semi == std::string_view::npos)
      {
        problem = "unterminated entity";
      }
      else
      {
        std::string_view ent = in.substr(i + 1, semi - (i + 1));
        if (ent == "lt")
          out.push_back('<');
        else if (ent == "gt")
          out.push_back('>');
        else if (ent == "amp")
          out.push_back('&');
        else if (ent == "apos")
          out.push_back('\'');
        else if (ent == "quot")
          out.push_back('"');
        else if (!ent.empty() && ent[0] == '#')
        {
          if (!appendCharRef(ent, out))
          {
            problem = "invalid character reference";
          }
        }
        else
        {
          problem = "unknown entity";
        }
      }
      if (problem)
      {
        if (!lenient)
        {
          if (err)
          {
            *err = {i, problem};
          }
          return false;
        }
        out.push_back('&');
        ++i;
        continue;
      }
      i = semi + 1;
    }
    return true;
  }

private:
  enum class Step
  {
    Ok,
    Short, ///< Ran off the end of the window
    Bad
  };

  static bool isSpace(char ch) { return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n'; }

  static bool isNameStart(char ch)
  {
    return (ch == ':' || ch == '_' || (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') ||
            static_cast<unsigned char>(ch) >= 0x80);
  }

  static bool isNameChar(char ch)
  {
    return isNameStart(ch) || (ch == '-' || ch == '.' || (ch >= '0' && ch <= '9'));
  }

  static char lower(char ch) { return (ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch + 32) : ch; }

  static bool equalsNoCase(std::string_view a, std::string_view b)
  {
    if (a.size() != b.size())
    {
      return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i)
    {
      if (lower(a[i]) != lower(b[i]))
      {
        return false;
      }
    }
    return true;
  }

  /// Reads a name starting at pos. A name touching the end of the window may
  /// continue in the next chunk, so it is reported as Short.
  Step readName(std::string_view w, std::size_t &pos, std::string_view &name) const
  {
    std::size_t start = pos;
    if (pos >= w.size())
    {
      return Step::Short;
    }
    if (!isNameStart(w[pos]))
    {
      return Step::Bad;
    }
    while (pos < w.size() && isNameChar(w[pos]))
    {
      ++pos;
    }
    if (pos >= w.size())
    {
      return Step::Short;
    }
    if (pos - start > _opt.maxNameLength)
    {
      return Step::Bad;
    }
    name = w.substr(start, pos - start);
    return Step::Ok;
  }

  static Step skipSpaces(std::string_view w, std::size_t &pos)
  {
    while (pos < w.size() && isSpace(w[pos]))
    {
      ++pos;
    }
    return pos < w.size() ? Step::Ok : Step::Short;
  }

  ScanResult incomplete(std::string_view w, bool final, const char *reason) const
  {
    if (final || w.size() > _opt.maxTokenSpan)
    {
      return {ScanStatus::Malformed, w.size(), reason};
    }
    return {ScanStatus::NeedMore, 0, ""};
  }

  /// Like incomplete(), but a tag cut off at end of input is skipped only up
  /// to the next '<' so the markup after it is still scanned.
  ScanResult incompleteTag(std::string_view w, bool final, const char *reason) const
  {
    if (!final && w.size() <= _opt.maxTokenSpan)
    {
      return {ScanStatus::NeedMore, 0, ""};
    }
    std::size_t next = w.find('<', 1);
    return {ScanStatus::Malformed, next == std::string_view::npos ? w.size() : next, reason};
  }

  /// Skip one broken tag: through the next '>' or up to the next '<',
  /// whichever comes first.
  ScanResult malformedTag(std::string_view w, bool final, const char *reason) const
  {
    std::size_t pos = w.find_first_of("<>", 1);
    if (pos == std::string_view::npos)
    {
      return incomplete(w, final, reason);
    }
    return {ScanStatus::Malformed, w[pos] == '>' ? pos + 1 : pos, reason};
  }

  ScanResult produced(std::size_t consumed) const
  {
    return {ScanStatus::Token, consumed, ""};
  }

  ScanResult scanText(std::string_view w, bool final, Token &out) const
  {
    std::size_t pos = w.find('<');
    if (pos == std::string_view::npos)
    {
      if (!final)
      {
        return incomplete(w, final, "text span too large");
      }
      pos = w.size();
    }
    if (pos > _opt.maxTokenSpan)
    {
      return {ScanStatus::Malformed, pos, "text span too large"};
    }
    out.kind = TokenKind::Text;
    out.text = w.substr(0, pos);
    return produced(pos);
  }

  ScanResult scanProcessingInstruction(std::string_view w, bool final, Token &out) const
  {
    std::size_t close = w.find("?>", 2);
    if (close == std::string_view::npos)
    {
      return incomplete(w, final, "unterminated processing instruction");
    }
    std::size_t pos = 2;
    if (pos < close && isNameStart(w[pos]))
    {
      while (pos < close && isNameChar(w[pos]))
      {
        ++pos;
      }
    }
    std::string_view target = w.substr(2, pos - 2);
    if (target.empty() || target.size() > _opt.maxNameLength)
    {
      return {ScanStatus::Malformed, close + 2, "invalid processing instruction target"};
    }
    out.kind = equalsNoCase(target, "xml") ? TokenKind::XmlDecl : TokenKind::ProcessingInstruction;
    out.name = target;
    out.text = w.substr(pos, close - pos);
    return produced(close + 2);
  }

  ScanResult scanDeclaration(std::string_view w, bool final, Token &out) const
  {
    static constexpr std::string_view kComment = "<!--";
    static constexpr std::string_view kCData = "<![CDATA[";
    static constexpr std::string_view kDoctype = "<!DOCTYPE";

    auto startsWith = [&w](std::string_view prefix, bool noCase)
    {
      std::string_view head = w.substr(0, prefix.size());
      return noCase ? equalsNoCase(head, prefix.substr(0, head.size()))
                    : head == prefix.substr(0, head.size());
    };

    if (startsWith(kComment, false))
    {
      if (w.size() < kComment.size())
      {
        return incomplete(w, final, "unterminated comment");
      }
      std::size_t close = w.find("-->", kComment.size());
      if (close == std::string_view::npos)
      {
        return incomplete(w, final, "unterminated comment");
      }
      out.kind = TokenKind::Comment;
      out.text = w.substr(kComment.size(), close - kComment.size());
      return produced(close + 3);
    }
    if (startsWith(kCData, false))
    {
      if (w.size() < kCData.size())
      {
        return incomplete(w, final, "unterminated CDATA");
      }
      std::size_t close = w.find("]]>", kCData.size());
      if (close == std::string_view::npos)
      {
        return incomplete(w, final, "unterminated CDATA");
      }
      if (close - kCData.size() > _opt.maxTokenSpan)
      {
        return {ScanStatus::Malformed, close + 3, "CDATA section too large"};
      }
      out.kind = TokenKind::CData;
      out.text = w.substr(kCData.size(), close - kCData.size());
      return produced(close + 3);
    }
    if (startsWith(kDoctype, true))
    {
      if (w.size() < kDoctype.size())
      {
        return incomplete(w, final, "unterminated doctype");
      }
      // Internal subset may contain '>' inside brackets
      int bracket = 0;
      for (std::size_t pos = kDoctype.size(); pos < w.size(); ++pos)
      {
        char ch = w[pos];
        if (ch == '[')
        {
          ++bracket;
        }
        else if (ch == ']' && bracket > 0)
        {
          --bracket;
        }
        else if (ch == '>' && bracket == 0)
        {
          out.kind = TokenKind::Doctype;
          out.text = w.substr(kDoctype.size(), pos - kDoctype.size());
          return produced(pos + 1);
        }
      }
      return incomplete(w, final, "unterminated doctype");
    }
    return malformedTag(w, final, "unsupported markup declaration");
  }

  ScanResult scanEndTag(std::string_view w, bool final, Token &out) const
  {
    std::size_t pos = 2;
    std::string_view name;
    switch (readName(w, pos, name))
    {
    case Step::Short:
      return incompleteTag(w, final, "unterminated end tag");
    case Step::Bad:
      return malformedTag(w, final, "invalid end tag name");
    case Step::Ok:
      break;
    }
    if (skipSpaces(w, pos) == Step::Short)
    {
      return incompleteTag(w, final, "unterminated end tag");
    }
    if (w[pos] != '>')
    {
      return malformedTag(w, final, "expected '>' after end tag name");
    }
    out.kind = TokenKind::EndElement;
    out.name = name;
    return produced(pos + 1);
  }

  ScanResult scanStartTag(std::string_view w, bool final, Token &out) const
  {
    std::size_t pos = 1;
    std::string_view name;
    switch (readName(w, pos, name))
    {
    case Step::Short:
      return incompleteTag(w, final, "unterminated start tag");
    case Step::Bad:
      return malformedTag(w, final, "invalid start tag name");
    case Step::Ok:
      break;
    }
    out.kind = TokenKind::StartElement;
    out.name = name;

    while (true)
    {
      if (skipSpaces(w, pos) == Step::Short)
      {
        return incompleteTag(w, final, "unterminated start tag");
      }
      char ch = w[pos];
      if (ch == '>')
      {
        return produced(pos + 1);
      }
      if (ch == '/')
      {
        if (pos + 1 >= w.size())
        {
          return incompleteTag(w, final, "unterminated start tag");
        }
        if (w[pos + 1] != '>')
        {
          return malformedTag(w, final, "expected '>' after '/'");
        }
        out.kind = TokenKind::EmptyElement;
        out.selfClosing = true;
        return produced(pos + 2);
      }

      Attribute attr;
      switch (readName(w, pos, attr.name))
      {
      case Step::Short:
        return incompleteTag(w, final, "unterminated start tag");
      case Step::Bad:
        return malformedTag(w, final, "invalid attribute name");
      case Step::Ok:
        break;
      }
      if (skipSpaces(w, pos) == Step::Short)
      {
        return incompleteTag(w, final, "unterminated start tag");
      }
      if (w[pos] != '=')
      {
        return malformedTag(w, final, "expected '=' after attribute name");
      }
      ++pos;
      if (skipSpaces(w, pos) == Step::Short)
      {
        return incompleteTag(w, final, "unterminated start tag");
      }
      char quote = w[pos];
      if (quote != '"' && quote != '\'')
      {
        return malformedTag(w, final, "expected quoted attribute value");
      }
      std::size_t close = w.find(quote, pos + 1);
      // '<' cannot appear in an attribute value; resync there
      std::size_t lt = w.find('<', pos + 1);
      if (lt != std::string_view::npos && (close == std::string_view::npos || lt < close))
      {
        return {ScanStatus::Malformed, lt, "unterminated attribute value"};
      }
      if (close == std::string_view::npos)
      {
        return incompleteTag(w, final, "unterminated attribute value");
      }
      attr.value = w.substr(pos + 1, close - pos - 1);
      pos = close + 1;
      out.attributes.push_back(attr);
      if (out.attributes.size() > _opt.maxAttrsPerElement)
      {
        return malformedTag(w, final, "too many attributes");
      }
    }
  }

  // Append a numeric char ref (e.g. "#10" or "#x1F4A9") to out as UTF-8.
  static bool appendCharRef(std::string_view entBody, std::string &out)
  {
    if (entBody.size() < 2)
    {
      return false;
    }
    uint32_t code = 0;
    bool hex = (entBody[1] == 'x' || entBody[1] == 'X');
    std::size_t first = hex ? 2 : 1;
    if (first >= entBody.size() || entBody.size() - first > 8)
    {
      return false;
    }
    for (std::size_t i = first; i < entBody.size(); ++i)
    {
      char c = entBody[i];
      uint32_t v = 0;
      if (c >= '0' && c <= '9')
      {
        v = static_cast<uint32_t>(c - '0');
      }
      else if (hex && c >= 'a' && c <= 'f')
      {
        v = static_cast<uint32_t>(c - 'a' + 10);
      }
      else if (hex && c >= 'A' && c <= 'F')
      {
        v = static_cast<uint32_t>(c - 'A' + 10);
      }
      else
      {
        return false;
      }
      code = hex ? ((code << 4) | v) : (code * 10u + v);
    }
    return encodeUtf8(code, out);
  }

  static bool encodeUtf8(uint32_t cp, std::string &out)
  {
    if (cp == 0)
    {
      return false;
    }
    if (cp <= 0x7Fu)
    {
      out.push_back(static_cast<char>(cp));
    }
    else if (cp <= 0x7FFu)
    {
      out.push_back(static_cast<char>(0xC0u | ((cp >> 6) & 0x1Fu)));
      out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    }
    else if (cp <= 0xFFFFu)
    {
      // Exclude UTF-16 surrogate halves
      if (cp >= 0xD800u && cp <= 0xDFFFu)
      {
        return false;
      }
      out.push_back(static_cast<char>(0xE0u | ((cp >> 12) & 0x0Fu)));
      out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
      out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    }
    else if (cp <= 0x10FFFFu)
    {
      out.push_back(static_cast<char>(0xF0u | ((cp >> 18) & 0x07u)));
      out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
      out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
      out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    }
    else
    {
      return false;
    }
    return true;
  }

  Options _opt{};
};

} // namespace xml
} // namespace parsers
} // namespace rssflow
