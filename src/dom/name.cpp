// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xdom, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#include <xdom/dom/name.hpp>

#include <xdom/core/logger.hpp>
#include <xdom/dom/syntax.hpp>

namespace xdom
{
namespace dom
{

namespace
{
// Length of the well-formed UTF-8 sequence starting at pos, or 0 when the
// bytes there are a stray continuation, an overlong or surrogate form, a code
// point above U+10FFFF, or a truncated sequence.
std::size_t utf8SequenceLength(const std::string &text, std::size_t pos)
{
  const auto lead = static_cast<unsigned char>(text[pos]);
  std::size_t length = 0;
  unsigned char low = 0x80;
  unsigned char high = 0xBF;
  if (lead < 0x80)
  {
    return 1;
  }
  else if (lead >= 0xC2 && lead <= 0xDF)
  {
    length = 2;
  }
  else if (lead >= 0xE0 && lead <= 0xEF)
  {
    length = 3;
    low = lead == 0xE0 ? 0xA0 : 0x80;
    high = lead == 0xED ? 0x9F : 0xBF;
  }
  else if (lead >= 0xF0 && lead <= 0xF4)
  {
    length = 4;
    low = lead == 0xF0 ? 0x90 : 0x80;
    high = lead == 0xF4 ? 0x8F : 0xBF;
  }
  else
  {
    return 0;
  }

  if (pos + length > text.size())
  {
    return 0;
  }
  for (std::size_t i = 1; i < length; ++i)
  {
    const auto c = static_cast<unsigned char>(text[pos + i]);
    if (c < (i == 1 ? low : 0x80) || c > (i == 1 ? high : 0xBF))
    {
      return 0;
    }
  }
  return length;
}

bool isWellFormedUtf8(const std::string &text)
{
  for (std::size_t pos = 0; pos < text.size();)
  {
    auto length = utf8SequenceLength(text, pos);
    if (length == 0)
    {
      return false;
    }
    pos += length;
  }
  return true;
}

// Bytes >= 0x80 belong to UTF-8 encoded characters, checked by
// isWellFormedUtf8 before any part is scanned.
bool isNameStartChar(unsigned char c)
{
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c >= 0x80;
}

bool isNameChar(unsigned char c)
{
  return isNameStartChar(c) || (c >= '0' && c <= '9') || c == '-' || c == '.';
}

// Checks one colon-free part of a qualified name.
DomResult validatePart(const std::string &part)
{
  if (part.empty() || !isNameStartChar(static_cast<unsigned char>(part.front())))
  {
    return DomResult::failure(DomError::InvalidCharacter, MSG_INVALID_NAME);
  }
  for (char c : part)
  {
    if (!isNameChar(static_cast<unsigned char>(c)))
    {
      return DomResult::failure(DomError::InvalidCharacter, MSG_INVALID_NAME);
    }
  }
  return DomResult::success();
}
} // namespace

Name::Name(std::optional<std::string> prefix, std::string localName,
           std::optional<std::string> namespaceUri)
    : _prefix(std::move(prefix)), _localName(std::move(localName)),
      _namespaceUri(std::move(namespaceUri))
{
}

Result<Name> Name::parse(const std::string &qualifiedName)
{
  if (qualifiedName.empty())
  {
    XDOM_LOG_WARN("Name::parse: empty name");
    return Result<Name>::failure(DomError::InvalidCharacter, MSG_INVALID_NAME);
  }

  if (!isWellFormedUtf8(qualifiedName))
  {
    XDOM_LOG_WARN("Name::parse: malformed UTF-8 in name");
    return Result<Name>::failure(DomError::InvalidCharacter, MSG_INVALID_NAME);
  }

  for (char c : qualifiedName)
  {
    if (c != syntax::XML_NS_SEPARATOR && !isNameChar(static_cast<unsigned char>(c)))
    {
      XDOM_LOG_WARN("Name::parse: illegal character in '" << qualifiedName << "'");
      return Result<Name>::failure(DomError::InvalidCharacter, MSG_INVALID_NAME);
    }
  }

  auto colon = qualifiedName.find(syntax::XML_NS_SEPARATOR);
  if (colon != std::string::npos &&
      (colon == 0 || colon == qualifiedName.size() - 1 ||
       qualifiedName.find(syntax::XML_NS_SEPARATOR, colon + 1) != std::string::npos))
  {
    XDOM_LOG_WARN("Name::parse: malformed qualified name '" << qualifiedName << "'");
    return Result<Name>::failure(DomError::Namespace, MSG_INVALID_NAME);
  }

  std::optional<std::string> prefix;
  std::string localName = qualifiedName;
  if (colon != std::string::npos)
  {
    prefix = qualifiedName.substr(0, colon);
    localName = qualifiedName.substr(colon + 1);
  }

  auto status = prefix ? validatePart(*prefix) : DomResult::success();
  if (status)
  {
    status = validatePart(localName);
  }
  if (!status)
  {
    XDOM_LOG_WARN("Name::parse: invalid name part in '" << qualifiedName << "'");
    return Result<Name>::failure(status);
  }

  std::optional<std::string> namespaceUri;
  if (prefix == std::string(syntax::XML_NS_PREFIX))
  {
    namespaceUri = syntax::XML_NS_URI;
  }
  else if (prefix == std::string(syntax::XMLNS_NS_ATTRIBUTE) ||
           (!prefix && localName == syntax::XMLNS_NS_ATTRIBUTE))
  {
    namespaceUri = syntax::XMLNS_NS_URI;
  }

  return Result<Name>::success(Name(std::move(prefix), std::move(localName), std::move(namespaceUri)));
}

Result<Name> Name::fromNamespace(const std::string &namespaceUri, const std::string &qualifiedName)
{
  auto parsed = parse(qualifiedName);
  if (!parsed)
  {
    return parsed;
  }
  Name name = *parsed.value;

  auto reject = [&](const char *why)
  {
    XDOM_LOG_WARN("Name::fromNamespace: " << why << " ('" << qualifiedName << "', '"
                                          << namespaceUri << "')");
    return Result<Name>::failure(DomError::Namespace, why);
  };

  if (name._prefix && namespaceUri.empty())
  {
    return reject("prefix requires a namespace URI");
  }
  if (name._prefix == std::string(syntax::XML_NS_PREFIX) && namespaceUri != syntax::XML_NS_URI)
  {
    return reject("xml prefix bound to a foreign URI");
  }
  if (name.isNamespaceDeclaration() && namespaceUri != syntax::XMLNS_NS_URI)
  {
    return reject("xmlns name bound to a foreign URI");
  }
  if (namespaceUri == syntax::XMLNS_NS_URI && !name.isNamespaceDeclaration())
  {
    return reject("xmlns URI bound to a non-xmlns name");
  }

  if (namespaceUri.empty())
  {
    name._namespaceUri.reset();
  }
  else
  {
    name._namespaceUri = namespaceUri;
  }
  return Result<Name>::success(std::move(name));
}

Name Name::forText() { return Name(std::nullopt, syntax::XML_NAME_TEXT, std::nullopt); }

Name Name::forCData() { return Name(std::nullopt, syntax::XML_NAME_CDATA, std::nullopt); }

Name Name::forComment() { return Name(std::nullopt, syntax::XML_NAME_COMMENT, std::nullopt); }

Name Name::forDocument() { return Name(std::nullopt, syntax::XML_NAME_DOCUMENT, std::nullopt); }

Name Name::forDocumentFragment()
{
  return Name(std::nullopt, syntax::XML_NAME_DOCUMENT_FRAGMENT, std::nullopt);
}

bool Name::isNamespaceDeclaration() const
{
  if (_prefix)
  {
    return *_prefix == syntax::XMLNS_NS_ATTRIBUTE;
  }
  return _localName == syntax::XMLNS_NS_ATTRIBUTE;
}

std::string Name::toString() const
{
  if (_prefix)
  {
    return *_prefix + syntax::XML_NS_SEPARATOR + _localName;
  }
  return _localName;
}

bool tagNameMatch(const std::string &test, const std::string &against)
{
  return test == against || test == syntax::WILD_CARD || against == syntax::WILD_CARD;
}

bool namespacedNameMatch(const std::optional<std::string> &testNs, const std::string &testLocal,
                         const std::string &againstNs, const std::string &againstLocal)
{
  bool localMatch = tagNameMatch(testLocal, againstLocal);
  if (!testNs)
  {
    return againstNs == syntax::WILD_CARD && localMatch;
  }
  return (*testNs == againstNs || *testNs == syntax::WILD_CARD || againstNs == syntax::WILD_CARD) &&
         localMatch;
}

} // namespace dom
} // namespace xdom
