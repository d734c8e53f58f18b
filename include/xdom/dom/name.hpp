// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xdom, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <xdom/dom/error.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

namespace xdom
{
namespace dom
{

/// \brief Immutable, possibly namespace-qualified node name.
///
/// Two names are equal when their prefix and local name are equal; the
/// namespace URI does not take part in equality or hashing. Valid names are
/// only produced by parse() and fromNamespace(); the reserved `#...` names of
/// unnamed node kinds come from the dedicated factories.
class Name
{
public:
  /// \brief Parses a qualified name (`local` or `prefix:local`).
  ///
  /// Fails with InvalidCharacter for an empty name or an illegal character
  /// and with Namespace for a misplaced or repeated colon. The `xml` and
  /// `xmlns` prefixes, and the bare `xmlns` name, receive their reserved
  /// namespace URIs.
  static Result<Name> parse(const std::string &qualifiedName);

  /// \brief Parses \p qualifiedName and binds it to \p namespaceUri, applying
  /// the DOM Level 2 prefix/URI consistency checks. An empty URI means no
  /// namespace.
  static Result<Name> fromNamespace(const std::string &namespaceUri,
                                    const std::string &qualifiedName);

  static Name forText();
  static Name forCData();
  static Name forComment();
  static Name forDocument();
  static Name forDocumentFragment();

  const std::optional<std::string> &prefix() const { return _prefix; }
  const std::string &localName() const { return _localName; }
  const std::optional<std::string> &namespaceUri() const { return _namespaceUri; }

  /// \brief True for `xmlns` and `xmlns:*`.
  bool isNamespaceDeclaration() const;

  /// \brief Canonical `prefix:local` form.
  std::string toString() const;

  bool operator==(const Name &other) const
  {
    return _prefix == other._prefix && _localName == other._localName;
  }
  bool operator!=(const Name &other) const { return !(*this == other); }
  bool operator<(const Name &other) const { return toString() < other.toString(); }

private:
  Name(std::optional<std::string> prefix, std::string localName,
       std::optional<std::string> namespaceUri);

  std::optional<std::string> _prefix;
  std::string _localName;
  std::optional<std::string> _namespaceUri;
};

inline std::ostream &operator<<(std::ostream &os, const Name &name)
{
  return os << name.toString();
}

/// \brief Tag-name match used by getElementsByTagName; `*` on either side
/// matches anything.
bool tagNameMatch(const std::string &test, const std::string &against);

/// \brief Namespace-aware match used by getElementsByTagNameNs.
///
/// \p testNs / \p testLocal come from the candidate element and
/// \p againstNs / \p againstLocal from the query. A candidate without a
/// namespace only matches the wildcard query URI.
bool namespacedNameMatch(const std::optional<std::string> &testNs, const std::string &testLocal,
                         const std::string &againstNs, const std::string &againstLocal);

} // namespace dom
} // namespace xdom

namespace std
{
template <> struct hash<xdom::dom::Name>
{
  std::size_t operator()(const xdom::dom::Name &name) const
  {
    std::size_t seed = std::hash<std::string>()(name.localName());
    if (name.prefix())
    {
      seed ^= std::hash<std::string>()(*name.prefix()) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    }
    return seed;
  }
};
} // namespace std
