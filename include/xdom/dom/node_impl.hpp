// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xdom, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <xdom/dom/implementation.hpp>
#include <xdom/dom/name.hpp>
#include <xdom/dom/node_type.hpp>
#include <xdom/dom/ref_node.hpp>

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace xdom
{
namespace dom
{

struct DocumentExt
{
  std::optional<RefNode> docType;
  std::optional<RefNode> documentElement;
  DomImplementation implementation;
};

struct ElementExt
{
  NamedNodeMap attributes;
  NamespaceMap namespaces;
};

struct AttributeExt
{
  WeakRefNode ownerElement;
};

struct DocumentTypeExt
{
  NamedNodeMap entities;
  NamedNodeMap notations;
  std::optional<std::string> publicId;
  std::optional<std::string> systemId;
  std::optional<std::string> internalSubset;
};

struct EntityExt
{
  std::optional<std::string> publicId;
  std::optional<std::string> systemId;
  std::optional<std::string> notationName;
};

struct NotationExt
{
  std::optional<std::string> publicId;
  std::optional<std::string> systemId;
};

/// \brief Kind-specific node state. std::monostate for kinds without any.
using Extension = std::variant<std::monostate, DocumentExt, ElementExt, AttributeExt,
                               DocumentTypeExt, EntityExt, NotationExt>;

/// \brief The single record behind every node.
///
/// Downward edges (children, attributes, document slots, doctype tables) are
/// strong; the parent and owner-document edges are weak.
struct NodeImpl
{
  NodeImpl(NodeType type, Name nodeName, std::optional<std::string> nodeValue = std::nullopt,
           Extension ext = std::monostate{})
      : nodeType(type), name(std::move(nodeName)), value(std::move(nodeValue)),
        extension(std::move(ext))
  {
  }

  const NodeType nodeType;
  const Name name;
  std::optional<std::string> value;
  WeakRefNode parentNode;
  WeakRefNode ownerDocument;
  std::vector<RefNode> childNodes;
  Extension extension;
};

/// \brief Wraps \p impl in a new node, owned by \p ownerDocument if given.
RefNode makeNode(NodeImpl impl, const std::optional<RefNode> &ownerDocument = std::nullopt);

/// \brief The document a node belongs to: itself for a Document, otherwise
/// its live owner document.
std::optional<RefNode> documentOf(const RefNode &node);

/// \brief Points \p node and everything it owns (children, attributes,
/// doctype tables) at \p document.
void adoptSubtree(const RefNode &node, const RefNode &document);

} // namespace dom
} // namespace xdom
