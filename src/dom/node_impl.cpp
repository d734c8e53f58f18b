// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xdom, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#include <xdom/dom/node_impl.hpp>

namespace xdom
{
namespace dom
{

const char *nodeTypeToString(NodeType type)
{
  switch (type)
  {
  case NodeType::Element:
    return "Element";
  case NodeType::Attribute:
    return "Attribute";
  case NodeType::Text:
    return "Text";
  case NodeType::CData:
    return "CData";
  case NodeType::EntityReference:
    return "EntityReference";
  case NodeType::Entity:
    return "Entity";
  case NodeType::ProcessingInstruction:
    return "ProcessingInstruction";
  case NodeType::Comment:
    return "Comment";
  case NodeType::Document:
    return "Document";
  case NodeType::DocumentType:
    return "DocumentType";
  case NodeType::DocumentFragment:
    return "DocumentFragment";
  case NodeType::Notation:
    return "Notation";
  }
  return "Unknown";
}

bool isChildAllowed(NodeType parent, NodeType child)
{
  switch (parent)
  {
  case NodeType::Document:
    return child == NodeType::Element || child == NodeType::Comment ||
           child == NodeType::ProcessingInstruction || child == NodeType::DocumentType;
  case NodeType::DocumentFragment:
  case NodeType::Element:
  case NodeType::EntityReference:
  case NodeType::Entity:
    return child == NodeType::Element || child == NodeType::Text || child == NodeType::Comment ||
           child == NodeType::ProcessingInstruction || child == NodeType::CData ||
           child == NodeType::EntityReference;
  case NodeType::Attribute:
    return child == NodeType::Text || child == NodeType::EntityReference;
  default:
    return false;
  }
}

RefNode::RefNode(RcCell<NodeImpl> cell) : _cell(std::move(cell)) {}

RefNode::RefNode(const RefNode &other) : _cell(other._cell) {}

RefNode &RefNode::operator=(const RefNode &other)
{
  _cell = other._cell;
  return *this;
}

RefNode::~RefNode() = default;

RcCell<NodeImpl>::Ref RefNode::borrow() const { return _cell.borrow(); }

RcCell<NodeImpl>::RefMut RefNode::borrowMut() const { return _cell.borrowMut(); }

std::optional<RefNode> upgrade(const WeakRefNode &weak)
{
  if (auto cell = weak.upgrade())
  {
    return RefNode(std::move(*cell));
  }
  return std::nullopt;
}

RefNode makeNode(NodeImpl impl, const std::optional<RefNode> &ownerDocument)
{
  RefNode node(RcCell<NodeImpl>::make(std::move(impl)));
  if (ownerDocument)
  {
    node.borrowMut()->ownerDocument = ownerDocument->downgrade();
  }
  return node;
}

std::optional<RefNode> documentOf(const RefNode &node)
{
  if (node.nodeType() == NodeType::Document)
  {
    return node;
  }
  return node.ownerDocument();
}

void adoptSubtree(const RefNode &node, const RefNode &document)
{
  std::vector<RefNode> owned;
  {
    auto impl = node.borrowMut();
    impl->ownerDocument = document.downgrade();
    owned = impl->childNodes;
    if (auto *element = std::get_if<ElementExt>(&impl->extension))
    {
      for (const auto &entry : element->attributes)
      {
        owned.push_back(entry.second);
      }
    }
    else if (auto *docType = std::get_if<DocumentTypeExt>(&impl->extension))
    {
      for (const auto &entry : docType->entities)
      {
        owned.push_back(entry.second);
      }
      for (const auto &entry : docType->notations)
      {
        owned.push_back(entry.second);
      }
    }
  }
  for (const auto &child : owned)
  {
    adoptSubtree(child, document);
  }
}

} // namespace dom
} // namespace xdom
