// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xdom, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#include <xdom/dom/node_impl.hpp>

#include <xdom/core/logger.hpp>

#include <algorithm>

namespace xdom
{
namespace dom
{

namespace
{
DomResult reject(const char *operation, DomError error, const char *message)
{
  XDOM_LOG_WARN(operation << ": " << message);
  return DomResult::failure(error, message);
}

std::optional<std::size_t> indexOf(const NodeList &nodes, const RefNode &node)
{
  auto it = std::find(nodes.begin(), nodes.end(), node);
  if (it == nodes.end())
  {
    return std::nullopt;
  }
  return static_cast<std::size_t>(it - nodes.begin());
}

// True when candidate is node itself or one of its ancestors.
bool isInclusiveAncestor(const RefNode &candidate, const RefNode &node)
{
  std::optional<RefNode> current = node;
  while (current)
  {
    if (*current == candidate)
    {
      return true;
    }
    current = current->parentNode();
  }
  return false;
}

bool isChildOf(const RefNode &parent, const RefNode &node)
{
  auto actual = node.parentNode();
  return actual && *actual == parent;
}

// Validates placing newChild (or, for a fragment, its children) under
// parent. `replacing` names a child that is about to leave, freeing its
// document slot.
DomResult checkInsertion(const char *operation, const RefNode &parent, const RefNode &newChild,
                         const std::optional<RefNode> &replacing)
{
  NodeType parentType = parent.nodeType();
  NodeType childType = newChild.nodeType();
  if (childType == NodeType::Attribute)
  {
    return reject(operation, DomError::HierarchyRequest, MSG_CHILD_NOT_ALLOWED);
  }

  NodeList nodes;
  if (childType == NodeType::DocumentFragment)
  {
    nodes = newChild.childNodes();
  }
  else
  {
    nodes.push_back(newChild);
  }

  if (isInclusiveAncestor(newChild, parent))
  {
    return reject(operation, DomError::HierarchyRequest, "node is an ancestor of the new parent");
  }

  std::size_t elements = 0;
  std::size_t docTypes = 0;
  for (const auto &node : nodes)
  {
    NodeType type = node.nodeType();
    if (!isChildAllowed(parentType, type) || isInclusiveAncestor(node, parent))
    {
      XDOM_LOG_DEBUG(operation << ": " << type << " under " << parentType);
      return reject(operation, DomError::HierarchyRequest, MSG_CHILD_NOT_ALLOWED);
    }
    elements += type == NodeType::Element ? 1 : 0;
    docTypes += type == NodeType::DocumentType ? 1 : 0;
  }

  auto parentDocument = documentOf(parent);
  auto childDocument = newChild.ownerDocument();
  if (parentDocument && childDocument && *parentDocument != *childDocument)
  {
    return reject(operation, DomError::WrongDocument, MSG_WRONG_DOCUMENT);
  }

  if (parentType == NodeType::Document)
  {
    auto occupied = [&](const std::optional<RefNode> &slot)
    { return slot && *slot != newChild && (!replacing || *slot != *replacing); };

    if (elements > 1 || (elements == 1 && occupied(parent.documentElement())))
    {
      return reject(operation, DomError::HierarchyRequest, "document element already set");
    }
    if (docTypes > 1 || (docTypes == 1 && occupied(parent.docType())))
    {
      return reject(operation, DomError::HierarchyRequest, "document type already set");
    }
  }
  return DomResult::success();
}

void detach(const RefNode &node)
{
  auto parent = node.parentNode();
  if (!parent)
  {
    return;
  }
  {
    auto impl = parent->borrowMut();
    if (auto *document = std::get_if<DocumentExt>(&impl->extension))
    {
      if (document->documentElement && *document->documentElement == node)
      {
        document->documentElement.reset();
      }
      if (document->docType && *document->docType == node)
      {
        document->docType.reset();
      }
    }
    auto &children = impl->childNodes;
    children.erase(std::remove(children.begin(), children.end(), node), children.end());
  }
  node.borrowMut()->parentNode.reset();
}

// Detaches newChild from wherever it is and returns the nodes to place. A
// fragment gives up its children and is left empty.
NodeList takeInsertionNodes(const RefNode &newChild)
{
  if (newChild.nodeType() != NodeType::DocumentFragment)
  {
    detach(newChild);
    return {newChild};
  }

  NodeList nodes;
  {
    auto impl = newChild.borrowMut();
    nodes.swap(impl->childNodes);
  }
  for (const auto &node : nodes)
  {
    node.borrowMut()->parentNode.reset();
  }
  return nodes;
}

// Places already validated and detached nodes under parent, at index (or at
// the end). Element and DocumentType go to a Document's slots.
void place(const RefNode &parent, const NodeList &nodes, std::optional<std::size_t> index)
{
  auto document = documentOf(parent);
  for (const auto &node : nodes)
  {
    NodeType type = node.nodeType();
    node.borrowMut()->parentNode = parent.downgrade();
    if (document)
    {
      adoptSubtree(node, *document);
    }

    auto impl = parent.borrowMut();
    auto *slots = std::get_if<DocumentExt>(&impl->extension);
    if (slots && type == NodeType::Element)
    {
      slots->documentElement = node;
    }
    else if (slots && type == NodeType::DocumentType)
    {
      slots->docType = node;
    }
    else if (index && *index <= impl->childNodes.size())
    {
      impl->childNodes.insert(impl->childNodes.begin() + static_cast<std::ptrdiff_t>(*index), node);
      ++*index;
    }
    else
    {
      impl->childNodes.push_back(node);
    }
  }
}

Result<RefNode> cloneWith(const RefNode &node, bool deep)
{
  NodeType type = node.nodeType();
  if (type == NodeType::Document || type == NodeType::DocumentType ||
      type == NodeType::Entity || type == NodeType::Notation)
  {
    XDOM_LOG_WARN("cloneNode: cannot clone " << type);
    return Result<RefNode>::failure(DomError::NotSupported, MSG_INVALID_NODE_TYPE);
  }

  NodeList children;
  NamedNodeMap attributes;
  Extension extension;
  std::optional<std::string> value;
  std::optional<Name> name;
  {
    auto impl = node.borrow();
    name = impl->name;
    value = impl->value;
    children = impl->childNodes;
    if (auto *element = std::get_if<ElementExt>(&impl->extension))
    {
      attributes = element->attributes;
      extension = ElementExt{{}, element->namespaces};
    }
    else if (std::holds_alternative<AttributeExt>(impl->extension))
    {
      extension = AttributeExt{};
    }
  }

  RefNode clone = makeNode(NodeImpl(type, *name, value, std::move(extension)), node.ownerDocument());

  for (const auto &entry : attributes)
  {
    auto attribute = cloneWith(entry.second, true);
    if (!attribute)
    {
      return attribute;
    }
    std::get<AttributeExt>(attribute.value->borrowMut()->extension).ownerElement = clone.downgrade();
    std::get<ElementExt>(clone.borrowMut()->extension).attributes.emplace(entry.first, *attribute.value);
  }

  if (deep || type == NodeType::Attribute)
  {
    for (const auto &child : children)
    {
      auto copy = cloneWith(child, true);
      if (!copy)
      {
        return copy;
      }
      copy.value->borrowMut()->parentNode = clone.downgrade();
      clone.borrowMut()->childNodes.push_back(*copy.value);
    }
  }
  return Result<RefNode>::success(clone);
}

void normalizeNode(const RefNode &node)
{
  for (const auto &entry : node.attributes())
  {
    normalizeNode(entry.second);
  }
  if (node.nodeType() == NodeType::Document)
  {
    if (auto root = node.documentElement())
    {
      normalizeNode(*root);
    }
  }

  NodeList kept;
  for (const auto &child : node.childNodes())
  {
    if (child.nodeType() != NodeType::Text)
    {
      normalizeNode(child);
      kept.push_back(child);
      continue;
    }

    std::string text = child.nodeValue().value_or("");
    if (!text.empty() && (kept.empty() || kept.back().nodeType() != NodeType::Text))
    {
      kept.push_back(child);
      continue;
    }
    if (!text.empty())
    {
      auto previous = kept.back().borrowMut();
      previous->value = previous->value.value_or("") + text;
    }
    child.borrowMut()->parentNode.reset();
  }
  node.borrowMut()->childNodes = std::move(kept);
}
} // namespace

Name RefNode::name() const { return borrow()->name; }

std::string RefNode::nodeName() const { return name().toString(); }

std::optional<std::string> RefNode::nodeValue() const { return borrow()->value; }

DomResult RefNode::setNodeValue(const std::string &value)
{
  borrowMut()->value = value;
  return DomResult::success();
}

DomResult RefNode::unsetNodeValue()
{
  borrowMut()->value.reset();
  return DomResult::success();
}

NodeType RefNode::nodeType() const { return borrow()->nodeType; }

std::optional<std::string> RefNode::namespaceUri() const { return borrow()->name.namespaceUri(); }

std::optional<std::string> RefNode::prefix() const { return borrow()->name.prefix(); }

std::string RefNode::localName() const { return borrow()->name.localName(); }

std::optional<RefNode> RefNode::parentNode() const { return upgrade(borrow()->parentNode); }

NodeList RefNode::childNodes() const { return borrow()->childNodes; }

std::optional<RefNode> RefNode::firstChild() const
{
  auto impl = borrow();
  if (impl->childNodes.empty())
  {
    return std::nullopt;
  }
  return impl->childNodes.front();
}

std::optional<RefNode> RefNode::lastChild() const
{
  auto impl = borrow();
  if (impl->childNodes.empty())
  {
    return std::nullopt;
  }
  return impl->childNodes.back();
}

std::optional<RefNode> RefNode::previousSibling() const
{
  auto parent = parentNode();
  if (!parent)
  {
    XDOM_LOG_DEBUG("previousSibling: " << MSG_NO_PARENT_NODE);
    return std::nullopt;
  }
  auto siblings = parent->childNodes();
  auto index = indexOf(siblings, *this);
  if (!index || *index == 0)
  {
    return std::nullopt;
  }
  return siblings[*index - 1];
}

std::optional<RefNode> RefNode::nextSibling() const
{
  auto parent = parentNode();
  if (!parent)
  {
    XDOM_LOG_DEBUG("nextSibling: " << MSG_NO_PARENT_NODE);
    return std::nullopt;
  }
  auto siblings = parent->childNodes();
  auto index = indexOf(siblings, *this);
  if (!index || *index + 1 >= siblings.size())
  {
    return std::nullopt;
  }
  return siblings[*index + 1];
}

NamedNodeMap RefNode::attributes() const
{
  auto impl = borrow();
  if (auto *element = std::get_if<ElementExt>(&impl->extension))
  {
    return element->attributes;
  }
  return {};
}

std::optional<RefNode> RefNode::ownerDocument() const { return upgrade(borrow()->ownerDocument); }

Result<RefNode> RefNode::insertBefore(const RefNode &newChild,
                                      const std::optional<RefNode> &refChild)
{
  auto status = checkInsertion("insertBefore", *this, newChild, std::nullopt);
  if (!status)
  {
    return Result<RefNode>::failure(status);
  }

  std::optional<RefNode> anchor = refChild;
  if (anchor && *anchor == newChild)
  {
    anchor = newChild.nextSibling();
  }

  NodeList nodes = takeInsertionNodes(newChild);
  std::optional<std::size_t> index;
  if (anchor)
  {
    index = indexOf(childNodes(), *anchor);
  }
  place(*this, nodes, index);
  return Result<RefNode>::success(newChild);
}

Result<RefNode> RefNode::appendChild(const RefNode &newChild)
{
  return insertBefore(newChild, std::nullopt);
}

Result<RefNode> RefNode::replaceChild(const RefNode &newChild, const RefNode &oldChild)
{
  if (!isChildOf(*this, oldChild))
  {
    return Result<RefNode>::failure(reject("replaceChild", DomError::NotFound, MSG_NOT_A_CHILD));
  }
  if (newChild == oldChild)
  {
    return Result<RefNode>::success(oldChild);
  }

  auto status = checkInsertion("replaceChild", *this, newChild, oldChild);
  if (!status)
  {
    return Result<RefNode>::failure(status);
  }

  NodeList nodes = takeInsertionNodes(newChild);
  auto index = indexOf(childNodes(), oldChild);
  detach(oldChild);
  place(*this, nodes, index);
  return Result<RefNode>::success(oldChild);
}

Result<RefNode> RefNode::removeChild(const RefNode &oldChild)
{
  if (!isChildOf(*this, oldChild))
  {
    return Result<RefNode>::failure(reject("removeChild", DomError::NotFound, MSG_NOT_A_CHILD));
  }
  detach(oldChild);
  return Result<RefNode>::success(oldChild);
}

bool RefNode::hasChildNodes() const { return !borrow()->childNodes.empty(); }

bool RefNode::hasAttributes() const { return !attributes().empty(); }

Result<RefNode> RefNode::cloneNode(bool deep) const { return cloneWith(*this, deep); }

void RefNode::normalize() { normalizeNode(*this); }

bool RefNode::isSupported(const std::string &feature, const std::string &version) const
{
  return DomImplementation().hasFeature(feature, version);
}

} // namespace dom
} // namespace xdom
