// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xdom, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#include <xdom/dom/node_impl.hpp>

#include <xdom/core/logger.hpp>
#include <xdom/dom/syntax.hpp>

namespace xdom
{
namespace dom
{

namespace
{
bool isElement(const RefNode &node, const char *operation)
{
  if (node.nodeType() != NodeType::Element)
  {
    XDOM_LOG_WARN(operation << ": " << MSG_INVALID_NODE_TYPE << " (" << node.nodeType() << ")");
    return false;
  }
  return true;
}

std::optional<std::string> namespaceOrNone(const std::string &namespaceUri)
{
  if (namespaceUri.empty())
  {
    return std::nullopt;
  }
  return namespaceUri;
}

// Attribute of `element` named (namespaceUri, localName), if any.
std::optional<RefNode> findAttributeNs(const RefNode &element, const std::string &namespaceUri,
                                       const std::string &localName)
{
  auto uri = namespaceOrNone(namespaceUri);
  for (const auto &entry : element.attributes())
  {
    if (entry.first.namespaceUri() == uri && entry.first.localName() == localName)
    {
      return entry.second;
    }
  }
  return std::nullopt;
}

// Prefix declared by an `xmlns` or `xmlns:p` attribute name.
std::optional<std::string> declaredPrefix(const Name &name)
{
  if (name.prefix())
  {
    return name.localName();
  }
  return std::nullopt;
}

void setOwnerElement(const RefNode &attribute, const std::optional<RefNode> &element)
{
  auto impl = attribute.borrowMut();
  if (auto *ext = std::get_if<AttributeExt>(&impl->extension))
  {
    ext->ownerElement = element ? element->downgrade() : WeakRefNode();
  }
  else
  {
    XDOM_LOG_WARN("setOwnerElement: " << MSG_INVALID_EXTENSION);
  }
}

// Drops attribute from element's map, undoing its namespace declaration.
void dropAttribute(RefNode &element, const Name &name, const RefNode &attribute)
{
  if (name.isNamespaceDeclaration())
  {
    element.removeMapping(declaredPrefix(name));
  }
  {
    auto impl = element.borrowMut();
    std::get<ElementExt>(impl->extension).attributes.erase(name);
  }
  setOwnerElement(attribute, std::nullopt);
}

template <typename Match> void collectElements(const RefNode &node, const Match &match, NodeList &out)
{
  {
    auto impl = node.borrow();
    if (!std::holds_alternative<ElementExt>(impl->extension))
    {
      XDOM_LOG_WARN("getElementsByTagName: " << MSG_INVALID_EXTENSION);
      return;
    }
  }
  if (match(node))
  {
    out.push_back(node);
  }
  for (const auto &child : node.childNodes())
  {
    if (child.nodeType() == NodeType::Element)
    {
      collectElements(child, match, out);
    }
  }
}

// Search root for the tag-name queries: the element itself, or a document's
// document element.
std::optional<RefNode> searchRoot(const RefNode &node, const char *operation)
{
  switch (node.nodeType())
  {
  case NodeType::Element:
    return node;
  case NodeType::Document:
    return node.documentElement();
  default:
    XDOM_LOG_WARN(operation << ": " << MSG_INVALID_NODE_TYPE << " (" << node.nodeType() << ")");
    return std::nullopt;
  }
}
} // namespace

std::string RefNode::tagName() const { return nodeName(); }

std::optional<std::string> RefNode::getAttribute(const std::string &name) const
{
  if (auto attribute = getAttributeNode(name))
  {
    return attribute->value();
  }
  return std::nullopt;
}

std::optional<std::string> RefNode::getAttributeNs(const std::string &namespaceUri,
                                                   const std::string &localName) const
{
  if (auto attribute = getAttributeNodeNs(namespaceUri, localName))
  {
    return attribute->value();
  }
  return std::nullopt;
}

DomResult RefNode::setAttribute(const std::string &name, const std::string &value)
{
  auto parsed = Name::parse(name);
  if (!parsed)
  {
    return parsed.status();
  }
  RefNode attribute = makeNode(NodeImpl(NodeType::Attribute, *parsed.value, value, AttributeExt{}),
                               ownerDocument());
  return setAttributeNode(attribute).status();
}

DomResult RefNode::setAttributeNs(const std::string &namespaceUri,
                                  const std::string &qualifiedName, const std::string &value)
{
  auto parsed = Name::fromNamespace(namespaceUri, qualifiedName);
  if (!parsed)
  {
    return parsed.status();
  }
  RefNode attribute = makeNode(NodeImpl(NodeType::Attribute, *parsed.value, value, AttributeExt{}),
                               ownerDocument());
  return setAttributeNodeNs(attribute).status();
}

DomResult RefNode::removeAttribute(const std::string &name)
{
  if (!isElement(*this, "removeAttribute"))
  {
    return DomResult::success();
  }
  auto parsed = Name::parse(name);
  if (!parsed)
  {
    return parsed.status();
  }
  auto attributes = this->attributes();
  auto it = attributes.find(*parsed.value);
  if (it != attributes.end())
  {
    dropAttribute(*this, it->first, it->second);
  }
  return DomResult::success();
}

DomResult RefNode::removeAttributeNs(const std::string &namespaceUri,
                                     const std::string &localName)
{
  if (!isElement(*this, "removeAttributeNs"))
  {
    return DomResult::success();
  }
  if (auto attribute = findAttributeNs(*this, namespaceUri, localName))
  {
    dropAttribute(*this, attribute->name(), *attribute);
  }
  return DomResult::success();
}

std::optional<RefNode> RefNode::getAttributeNode(const std::string &name) const
{
  if (!isElement(*this, "getAttributeNode"))
  {
    return std::nullopt;
  }
  auto parsed = Name::parse(name);
  if (!parsed)
  {
    return std::nullopt;
  }
  auto attributes = this->attributes();
  auto it = attributes.find(*parsed.value);
  if (it == attributes.end())
  {
    return std::nullopt;
  }
  return it->second;
}

std::optional<RefNode> RefNode::getAttributeNodeNs(const std::string &namespaceUri,
                                                   const std::string &localName) const
{
  if (!isElement(*this, "getAttributeNodeNs"))
  {
    return std::nullopt;
  }
  return findAttributeNs(*this, namespaceUri, localName);
}

Result<RefNode> RefNode::setAttributeNode(const RefNode &attribute)
{
  if (nodeType() != NodeType::Element || attribute.nodeType() != NodeType::Attribute)
  {
    XDOM_LOG_WARN("setAttributeNode: " << MSG_INVALID_NODE_TYPE);
    return Result<RefNode>::failure(DomError::InvalidState, MSG_INVALID_NODE_TYPE);
  }

  auto document = ownerDocument();
  auto attributeDocument = attribute.ownerDocument();
  if (document && attributeDocument && *document != *attributeDocument)
  {
    XDOM_LOG_WARN("setAttributeNode: " << MSG_WRONG_DOCUMENT);
    return Result<RefNode>::failure(DomError::WrongDocument, MSG_WRONG_DOCUMENT);
  }

  auto owner = attribute.ownerElement();
  if (owner && *owner == *this)
  {
    return Result<RefNode>::success(attribute);
  }
  if (owner)
  {
    XDOM_LOG_WARN("setAttributeNode: attribute '" << attribute.nodeName()
                                                  << "' is owned by another element");
    return Result<RefNode>::failure(DomError::InUseAttribute, "attribute in use");
  }

  Name name = attribute.name();
  if (name.isNamespaceDeclaration())
  {
    auto status = insertMapping(declaredPrefix(name), attribute.value().value_or(""));
    if (!status)
    {
      return Result<RefNode>::failure(status);
    }
  }

  std::optional<RefNode> replaced;
  {
    auto impl = borrowMut();
    auto &attributes = std::get<ElementExt>(impl->extension).attributes;
    auto it = attributes.find(name);
    if (it != attributes.end())
    {
      replaced = it->second;
      it->second = attribute;
    }
    else
    {
      attributes.emplace(name, attribute);
    }
  }
  if (replaced)
  {
    setOwnerElement(*replaced, std::nullopt);
  }
  setOwnerElement(attribute, *this);
  if (document)
  {
    adoptSubtree(attribute, *document);
  }
  return Result<RefNode>::success(attribute);
}

Result<RefNode> RefNode::setAttributeNodeNs(const RefNode &attribute)
{
  return setAttributeNode(attribute);
}

Result<RefNode> RefNode::removeAttributeNode(const RefNode &attribute)
{
  if (nodeType() == NodeType::Element)
  {
    for (const auto &entry : attributes())
    {
      if (entry.second == attribute)
      {
        dropAttribute(*this, entry.first, attribute);
        return Result<RefNode>::success(attribute);
      }
    }
  }
  XDOM_LOG_WARN("removeAttributeNode: " << MSG_NOT_A_CHILD);
  return Result<RefNode>::failure(DomError::NotFound, "attribute not found");
}

bool RefNode::hasAttribute(const std::string &name) const
{
  return getAttributeNode(name).has_value();
}

bool RefNode::hasAttributeNs(const std::string &namespaceUri, const std::string &localName) const
{
  return getAttributeNodeNs(namespaceUri, localName).has_value();
}

NodeList RefNode::getElementsByTagName(const std::string &tagName) const
{
  NodeList found;
  if (auto root = searchRoot(*this, "getElementsByTagName"))
  {
    collectElements(*root, [&](const RefNode &node) { return tagNameMatch(node.nodeName(), tagName); },
                    found);
  }
  return found;
}

NodeList RefNode::getElementsByTagNameNs(const std::string &namespaceUri,
                                         const std::string &localName) const
{
  NodeList found;
  if (auto root = searchRoot(*this, "getElementsByTagNameNs"))
  {
    collectElements(*root,
                    [&](const RefNode &node)
                    {
                      return namespacedNameMatch(node.namespaceUri(), node.localName(),
                                                 namespaceUri, localName);
                    },
                    found);
  }
  return found;
}

DomResult RefNode::insertMapping(const std::optional<std::string> &prefix,
                                 const std::string &namespaceUri)
{
  if (!isElement(*this, "insertMapping"))
  {
    return DomResult::failure(DomError::InvalidState, MSG_INVALID_NODE_TYPE);
  }

  const char *problem = nullptr;
  bool xmlPrefix = prefix == std::string(syntax::XML_NS_PREFIX);
  if (prefix == std::string(syntax::XMLNS_NS_ATTRIBUTE))
  {
    problem = "the xmlns prefix cannot be declared";
  }
  else if (xmlPrefix != (namespaceUri == syntax::XML_NS_URI))
  {
    problem = "the xml prefix and namespace are bound to each other";
  }
  else if (namespaceUri == syntax::XMLNS_NS_URI)
  {
    problem = "the xmlns namespace cannot be bound";
  }
  else if (prefix && namespaceUri.empty())
  {
    problem = "a prefix cannot be bound to an empty namespace";
  }
  if (problem)
  {
    XDOM_LOG_WARN("insertMapping: " << problem);
    return DomResult::failure(DomError::Namespace, problem);
  }

  auto impl = borrowMut();
  std::get<ElementExt>(impl->extension).namespaces[prefix] = namespaceUri;
  return DomResult::success();
}

std::optional<std::string> RefNode::removeMapping(const std::optional<std::string> &prefix)
{
  if (!isElement(*this, "removeMapping"))
  {
    return std::nullopt;
  }
  auto impl = borrowMut();
  auto &namespaces = std::get<ElementExt>(impl->extension).namespaces;
  auto it = namespaces.find(prefix);
  if (it == namespaces.end())
  {
    return std::nullopt;
  }
  std::string removed = it->second;
  namespaces.erase(it);
  return removed;
}

std::optional<std::string> RefNode::getMapping(const std::optional<std::string> &prefix) const
{
  auto impl = borrow();
  if (auto *element = std::get_if<ElementExt>(&impl->extension))
  {
    auto it = element->namespaces.find(prefix);
    if (it != element->namespaces.end())
    {
      return it->second;
    }
  }
  return std::nullopt;
}

std::optional<std::string>
RefNode::lookupNamespaceUri(const std::optional<std::string> &prefix) const
{
  if (prefix == std::string(syntax::XML_NS_PREFIX))
  {
    return std::string(syntax::XML_NS_URI);
  }
  if (prefix == std::string(syntax::XMLNS_NS_ATTRIBUTE))
  {
    return std::string(syntax::XMLNS_NS_URI);
  }

  std::optional<RefNode> current = *this;
  while (current && current->nodeType() == NodeType::Element)
  {
    if (auto uri = current->getMapping(prefix))
    {
      // xmlns="" undeclares the default namespace
      if (uri->empty())
      {
        return std::nullopt;
      }
      return uri;
    }
    if (current->prefix() == prefix && current->namespaceUri())
    {
      return current->namespaceUri();
    }
    current = current->parentNode();
  }
  return std::nullopt;
}

std::optional<std::string> RefNode::lookupPrefix(const std::string &namespaceUri) const
{
  if (namespaceUri.empty())
  {
    return std::nullopt;
  }
  std::optional<RefNode> current = *this;
  while (current && current->nodeType() == NodeType::Element)
  {
    for (const auto &entry : current->mappings())
    {
      if (entry.first && entry.second == namespaceUri &&
          lookupNamespaceUri(entry.first) == namespaceUri)
      {
        return entry.first;
      }
    }
    current = current->parentNode();
  }
  return std::nullopt;
}

NamespaceMap RefNode::mappings() const
{
  auto impl = borrow();
  if (auto *element = std::get_if<ElementExt>(&impl->extension))
  {
    return element->namespaces;
  }
  return {};
}

} // namespace dom
} // namespace xdom
