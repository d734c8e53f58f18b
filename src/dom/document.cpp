// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xdom, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#include <xdom/dom/node_impl.hpp>

#include <xdom/core/logger.hpp>

namespace xdom
{
namespace dom
{

namespace
{
Result<RefNode> notADocument(const char *operation, NodeType type)
{
  XDOM_LOG_WARN(operation << ": " << MSG_INVALID_NODE_TYPE << " (" << type << ")");
  return Result<RefNode>::failure(DomError::InvalidState, MSG_INVALID_NODE_TYPE);
}

// Creates a node owned by `document` once its name has been validated.
Result<RefNode> createNamed(const RefNode &document, const char *operation,
                            const Result<Name> &name, NodeType type,
                            std::optional<std::string> value, Extension extension)
{
  if (document.nodeType() != NodeType::Document)
  {
    return notADocument(operation, document.nodeType());
  }
  if (!name)
  {
    return Result<RefNode>::failure(name);
  }
  return Result<RefNode>::success(
    makeNode(NodeImpl(type, *name.value, std::move(value), std::move(extension)), document));
}

// Extension accessors with the soft-violation fallback.
template <typename Ext, typename Getter>
auto readExtension(const RefNode &node, const char *operation, Getter getter)
  -> decltype(getter(std::declval<const Ext &>()))
{
  auto impl = node.borrow();
  if (auto *ext = std::get_if<Ext>(&impl->extension))
  {
    return getter(*ext);
  }
  XDOM_LOG_WARN(operation << ": " << MSG_INVALID_EXTENSION << " (" << impl->nodeType << ")");
  return {};
}
} // namespace

std::optional<RefNode> RefNode::docType() const
{
  return readExtension<DocumentExt>(*this, "docType",
                                    [](const DocumentExt &ext) { return ext.docType; });
}

std::optional<RefNode> RefNode::documentElement() const
{
  return readExtension<DocumentExt>(*this, "documentElement",
                                    [](const DocumentExt &ext) { return ext.documentElement; });
}

DomImplementation RefNode::implementation() const
{
  auto impl = borrow();
  if (auto *ext = std::get_if<DocumentExt>(&impl->extension))
  {
    return ext->implementation;
  }
  XDOM_LOG_WARN("implementation: " << MSG_INVALID_EXTENSION);
  return DomImplementation();
}

Result<RefNode> RefNode::createElement(const std::string &tagName)
{
  return createNamed(*this, "createElement", Name::parse(tagName), NodeType::Element, std::nullopt,
                     ElementExt{});
}

Result<RefNode> RefNode::createElementNs(const std::string &namespaceUri,
                                         const std::string &qualifiedName)
{
  return createNamed(*this, "createElementNs", Name::fromNamespace(namespaceUri, qualifiedName),
                     NodeType::Element, std::nullopt, ElementExt{});
}

Result<RefNode> RefNode::createAttribute(const std::string &name)
{
  return createNamed(*this, "createAttribute", Name::parse(name), NodeType::Attribute,
                     std::string(), AttributeExt{});
}

Result<RefNode> RefNode::createAttributeWith(const std::string &name, const std::string &value)
{
  return createNamed(*this, "createAttributeWith", Name::parse(name), NodeType::Attribute, value,
                     AttributeExt{});
}

Result<RefNode> RefNode::createAttributeNs(const std::string &namespaceUri,
                                           const std::string &qualifiedName)
{
  return createNamed(*this, "createAttributeNs", Name::fromNamespace(namespaceUri, qualifiedName),
                     NodeType::Attribute, std::string(), AttributeExt{});
}

Result<RefNode> RefNode::createTextNode(const std::string &data)
{
  return createNamed(*this, "createTextNode", Result<Name>::success(Name::forText()),
                     NodeType::Text, data, std::monostate{});
}

Result<RefNode> RefNode::createComment(const std::string &data)
{
  return createNamed(*this, "createComment", Result<Name>::success(Name::forComment()),
                     NodeType::Comment, data, std::monostate{});
}

Result<RefNode> RefNode::createCDataSection(const std::string &data)
{
  return createNamed(*this, "createCDataSection", Result<Name>::success(Name::forCData()),
                     NodeType::CData, data, std::monostate{});
}

Result<RefNode> RefNode::createDocumentFragment()
{
  return createNamed(*this, "createDocumentFragment",
                     Result<Name>::success(Name::forDocumentFragment()),
                     NodeType::DocumentFragment, std::nullopt, std::monostate{});
}

Result<RefNode> RefNode::createEntityReference(const std::string &name)
{
  return createNamed(*this, "createEntityReference", Name::parse(name),
                     NodeType::EntityReference, std::nullopt, std::monostate{});
}

Result<RefNode> RefNode::createProcessingInstruction(const std::string &target,
                                                     const std::optional<std::string> &data)
{
  return createNamed(*this, "createProcessingInstruction", Name::parse(target),
                     NodeType::ProcessingInstruction, data, std::monostate{});
}

Result<RefNode> RefNode::createEntity(const std::string &name,
                                      const std::optional<std::string> &publicId,
                                      const std::optional<std::string> &systemId,
                                      const std::optional<std::string> &notationName)
{
  return createNamed(*this, "createEntity", Name::parse(name), NodeType::Entity, std::nullopt,
                     EntityExt{publicId, systemId, notationName});
}

Result<RefNode> RefNode::createNotation(const std::string &name,
                                        const std::optional<std::string> &publicId,
                                        const std::optional<std::string> &systemId)
{
  return createNamed(*this, "createNotation", Name::parse(name), NodeType::Notation,
                     std::nullopt, NotationExt{publicId, systemId});
}

std::optional<RefNode> RefNode::getElementById(const std::string &) const { return std::nullopt; }

std::optional<std::string> RefNode::publicId() const
{
  auto impl = borrow();
  if (auto *docType = std::get_if<DocumentTypeExt>(&impl->extension))
  {
    return docType->publicId;
  }
  if (auto *entity = std::get_if<EntityExt>(&impl->extension))
  {
    return entity->publicId;
  }
  if (auto *notation = std::get_if<NotationExt>(&impl->extension))
  {
    return notation->publicId;
  }
  XDOM_LOG_WARN("publicId: " << MSG_INVALID_EXTENSION);
  return std::nullopt;
}

std::optional<std::string> RefNode::systemId() const
{
  auto impl = borrow();
  if (auto *docType = std::get_if<DocumentTypeExt>(&impl->extension))
  {
    return docType->systemId;
  }
  if (auto *entity = std::get_if<EntityExt>(&impl->extension))
  {
    return entity->systemId;
  }
  if (auto *notation = std::get_if<NotationExt>(&impl->extension))
  {
    return notation->systemId;
  }
  XDOM_LOG_WARN("systemId: " << MSG_INVALID_EXTENSION);
  return std::nullopt;
}

std::optional<std::string> RefNode::internalSubset() const
{
  return readExtension<DocumentTypeExt>(*this, "internalSubset",
                                        [](const DocumentTypeExt &ext)
                                        { return ext.internalSubset; });
}

NamedNodeMap RefNode::entities() const
{
  return readExtension<DocumentTypeExt>(*this, "entities",
                                        [](const DocumentTypeExt &ext) { return ext.entities; });
}

NamedNodeMap RefNode::notations() const
{
  return readExtension<DocumentTypeExt>(*this, "notations",
                                        [](const DocumentTypeExt &ext) { return ext.notations; });
}

std::optional<std::string> RefNode::notationName() const
{
  return readExtension<EntityExt>(*this, "notationName",
                                  [](const EntityExt &ext) { return ext.notationName; });
}

DomResult RefNode::addEntity(const RefNode &entity)
{
  if (nodeType() != NodeType::DocumentType || entity.nodeType() != NodeType::Entity)
  {
    XDOM_LOG_WARN("addEntity: " << MSG_INVALID_NODE_TYPE);
    return DomResult::failure(DomError::InvalidState, MSG_INVALID_NODE_TYPE);
  }
  Name name = entity.name();
  {
    auto impl = borrowMut();
    std::get<DocumentTypeExt>(impl->extension).entities.insert_or_assign(name, entity);
  }
  if (auto document = ownerDocument())
  {
    adoptSubtree(entity, *document);
  }
  return DomResult::success();
}

DomResult RefNode::addNotation(const RefNode &notation)
{
  if (nodeType() != NodeType::DocumentType || notation.nodeType() != NodeType::Notation)
  {
    XDOM_LOG_WARN("addNotation: " << MSG_INVALID_NODE_TYPE);
    return DomResult::failure(DomError::InvalidState, MSG_INVALID_NODE_TYPE);
  }
  Name name = notation.name();
  {
    auto impl = borrowMut();
    std::get<DocumentTypeExt>(impl->extension).notations.insert_or_assign(name, notation);
  }
  if (auto document = ownerDocument())
  {
    adoptSubtree(notation, *document);
  }
  return DomResult::success();
}

bool RefNode::specified() const { return true; }

std::optional<std::string> RefNode::value() const
{
  auto impl = borrow();
  if (impl->nodeType != NodeType::Attribute)
  {
    XDOM_LOG_WARN("value: " << MSG_INVALID_NODE_TYPE << " (" << impl->nodeType << ")");
    return std::nullopt;
  }
  return impl->value;
}

DomResult RefNode::setValue(const std::string &value)
{
  auto impl = borrowMut();
  if (impl->nodeType != NodeType::Attribute)
  {
    XDOM_LOG_WARN("setValue: " << MSG_INVALID_NODE_TYPE << " (" << impl->nodeType << ")");
    return DomResult::failure(DomError::InvalidState, MSG_INVALID_NODE_TYPE);
  }
  impl->value = value;
  return DomResult::success();
}

DomResult RefNode::unsetValue()
{
  auto impl = borrowMut();
  if (impl->nodeType != NodeType::Attribute)
  {
    XDOM_LOG_WARN("unsetValue: " << MSG_INVALID_NODE_TYPE << " (" << impl->nodeType << ")");
    return DomResult::failure(DomError::InvalidState, MSG_INVALID_NODE_TYPE);
  }
  impl->value.reset();
  return DomResult::success();
}

std::optional<RefNode> RefNode::ownerElement() const
{
  auto impl = borrow();
  if (auto *attribute = std::get_if<AttributeExt>(&impl->extension))
  {
    return upgrade(attribute->ownerElement);
  }
  XDOM_LOG_WARN("ownerElement: " << MSG_INVALID_EXTENSION);
  return std::nullopt;
}

std::string RefNode::target() const { return nodeName(); }

} // namespace dom
} // namespace xdom
