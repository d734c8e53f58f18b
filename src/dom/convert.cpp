// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xdom, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#include <xdom/dom/convert.hpp>

#include <xdom/core/logger.hpp>
#include <xdom/dom/node_impl.hpp>

namespace xdom
{
namespace dom
{

namespace
{
template <typename Interface, typename Handle>
Interface *checkedCast(Handle &node, bool matches, const char *wanted)
{
  if (!matches)
  {
    XDOM_LOG_WARN("cannot view " << node.nodeType() << " node '" << node.nodeName() << "' as "
                                 << wanted);
    return nullptr;
  }
  return &static_cast<Interface &>(node);
}
} // namespace

bool isAttribute(const RefNode &node) { return node.nodeType() == NodeType::Attribute; }

bool isCharacterData(const RefNode &node) { return isCharacterDataType(node.nodeType()); }

bool isText(const RefNode &node)
{
  return node.nodeType() == NodeType::Text || node.nodeType() == NodeType::CData;
}

bool isCDataSection(const RefNode &node) { return node.nodeType() == NodeType::CData; }

bool isComment(const RefNode &node) { return node.nodeType() == NodeType::Comment; }

bool isProcessingInstruction(const RefNode &node)
{
  return node.nodeType() == NodeType::ProcessingInstruction;
}

bool isDocument(const RefNode &node) { return node.nodeType() == NodeType::Document; }

bool isDocumentType(const RefNode &node) { return node.nodeType() == NodeType::DocumentType; }

bool isDocumentFragment(const RefNode &node)
{
  return node.nodeType() == NodeType::DocumentFragment;
}

bool isElement(const RefNode &node) { return node.nodeType() == NodeType::Element; }

bool isEntity(const RefNode &node) { return node.nodeType() == NodeType::Entity; }

bool isEntityReference(const RefNode &node)
{
  return node.nodeType() == NodeType::EntityReference;
}

bool isNotation(const RefNode &node) { return node.nodeType() == NodeType::Notation; }

Attribute *asAttribute(RefNode &node)
{
  return checkedCast<Attribute>(node, isAttribute(node), "Attribute");
}

CharacterData *asCharacterData(RefNode &node)
{
  return checkedCast<CharacterData>(node, isCharacterData(node), "CharacterData");
}

Text *asText(RefNode &node) { return checkedCast<Text>(node, isText(node), "Text"); }

CDataSection *asCDataSection(RefNode &node)
{
  return checkedCast<CDataSection>(node, isCDataSection(node), "CDataSection");
}

Comment *asComment(RefNode &node) { return checkedCast<Comment>(node, isComment(node), "Comment"); }

ProcessingInstruction *asProcessingInstruction(RefNode &node)
{
  return checkedCast<ProcessingInstruction>(node, isProcessingInstruction(node),
                                            "ProcessingInstruction");
}

Document *asDocument(RefNode &node)
{
  return checkedCast<Document>(node, isDocument(node), "Document");
}

DocumentType *asDocumentType(RefNode &node)
{
  return checkedCast<DocumentType>(node, isDocumentType(node), "DocumentType");
}

DocumentFragment *asDocumentFragment(RefNode &node)
{
  return checkedCast<DocumentFragment>(node, isDocumentFragment(node), "DocumentFragment");
}

Element *asElement(RefNode &node) { return checkedCast<Element>(node, isElement(node), "Element"); }

NamespacedElement *asNamespacedElement(RefNode &node)
{
  return checkedCast<NamespacedElement>(node, isElement(node), "NamespacedElement");
}

Entity *asEntity(RefNode &node) { return checkedCast<Entity>(node, isEntity(node), "Entity"); }

EntityReference *asEntityReference(RefNode &node)
{
  return checkedCast<EntityReference>(node, isEntityReference(node), "EntityReference");
}

Notation *asNotation(RefNode &node)
{
  return checkedCast<Notation>(node, isNotation(node), "Notation");
}

const Attribute *asAttribute(const RefNode &node)
{
  return checkedCast<const Attribute>(node, isAttribute(node), "Attribute");
}

const CharacterData *asCharacterData(const RefNode &node)
{
  return checkedCast<const CharacterData>(node, isCharacterData(node), "CharacterData");
}

const Text *asText(const RefNode &node)
{
  return checkedCast<const Text>(node, isText(node), "Text");
}

const Document *asDocument(const RefNode &node)
{
  return checkedCast<const Document>(node, isDocument(node), "Document");
}

const DocumentType *asDocumentType(const RefNode &node)
{
  return checkedCast<const DocumentType>(node, isDocumentType(node), "DocumentType");
}

const Element *asElement(const RefNode &node)
{
  return checkedCast<const Element>(node, isElement(node), "Element");
}

const NamespacedElement *asNamespacedElement(const RefNode &node)
{
  return checkedCast<const NamespacedElement>(node, isElement(node), "NamespacedElement");
}

} // namespace dom
} // namespace xdom
