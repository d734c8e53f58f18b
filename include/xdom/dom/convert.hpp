// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xdom, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <xdom/dom/ref_node.hpp>

/// \file convert.hpp
/// \brief Checked views of a RefNode through one capability interface.
///
/// The `as*` helpers return nullptr, and log a warning, when the node is not
/// of a matching kind. The `is*` predicates are silent.

namespace xdom
{
namespace dom
{

bool isAttribute(const RefNode &node);
bool isCharacterData(const RefNode &node);
bool isText(const RefNode &node);
bool isCDataSection(const RefNode &node);
bool isComment(const RefNode &node);
bool isProcessingInstruction(const RefNode &node);
bool isDocument(const RefNode &node);
bool isDocumentType(const RefNode &node);
bool isDocumentFragment(const RefNode &node);
bool isElement(const RefNode &node);
bool isEntity(const RefNode &node);
bool isEntityReference(const RefNode &node);
bool isNotation(const RefNode &node);

Attribute *asAttribute(RefNode &node);
CharacterData *asCharacterData(RefNode &node);
/// \brief Text or CDATA section.
Text *asText(RefNode &node);
CDataSection *asCDataSection(RefNode &node);
Comment *asComment(RefNode &node);
ProcessingInstruction *asProcessingInstruction(RefNode &node);
Document *asDocument(RefNode &node);
DocumentType *asDocumentType(RefNode &node);
DocumentFragment *asDocumentFragment(RefNode &node);
Element *asElement(RefNode &node);
NamespacedElement *asNamespacedElement(RefNode &node);
Entity *asEntity(RefNode &node);
EntityReference *asEntityReference(RefNode &node);
Notation *asNotation(RefNode &node);

const Attribute *asAttribute(const RefNode &node);
const CharacterData *asCharacterData(const RefNode &node);
const Text *asText(const RefNode &node);
const Document *asDocument(const RefNode &node);
const DocumentType *asDocumentType(const RefNode &node);
const Element *asElement(const RefNode &node);
const NamespacedElement *asNamespacedElement(const RefNode &node);

} // namespace dom
} // namespace xdom
