// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xdom, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#include <xdom/dom/implementation.hpp>

#include <xdom/core/logger.hpp>
#include <xdom/dom/node_impl.hpp>
#include <xdom/dom/syntax.hpp>

#include <algorithm>
#include <cctype>

namespace xdom
{
namespace dom
{

Result<RefNode> DomImplementation::createDocument(const std::string &namespaceUri,
                                                  const std::string &qualifiedName,
                                                  const std::optional<RefNode> &docType) const
{
  auto name = Name::fromNamespace(namespaceUri, qualifiedName);
  if (!name)
  {
    return Result<RefNode>::failure(name);
  }

  if (docType)
  {
    if (docType->nodeType() != NodeType::DocumentType)
    {
      XDOM_LOG_WARN("createDocument: " << MSG_INVALID_NODE_TYPE);
      return Result<RefNode>::failure(DomError::InvalidState, MSG_INVALID_NODE_TYPE);
    }
    if (docType->ownerDocument())
    {
      XDOM_LOG_WARN("createDocument: document type already in use");
      return Result<RefNode>::failure(DomError::WrongDocument, MSG_WRONG_DOCUMENT);
    }
  }

  RefNode document =
    makeNode(NodeImpl(NodeType::Document, Name::forDocument(), std::nullopt,
                      DocumentExt{std::nullopt, std::nullopt, *this}));

  // The root element can only be built once the document exists, since its
  // owner document must point back at it.
  auto root = document.createElementNs(namespaceUri, qualifiedName);
  if (!root)
  {
    return root;
  }

  bool isDocument = std::holds_alternative<DocumentExt>(document.borrow()->extension);
  if (!isDocument)
  {
    XDOM_LOG_ERROR("createDocument: " << MSG_INVALID_EXTENSION);
    return Result<RefNode>::failure(DomError::InvalidState, MSG_INVALID_EXTENSION);
  }

  if (docType)
  {
    auto adopted = document.appendChild(*docType);
    if (!adopted)
    {
      return adopted;
    }
  }
  auto installed = document.appendChild(*root.value);
  if (!installed)
  {
    return installed;
  }

  XDOM_LOG_DEBUG("createDocument: created document with root '" << qualifiedName << "'");
  return Result<RefNode>::success(document);
}

Result<RefNode> DomImplementation::createDocumentType(const std::string &qualifiedName,
                                                      const std::optional<std::string> &publicId,
                                                      const std::optional<std::string> &systemId) const
{
  return createDocumentTypeWith(qualifiedName, publicId, systemId, std::nullopt);
}

Result<RefNode>
DomImplementation::createDocumentTypeWith(const std::string &qualifiedName,
                                          const std::optional<std::string> &publicId,
                                          const std::optional<std::string> &systemId,
                                          const std::optional<std::string> &internalSubset) const
{
  auto name = Name::parse(qualifiedName);
  if (!name)
  {
    return Result<RefNode>::failure(name);
  }
  DocumentTypeExt ext;
  ext.publicId = publicId;
  ext.systemId = systemId;
  ext.internalSubset = internalSubset;
  return Result<RefNode>::success(
    makeNode(NodeImpl(NodeType::DocumentType, *name.value, std::nullopt, std::move(ext))));
}

bool DomImplementation::hasFeature(const std::string &feature, const std::string &version) const
{
  std::string lowered = feature;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  bool knownFeature = lowered == syntax::XML_FEATURE_CORE || lowered == syntax::XML_FEATURE_XML;
  bool knownVersion =
    version.empty() || version == syntax::XML_FEATURE_V1 || version == syntax::XML_FEATURE_V2;
  return knownFeature && knownVersion;
}

} // namespace dom
} // namespace xdom
