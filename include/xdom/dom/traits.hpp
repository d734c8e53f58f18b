// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xdom, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <xdom/dom/error.hpp>
#include <xdom/dom/name.hpp>
#include <xdom/dom/node_type.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

/// \file traits.hpp
/// \brief DOM Core capability interfaces.
///
/// Every interface is implemented by the single handle class RefNode. A call
/// through an interface that does not match the node's kind is a soft
/// violation: it is logged and returns an empty/false/zero default, or a
/// failed Result where the operation returns one.

namespace xdom
{
namespace dom
{

class RefNode;
class DomImplementation;

using NodeList = std::vector<RefNode>;
using NamedNodeMap = std::unordered_map<Name, RefNode>;
using NamespaceMap = std::unordered_map<std::optional<std::string>, std::string>;

/// \brief Operations shared by every node kind.
class Node
{
public:
  virtual ~Node() = default;

  virtual Name name() const = 0;
  virtual std::string nodeName() const = 0;
  virtual std::optional<std::string> nodeValue() const = 0;
  virtual DomResult setNodeValue(const std::string &value) = 0;
  virtual DomResult unsetNodeValue() = 0;
  virtual NodeType nodeType() const = 0;

  virtual std::optional<std::string> namespaceUri() const = 0;
  virtual std::optional<std::string> prefix() const = 0;
  virtual std::string localName() const = 0;

  virtual std::optional<RefNode> parentNode() const = 0;
  virtual NodeList childNodes() const = 0;
  virtual std::optional<RefNode> firstChild() const = 0;
  virtual std::optional<RefNode> lastChild() const = 0;
  virtual std::optional<RefNode> previousSibling() const = 0;
  virtual std::optional<RefNode> nextSibling() const = 0;
  virtual NamedNodeMap attributes() const = 0;
  virtual std::optional<RefNode> ownerDocument() const = 0;

  /// \brief Inserts \p newChild before \p refChild, or appends it when
  /// \p refChild is empty or not a child of this node.
  virtual Result<RefNode> insertBefore(const RefNode &newChild,
                                       const std::optional<RefNode> &refChild) = 0;
  /// \brief Puts \p newChild in the position of \p oldChild and returns
  /// \p oldChild detached.
  virtual Result<RefNode> replaceChild(const RefNode &newChild, const RefNode &oldChild) = 0;
  virtual Result<RefNode> removeChild(const RefNode &oldChild) = 0;
  virtual Result<RefNode> appendChild(const RefNode &newChild) = 0;

  virtual bool hasChildNodes() const = 0;
  virtual bool hasAttributes() const = 0;
  virtual Result<RefNode> cloneNode(bool deep) const = 0;

  /// \brief Merges adjacent Text nodes and drops empty ones in this subtree.
  virtual void normalize() = 0;
  virtual bool isSupported(const std::string &feature, const std::string &version) const = 0;
};

/// \brief DOM `Attr`.
class Attribute : public virtual Node
{
public:
  /// \brief Always true; no schema supplies default values.
  virtual bool specified() const = 0;
  virtual std::optional<std::string> value() const = 0;
  virtual DomResult setValue(const std::string &value) = 0;
  virtual DomResult unsetValue() = 0;
  virtual std::optional<RefNode> ownerElement() const = 0;
};

/// \brief Character content shared by Text, CDATA sections and comments.
/// Offsets and counts are in bytes of the UTF-8 value.
class CharacterData : public virtual Node
{
public:
  virtual std::size_t length() const = 0;
  virtual std::optional<std::string> data() const = 0;
  virtual DomResult setData(const std::string &data) = 0;
  virtual DomResult unsetData() = 0;
  virtual Result<std::string> substring(std::size_t offset, std::size_t count) const = 0;
  virtual DomResult append(const std::string &data) = 0;
  virtual DomResult insert(std::size_t offset, const std::string &data) = 0;
  /// \brief DOM `deleteData`.
  virtual DomResult remove(std::size_t offset, std::size_t count) = 0;
  virtual DomResult replace(std::size_t offset, std::size_t count, const std::string &data) = 0;
};

class Text : public virtual CharacterData
{
public:
  /// \brief Moves the content from \p offset on into a new sibling node of
  /// the same kind and returns it.
  virtual Result<RefNode> split(std::size_t offset) = 0;
};

class CDataSection : public virtual Text
{
};

class Comment : public virtual CharacterData
{
};

class ProcessingInstruction : public virtual Node
{
public:
  virtual std::string target() const = 0;
  virtual std::size_t length() const = 0;
  virtual std::optional<std::string> data() const = 0;
  virtual DomResult setData(const std::string &data) = 0;
  virtual DomResult unsetData() = 0;
};

class Document : public virtual Node
{
public:
  virtual std::optional<RefNode> docType() const = 0;
  virtual std::optional<RefNode> documentElement() const = 0;
  virtual DomImplementation implementation() const = 0;

  virtual Result<RefNode> createElement(const std::string &tagName) = 0;
  virtual Result<RefNode> createElementNs(const std::string &namespaceUri,
                                          const std::string &qualifiedName) = 0;
  virtual Result<RefNode> createAttribute(const std::string &name) = 0;
  virtual Result<RefNode> createAttributeWith(const std::string &name,
                                              const std::string &value) = 0;
  virtual Result<RefNode> createAttributeNs(const std::string &namespaceUri,
                                            const std::string &qualifiedName) = 0;
  virtual Result<RefNode> createTextNode(const std::string &data) = 0;
  virtual Result<RefNode> createComment(const std::string &data) = 0;
  virtual Result<RefNode> createCDataSection(const std::string &data) = 0;
  virtual Result<RefNode> createDocumentFragment() = 0;
  virtual Result<RefNode> createEntityReference(const std::string &name) = 0;
  virtual Result<RefNode> createProcessingInstruction(const std::string &target,
                                                      const std::optional<std::string> &data) = 0;
  /// \brief Builds a detached Entity for registration with
  /// DocumentType::addEntity().
  virtual Result<RefNode> createEntity(const std::string &name,
                                       const std::optional<std::string> &publicId,
                                       const std::optional<std::string> &systemId,
                                       const std::optional<std::string> &notationName) = 0;
  virtual Result<RefNode> createNotation(const std::string &name,
                                         const std::optional<std::string> &publicId,
                                         const std::optional<std::string> &systemId) = 0;

  virtual NodeList getElementsByTagName(const std::string &tagName) const = 0;
  virtual NodeList getElementsByTagNameNs(const std::string &namespaceUri,
                                          const std::string &localName) const = 0;
  /// \brief Always empty: without a schema no attribute is known to be an ID.
  virtual std::optional<RefNode> getElementById(const std::string &id) const = 0;
};

class DocumentType : public virtual Node
{
public:
  virtual std::optional<std::string> publicId() const = 0;
  virtual std::optional<std::string> systemId() const = 0;
  virtual std::optional<std::string> internalSubset() const = 0;
  virtual NamedNodeMap entities() const = 0;
  virtual NamedNodeMap notations() const = 0;
  virtual DomResult addEntity(const RefNode &entity) = 0;
  virtual DomResult addNotation(const RefNode &notation) = 0;
};

class DocumentFragment : public virtual Node
{
};

class Element : public virtual Node
{
public:
  virtual std::string tagName() const = 0;

  virtual std::optional<std::string> getAttribute(const std::string &name) const = 0;
  virtual std::optional<std::string> getAttributeNs(const std::string &namespaceUri,
                                                    const std::string &localName) const = 0;
  virtual DomResult setAttribute(const std::string &name, const std::string &value) = 0;
  virtual DomResult setAttributeNs(const std::string &namespaceUri,
                                   const std::string &qualifiedName,
                                   const std::string &value) = 0;
  virtual DomResult removeAttribute(const std::string &name) = 0;
  virtual DomResult removeAttributeNs(const std::string &namespaceUri,
                                      const std::string &localName) = 0;

  virtual std::optional<RefNode> getAttributeNode(const std::string &name) const = 0;
  virtual std::optional<RefNode> getAttributeNodeNs(const std::string &namespaceUri,
                                                    const std::string &localName) const = 0;
  /// \brief Stores \p attribute under its name, replacing any attribute of
  /// the same name. Namespace declarations also update the prefix mapping.
  virtual Result<RefNode> setAttributeNode(const RefNode &attribute) = 0;
  virtual Result<RefNode> setAttributeNodeNs(const RefNode &attribute) = 0;
  virtual Result<RefNode> removeAttributeNode(const RefNode &attribute) = 0;

  virtual bool hasAttribute(const std::string &name) const = 0;
  virtual bool hasAttributeNs(const std::string &namespaceUri,
                              const std::string &localName) const = 0;

  /// \brief Pre-order search of this element and its descendants.
  virtual NodeList getElementsByTagName(const std::string &tagName) const = 0;
  virtual NodeList getElementsByTagNameNs(const std::string &namespaceUri,
                                          const std::string &localName) const = 0;
};

/// \brief Prefix to namespace URI bindings declared on an element. An empty
/// prefix stands for the default namespace.
class NamespacedElement : public virtual Element
{
public:
  virtual DomResult insertMapping(const std::optional<std::string> &prefix,
                                  const std::string &namespaceUri) = 0;
  virtual std::optional<std::string> removeMapping(const std::optional<std::string> &prefix) = 0;
  /// \brief Binding declared on this element only.
  virtual std::optional<std::string> getMapping(const std::optional<std::string> &prefix) const = 0;
  /// \brief Binding in scope, searching this element then its ancestors.
  virtual std::optional<std::string>
  lookupNamespaceUri(const std::optional<std::string> &prefix) const = 0;
  virtual std::optional<std::string> lookupPrefix(const std::string &namespaceUri) const = 0;
  virtual NamespaceMap mappings() const = 0;
};

class Entity : public virtual Node
{
public:
  virtual std::optional<std::string> publicId() const = 0;
  virtual std::optional<std::string> systemId() const = 0;
  virtual std::optional<std::string> notationName() const = 0;
};

class EntityReference : public virtual Node
{
};

class Notation : public virtual Node
{
public:
  virtual std::optional<std::string> publicId() const = 0;
  virtual std::optional<std::string> systemId() const = 0;
};

} // namespace dom
} // namespace xdom
