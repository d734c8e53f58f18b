// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xdom, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <xdom/dom/rc_cell.hpp>
#include <xdom/dom/traits.hpp>

#include <functional>
#include <optional>
#include <ostream>
#include <string>

namespace xdom
{
namespace dom
{

struct NodeImpl;

using WeakRefNode = WeakCell<NodeImpl>;

/// \brief Strong handle to a node; the one implementation of every
/// capability interface.
///
/// Copying a RefNode shares the node. Equality and hashing are by identity.
/// Interface methods check the node kind at run time and fall back to the
/// soft-violation defaults described in traits.hpp.
///
/// Each copy carries one vptr per capability interface next to its
/// shared_ptr, so a NodeList or NamedNodeMap entry is several pointers wide.
/// Hold lists briefly and pass handles by const reference.
class RefNode final : public virtual CDataSection,
                      public virtual Comment,
                      public virtual ProcessingInstruction,
                      public virtual Attribute,
                      public virtual Document,
                      public virtual DocumentType,
                      public virtual DocumentFragment,
                      public virtual NamespacedElement,
                      public virtual Entity,
                      public virtual EntityReference,
                      public virtual Notation
{
public:
  explicit RefNode(RcCell<NodeImpl> cell);
  RefNode(const RefNode &other);
  RefNode &operator=(const RefNode &other);
  ~RefNode() override;

  /// \throws BorrowError on a conflicting borrow of the same node.
  RcCell<NodeImpl>::Ref borrow() const;
  RcCell<NodeImpl>::RefMut borrowMut() const;
  WeakRefNode downgrade() const { return _cell.downgrade(); }
  const RcCell<NodeImpl> &cell() const { return _cell; }

  bool operator==(const RefNode &other) const { return _cell == other._cell; }
  bool operator!=(const RefNode &other) const { return _cell != other._cell; }

  /// \brief Diagnostic markup rendering of this node and its subtree.
  std::string toString() const;

  // Node
  Name name() const override;
  std::string nodeName() const override;
  std::optional<std::string> nodeValue() const override;
  DomResult setNodeValue(const std::string &value) override;
  DomResult unsetNodeValue() override;
  NodeType nodeType() const override;
  std::optional<std::string> namespaceUri() const override;
  std::optional<std::string> prefix() const override;
  std::string localName() const override;
  std::optional<RefNode> parentNode() const override;
  NodeList childNodes() const override;
  std::optional<RefNode> firstChild() const override;
  std::optional<RefNode> lastChild() const override;
  std::optional<RefNode> previousSibling() const override;
  std::optional<RefNode> nextSibling() const override;
  NamedNodeMap attributes() const override;
  std::optional<RefNode> ownerDocument() const override;
  Result<RefNode> insertBefore(const RefNode &newChild,
                               const std::optional<RefNode> &refChild) override;
  Result<RefNode> replaceChild(const RefNode &newChild, const RefNode &oldChild) override;
  Result<RefNode> removeChild(const RefNode &oldChild) override;
  Result<RefNode> appendChild(const RefNode &newChild) override;
  bool hasChildNodes() const override;
  bool hasAttributes() const override;
  Result<RefNode> cloneNode(bool deep) const override;
  void normalize() override;
  bool isSupported(const std::string &feature, const std::string &version) const override;

  // Attribute
  bool specified() const override;
  std::optional<std::string> value() const override;
  DomResult setValue(const std::string &value) override;
  DomResult unsetValue() override;
  std::optional<RefNode> ownerElement() const override;

  // CharacterData, with length()/data()/setData()/unsetData() shared by ProcessingInstruction
  std::size_t length() const override;
  std::optional<std::string> data() const override;
  DomResult setData(const std::string &data) override;
  DomResult unsetData() override;
  Result<std::string> substring(std::size_t offset, std::size_t count) const override;
  DomResult append(const std::string &data) override;
  DomResult insert(std::size_t offset, const std::string &data) override;
  DomResult remove(std::size_t offset, std::size_t count) override;
  DomResult replace(std::size_t offset, std::size_t count, const std::string &data) override;

  // Text
  Result<RefNode> split(std::size_t offset) override;

  // ProcessingInstruction
  std::string target() const override;

  // Document
  std::optional<RefNode> docType() const override;
  std::optional<RefNode> documentElement() const override;
  DomImplementation implementation() const override;
  Result<RefNode> createElement(const std::string &tagName) override;
  Result<RefNode> createElementNs(const std::string &namespaceUri,
                                  const std::string &qualifiedName) override;
  Result<RefNode> createAttribute(const std::string &name) override;
  Result<RefNode> createAttributeWith(const std::string &name, const std::string &value) override;
  Result<RefNode> createAttributeNs(const std::string &namespaceUri,
                                    const std::string &qualifiedName) override;
  Result<RefNode> createTextNode(const std::string &data) override;
  Result<RefNode> createComment(const std::string &data) override;
  Result<RefNode> createCDataSection(const std::string &data) override;
  Result<RefNode> createDocumentFragment() override;
  Result<RefNode> createEntityReference(const std::string &name) override;
  Result<RefNode> createProcessingInstruction(const std::string &target,
                                              const std::optional<std::string> &data) override;
  Result<RefNode> createEntity(const std::string &name, const std::optional<std::string> &publicId,
                               const std::optional<std::string> &systemId,
                               const std::optional<std::string> &notationName) override;
  Result<RefNode> createNotation(const std::string &name,
                                 const std::optional<std::string> &publicId,
                                 const std::optional<std::string> &systemId) override;
  std::optional<RefNode> getElementById(const std::string &id) const override;

  // Document and Element
  NodeList getElementsByTagName(const std::string &tagName) const override;
  NodeList getElementsByTagNameNs(const std::string &namespaceUri,
                                  const std::string &localName) const override;

  // DocumentType, Entity and Notation
  std::optional<std::string> publicId() const override;
  std::optional<std::string> systemId() const override;
  std::optional<std::string> internalSubset() const override;
  NamedNodeMap entities() const override;
  NamedNodeMap notations() const override;
  DomResult addEntity(const RefNode &entity) override;
  DomResult addNotation(const RefNode &notation) override;
  std::optional<std::string> notationName() const override;

  // Element
  std::string tagName() const override;
  std::optional<std::string> getAttribute(const std::string &name) const override;
  std::optional<std::string> getAttributeNs(const std::string &namespaceUri,
                                            const std::string &localName) const override;
  DomResult setAttribute(const std::string &name, const std::string &value) override;
  DomResult setAttributeNs(const std::string &namespaceUri, const std::string &qualifiedName,
                           const std::string &value) override;
  DomResult removeAttribute(const std::string &name) override;
  DomResult removeAttributeNs(const std::string &namespaceUri,
                              const std::string &localName) override;
  std::optional<RefNode> getAttributeNode(const std::string &name) const override;
  std::optional<RefNode> getAttributeNodeNs(const std::string &namespaceUri,
                                            const std::string &localName) const override;
  Result<RefNode> setAttributeNode(const RefNode &attribute) override;
  Result<RefNode> setAttributeNodeNs(const RefNode &attribute) override;
  Result<RefNode> removeAttributeNode(const RefNode &attribute) override;
  bool hasAttribute(const std::string &name) const override;
  bool hasAttributeNs(const std::string &namespaceUri,
                      const std::string &localName) const override;

  // NamespacedElement
  DomResult insertMapping(const std::optional<std::string> &prefix,
                          const std::string &namespaceUri) override;
  std::optional<std::string> removeMapping(const std::optional<std::string> &prefix) override;
  std::optional<std::string> getMapping(const std::optional<std::string> &prefix) const override;
  std::optional<std::string>
  lookupNamespaceUri(const std::optional<std::string> &prefix) const override;
  std::optional<std::string> lookupPrefix(const std::string &namespaceUri) const override;
  NamespaceMap mappings() const override;

private:
  RcCell<NodeImpl> _cell;
};

std::ostream &operator<<(std::ostream &os, const RefNode &node);

/// \brief Strong handle for a weak reference, or nothing if the node is gone.
std::optional<RefNode> upgrade(const WeakRefNode &weak);

} // namespace dom
} // namespace xdom

namespace std
{
template <> struct hash<xdom::dom::RefNode>
{
  std::size_t operator()(const xdom::dom::RefNode &node) const
  {
    return node.cell().identityHash();
  }
};
} // namespace std
