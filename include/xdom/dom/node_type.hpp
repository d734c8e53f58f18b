// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xdom, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <ostream>

namespace xdom
{
namespace dom
{

/// \brief Node kinds, numbered as in DOM Core.
enum class NodeType
{
  Element = 1,
  Attribute = 2,
  Text = 3,
  CData = 4,
  EntityReference = 5,
  Entity = 6,
  ProcessingInstruction = 7,
  Comment = 8,
  Document = 9,
  DocumentType = 10,
  DocumentFragment = 11,
  Notation = 12
};

const char *nodeTypeToString(NodeType type);

inline std::ostream &operator<<(std::ostream &os, NodeType type)
{
  return os << nodeTypeToString(type);
}

/// \brief Child-allowance table: may a node of kind \p child be placed under
/// a node of kind \p parent?
bool isChildAllowed(NodeType parent, NodeType child);

/// \brief Text, CData and Comment.
inline bool isCharacterDataType(NodeType type)
{
  return type == NodeType::Text || type == NodeType::CData || type == NodeType::Comment;
}

} // namespace dom
} // namespace xdom
