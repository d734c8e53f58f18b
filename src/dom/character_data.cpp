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
DomResult notCharacterData(const char *operation, NodeType type)
{
  XDOM_LOG_WARN(operation << ": " << MSG_INVALID_NODE_TYPE << " (" << type << ")");
  return DomResult::failure(DomError::Syntax, MSG_INVALID_NODE_TYPE);
}

DomResult indexError(const char *operation, std::size_t offset, std::size_t count)
{
  XDOM_LOG_WARN(operation << ": " << MSG_INDEX_ERROR << " (offset " << offset << ", count "
                          << count << ")");
  return DomResult::failure(DomError::IndexSize, MSG_INDEX_ERROR);
}
} // namespace

std::size_t RefNode::length() const
{
  auto impl = borrow();
  if (!isCharacterDataType(impl->nodeType) && impl->nodeType != NodeType::ProcessingInstruction)
  {
    notCharacterData("length", impl->nodeType);
    return 0;
  }
  return impl->value ? impl->value->size() : 0;
}

// length(), data(), setData() and unsetData() also serve ProcessingInstruction.
std::optional<std::string> RefNode::data() const
{
  auto impl = borrow();
  if (!isCharacterDataType(impl->nodeType) && impl->nodeType != NodeType::ProcessingInstruction)
  {
    notCharacterData("data", impl->nodeType);
    return std::nullopt;
  }
  return impl->value;
}

DomResult RefNode::setData(const std::string &data)
{
  auto impl = borrowMut();
  if (!isCharacterDataType(impl->nodeType) && impl->nodeType != NodeType::ProcessingInstruction)
  {
    return notCharacterData("setData", impl->nodeType);
  }
  impl->value = data;
  return DomResult::success();
}

DomResult RefNode::unsetData()
{
  auto impl = borrowMut();
  if (!isCharacterDataType(impl->nodeType) && impl->nodeType != NodeType::ProcessingInstruction)
  {
    return notCharacterData("unsetData", impl->nodeType);
  }
  impl->value.reset();
  return DomResult::success();
}

Result<std::string> RefNode::substring(std::size_t offset, std::size_t count) const
{
  auto impl = borrow();
  if (!isCharacterDataType(impl->nodeType))
  {
    return Result<std::string>::failure(notCharacterData("substring", impl->nodeType));
  }
  if (count == 0)
  {
    return Result<std::string>::success("");
  }
  if (!impl->value || offset >= impl->value->size())
  {
    return Result<std::string>::failure(indexError("substring", offset, count));
  }

  const std::string &value = *impl->value;
  if (count >= value.size() - offset)
  {
    return Result<std::string>::success(value.substr(offset));
  }
  return Result<std::string>::success(value.substr(offset, count));
}

DomResult RefNode::append(const std::string &data)
{
  auto impl = borrowMut();
  if (!isCharacterDataType(impl->nodeType))
  {
    return notCharacterData("append", impl->nodeType);
  }
  if (data.empty())
  {
    return DomResult::success();
  }
  impl->value = impl->value.value_or("") + data;
  return DomResult::success();
}

DomResult RefNode::insert(std::size_t offset, const std::string &data)
{
  if (!isCharacterDataType(nodeType()))
  {
    return notCharacterData("insert", nodeType());
  }
  if (data.empty())
  {
    return DomResult::success();
  }
  return replace(offset, 0, data);
}

DomResult RefNode::remove(std::size_t offset, std::size_t count)
{
  if (!isCharacterDataType(nodeType()))
  {
    return notCharacterData("remove", nodeType());
  }
  if (count == 0)
  {
    return DomResult::success();
  }
  return replace(offset, count, "");
}

DomResult RefNode::replace(std::size_t offset, std::size_t count, const std::string &data)
{
  auto impl = borrowMut();
  if (!isCharacterDataType(impl->nodeType))
  {
    return notCharacterData("replace", impl->nodeType);
  }

  // Without content only the empty range at 0 can be replaced.
  if (!impl->value || impl->value->empty())
  {
    if (offset != 0 || count != 0)
    {
      return indexError("replace", offset, count);
    }
    impl->value = data;
    return DomResult::success();
  }

  std::string &value = *impl->value;
  if (offset >= value.size())
  {
    return indexError("replace", offset, count);
  }
  std::size_t span = std::min(count, value.size() - offset);
  value.replace(offset, span, data);
  return DomResult::success();
}

Result<RefNode> RefNode::split(std::size_t offset)
{
  NodeType type = nodeType();
  if (type != NodeType::Text && type != NodeType::CData)
  {
    return Result<RefNode>::failure(notCharacterData("split", type));
  }

  std::string tail;
  {
    auto impl = borrowMut();
    std::string value = impl->value.value_or("");
    if (offset < value.size())
    {
      tail = value.substr(offset);
      impl->value = value.substr(0, offset);
    }
  }

  RefNode created =
    makeNode(NodeImpl(type, type == NodeType::Text ? Name::forText() : Name::forCData(), tail),
             ownerDocument());

  if (auto parent = parentNode())
  {
    auto inserted = parent->insertBefore(created, nextSibling());
    if (!inserted)
    {
      return inserted;
    }
  }
  return Result<RefNode>::success(created);
}

} // namespace dom
} // namespace xdom
