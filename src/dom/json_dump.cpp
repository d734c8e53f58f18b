// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xdom, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#include <xdom/dom/json_dump.hpp>

#include <xdom/dom/node_impl.hpp>

namespace xdom
{
namespace dom
{

namespace
{
void putOptional(Json &out, const char *key, const std::optional<std::string> &value)
{
  if (value)
  {
    out[key] = *value;
  }
}

Json mapToJson(const NamedNodeMap &nodes)
{
  Json out = Json::object();
  for (const auto &entry : nodes)
  {
    out[entry.first.toString()] = toJson(entry.second);
  }
  return out;
}
} // namespace

Json toJson(const RefNode &node)
{
  NodeType type = node.nodeType();
  Json out;
  out["type"] = nodeTypeToString(type);
  out["name"] = node.nodeName();
  putOptional(out, "value", node.nodeValue());
  putOptional(out, "namespaceUri", node.namespaceUri());

  switch (type)
  {
  case NodeType::Element:
  {
    Json attributes = Json::object();
    for (const auto &entry : node.attributes())
    {
      attributes[entry.first.toString()] = entry.second.nodeValue().value_or("");
    }
    out["attributes"] = attributes;
    break;
  }
  case NodeType::Document:
  {
    auto docType = node.docType();
    auto root = node.documentElement();
    out["docType"] = docType ? toJson(*docType) : Json();
    out["documentElement"] = root ? toJson(*root) : Json();
    break;
  }
  case NodeType::DocumentType:
    putOptional(out, "publicId", node.publicId());
    putOptional(out, "systemId", node.systemId());
    putOptional(out, "internalSubset", node.internalSubset());
    out["entities"] = mapToJson(node.entities());
    out["notations"] = mapToJson(node.notations());
    break;
  case NodeType::Entity:
    putOptional(out, "publicId", node.publicId());
    putOptional(out, "systemId", node.systemId());
    putOptional(out, "notationName", node.notationName());
    break;
  case NodeType::Notation:
    putOptional(out, "publicId", node.publicId());
    putOptional(out, "systemId", node.systemId());
    break;
  default:
    break;
  }

  Json children = Json::array();
  for (const auto &child : node.childNodes())
  {
    children.push_back(toJson(child));
  }
  out["children"] = children;
  return out;
}

} // namespace dom
} // namespace xdom
