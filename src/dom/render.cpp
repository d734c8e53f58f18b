// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xdom, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#include <xdom/dom/render.hpp>

#include <xdom/dom/node_impl.hpp>
#include <xdom/dom/syntax.hpp>

#include <algorithm>
#include <sstream>

namespace xdom
{
namespace dom
{

namespace
{
bool cdataPadding(const RefNode &node)
{
  auto document = node.ownerDocument();
  return document && document->implementation().options().cdataPadding;
}

void renderChildren(std::ostream &os, const RefNode &node)
{
  for (const auto &child : node.childNodes())
  {
    render(os, child);
  }
}

void renderAttribute(std::ostream &os, const RefNode &attribute)
{
  os << attribute.nodeName() << "=\"" << attribute.nodeValue().value_or("") << "\"";
}

void renderElement(std::ostream &os, const RefNode &element)
{
  std::vector<std::pair<Name, RefNode>> attributes;
  for (const auto &entry : element.attributes())
  {
    attributes.emplace_back(entry.first, entry.second);
  }
  std::sort(attributes.begin(), attributes.end(),
            [](const auto &a, const auto &b) { return a.first < b.first; });

  std::string name = element.nodeName();
  os << syntax::XML_ELEMENT_START_START << name;
  for (const auto &entry : attributes)
  {
    os << ' ';
    renderAttribute(os, entry.second);
  }
  os << syntax::XML_ELEMENT_START_END;
  renderChildren(os, element);
  os << syntax::XML_ELEMENT_END_START << name << syntax::XML_ELEMENT_END_END;
}

void renderDocumentType(std::ostream &os, const RefNode &docType)
{
  os << syntax::XML_DOCTYPE_START << ' ' << docType.nodeName();
  if (auto publicId = docType.publicId())
  {
    os << ' ' << syntax::XML_DOCTYPE_PUBLIC << " \"" << *publicId << "\"";
  }
  if (auto systemId = docType.systemId())
  {
    os << ' ' << syntax::XML_DOCTYPE_SYSTEM << " \"" << *systemId << "\"";
  }
  if (auto subset = docType.internalSubset())
  {
    os << " [" << *subset << "]";
  }
  os << syntax::XML_DOCTYPE_END;
}
} // namespace

void render(std::ostream &os, const RefNode &node)
{
  auto value = node.nodeValue();
  switch (node.nodeType())
  {
  case NodeType::Element:
    renderElement(os, node);
    break;
  case NodeType::Attribute:
    renderAttribute(os, node);
    break;
  case NodeType::Text:
    if (value)
    {
      os << *value;
    }
    break;
  case NodeType::CData:
    if (value)
    {
      const char *pad = cdataPadding(node) ? " " : "";
      os << syntax::XML_CDATA_START << pad << *value << pad << syntax::XML_CDATA_END;
    }
    break;
  case NodeType::EntityReference:
    os << syntax::XML_ENTITY_REF_START << node.nodeName() << syntax::XML_ENTITY_REF_END;
    break;
  case NodeType::ProcessingInstruction:
    os << syntax::XML_PI_START << node.nodeName();
    if (value)
    {
      os << ' ' << *value;
    }
    os << syntax::XML_PI_END;
    break;
  case NodeType::Comment:
    if (value)
    {
      os << syntax::XML_COMMENT_START << *value << syntax::XML_COMMENT_END;
    }
    break;
  case NodeType::Document:
    if (auto docType = node.docType())
    {
      render(os, *docType);
    }
    renderChildren(os, node);
    if (auto root = node.documentElement())
    {
      render(os, *root);
    }
    break;
  case NodeType::DocumentType:
    renderDocumentType(os, node);
    break;
  case NodeType::DocumentFragment:
    renderChildren(os, node);
    break;
  case NodeType::Entity:
  case NodeType::Notation:
    break;
  }
}

std::string render(const RefNode &node)
{
  std::ostringstream os;
  render(os, node);
  return os.str();
}

std::string RefNode::toString() const { return render(*this); }

std::ostream &operator<<(std::ostream &os, const RefNode &node)
{
  render(os, node);
  return os;
}

} // namespace dom
} // namespace xdom
