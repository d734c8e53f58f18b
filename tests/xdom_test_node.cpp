// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xdom, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "test_helpers.hpp"

using namespace xdom::dom;
using xdom::test::LogCapture;
using xdom::test::namesOf;
using xdom::test::newDocument;
using xdom::test::rootOf;
using xdom::test::unwrap;

using Names = std::vector<std::string>;

TEST_CASE("Appending children", "[dom][node][tree]")
{
  auto document = newDocument();
  auto root = rootOf(document);

  SECTION("Sets parent and owner document")
  {
    auto child = unwrap(document.createElement("child"));
    REQUIRE_FALSE(child.parentNode().has_value());
    REQUIRE(child.ownerDocument() == document);

    auto appended = unwrap(root.appendChild(child));
    REQUIRE(appended == child);
    REQUIRE(child.parentNode() == root);
    REQUIRE(root.hasChildNodes());
    REQUIRE(root.firstChild() == child);
    REQUIRE(root.lastChild() == child);
  }

  SECTION("Disallowed kinds leave both nodes untouched")
  {
    auto text = unwrap(document.createTextNode("x"));
    auto other = unwrap(document.createComment("c"));
    unwrap(root.appendChild(other));

    auto status = text.appendChild(other);
    REQUIRE(status.error == DomError::HierarchyRequest);
    REQUIRE_FALSE(text.hasChildNodes());
    REQUIRE(other.parentNode() == root);

    REQUIRE(document.appendChild(text).error == DomError::HierarchyRequest);
    REQUIRE_FALSE(text.parentNode().has_value());
  }

  SECTION("Attributes are never children")
  {
    auto attribute = unwrap(document.createAttribute("a"));
    REQUIRE(root.appendChild(attribute).error == DomError::HierarchyRequest);
  }

  SECTION("A node cannot become its own descendant")
  {
    auto parent = unwrap(document.createElement("parent"));
    auto child = unwrap(document.createElement("child"));
    unwrap(root.appendChild(parent));
    unwrap(parent.appendChild(child));

    REQUIRE(parent.appendChild(parent).error == DomError::HierarchyRequest);
    REQUIRE(child.appendChild(parent).error == DomError::HierarchyRequest);
    REQUIRE(child.appendChild(root).error == DomError::HierarchyRequest);
    REQUIRE(parent.parentNode() == root);
  }

  SECTION("Nodes from another document are rejected")
  {
    auto other = newDocument("other");
    auto foreign = unwrap(other.createElement("foreign"));
    LogCapture capture;
    REQUIRE(root.appendChild(foreign).error == DomError::WrongDocument);
    REQUIRE_FALSE(foreign.parentNode().has_value());
    REQUIRE(capture.contains("different document"));
  }

  SECTION("Appending again moves the node")
  {
    auto first = unwrap(document.createElement("first"));
    auto second = unwrap(document.createElement("second"));
    auto moving = unwrap(document.createElement("moving"));
    unwrap(root.appendChild(first));
    unwrap(root.appendChild(second));
    unwrap(first.appendChild(moving));

    unwrap(second.appendChild(moving));
    REQUIRE(moving.parentNode() == second);
    REQUIRE_FALSE(first.hasChildNodes());
    REQUIRE(second.childNodes().size() == 1);
  }
}

TEST_CASE("Document slots", "[dom][node][document]")
{
  auto document = newDocument();
  auto root = rootOf(document);

  SECTION("The document element lives in its slot")
  {
    REQUIRE(root.parentNode() == document);
    REQUIRE(document.childNodes().empty());

    auto comment = unwrap(document.createComment("prolog"));
    unwrap(document.appendChild(comment));
    REQUIRE(document.childNodes().size() == 1);
    REQUIRE(document.documentElement() == root);
  }

  SECTION("Only one document element")
  {
    auto second = unwrap(document.createElement("second"));
    REQUIRE(document.appendChild(second).error == DomError::HierarchyRequest);
    REQUIRE(document.documentElement() == root);
  }

  SECTION("Removing frees the slot")
  {
    unwrap(document.removeChild(root));
    REQUIRE_FALSE(document.documentElement().has_value());
    REQUIRE_FALSE(root.parentNode().has_value());

    auto replacement = unwrap(document.createElement("replacement"));
    unwrap(document.appendChild(replacement));
    REQUIRE(document.documentElement() == replacement);
  }

  SECTION("Replacing the document element")
  {
    auto replacement = unwrap(document.createElement("replacement"));
    auto old = unwrap(document.replaceChild(replacement, root));
    REQUIRE(old == root);
    REQUIRE(document.documentElement() == replacement);
    REQUIRE_FALSE(root.parentNode().has_value());
  }
}

TEST_CASE("Siblings", "[dom][node][tree]")
{
  auto document = newDocument();
  auto root = rootOf(document);
  NodeList children;
  for (int i = 1; i <= 5; ++i)
  {
    auto child = unwrap(document.createElement("c" + std::to_string(i)));
    unwrap(root.appendChild(child));
    children.push_back(child);
  }

  REQUIRE(namesOf(root.childNodes()) == Names{"c1", "c2", "c3", "c4", "c5"});
  REQUIRE(root.firstChild() == children[0]);
  REQUIRE(root.lastChild() == children[4]);
  REQUIRE(children[2].previousSibling() == children[1]);
  REQUIRE(children[2].nextSibling() == children[3]);
  REQUIRE_FALSE(children[0].previousSibling().has_value());
  REQUIRE_FALSE(children[4].nextSibling().has_value());

  SECTION("Detached nodes have no siblings and log no warning")
  {
    auto loose = unwrap(document.createElement("loose"));
    LogCapture capture;
    REQUIRE_FALSE(loose.nextSibling().has_value());
    REQUIRE_FALSE(loose.previousSibling().has_value());
    REQUIRE(capture.count() == 0);
  }
}

TEST_CASE("Inserting and replacing", "[dom][node][tree]")
{
  auto document = newDocument();
  auto root = rootOf(document);
  auto a = unwrap(document.createElement("a"));
  auto b = unwrap(document.createElement("b"));
  auto c = unwrap(document.createElement("c"));
  unwrap(root.appendChild(a));
  unwrap(root.appendChild(c));

  SECTION("insertBefore places the node ahead of the reference")
  {
    unwrap(root.insertBefore(b, c));
    REQUIRE(namesOf(root.childNodes()) == Names{"a", "b", "c"});
  }

  SECTION("insertBefore without a reference appends")
  {
    unwrap(root.insertBefore(b, std::nullopt));
    REQUIRE(namesOf(root.childNodes()) == Names{"a", "c", "b"});
  }

  SECTION("insertBefore moves an existing child")
  {
    unwrap(root.insertBefore(c, a));
    REQUIRE(namesOf(root.childNodes()) == Names{"c", "a"});
  }

  SECTION("insertBefore with itself as reference keeps the order")
  {
    unwrap(root.insertBefore(a, a));
    REQUIRE(namesOf(root.childNodes()) == Names{"a", "c"});
  }

  SECTION("replaceChild returns the old child")
  {
    auto old = unwrap(root.replaceChild(b, a));
    REQUIRE(old == a);
    REQUIRE_FALSE(a.parentNode().has_value());
    REQUIRE(namesOf(root.childNodes()) == Names{"b", "c"});
  }

  SECTION("replaceChild with a sibling")
  {
    unwrap(root.replaceChild(c, a));
    REQUIRE(namesOf(root.childNodes()) == Names{"c"});
  }

  SECTION("Operations on non-children")
  {
    REQUIRE(root.replaceChild(a, b).error == DomError::NotFound);
    REQUIRE(root.removeChild(b).error == DomError::NotFound);
    REQUIRE(a.removeChild(c).error == DomError::NotFound);
    REQUIRE(namesOf(root.childNodes()) == Names{"a", "c"});
  }

  SECTION("removeChild detaches")
  {
    auto removed = unwrap(root.removeChild(a));
    REQUIRE(removed == a);
    REQUIRE_FALSE(a.parentNode().has_value());
    REQUIRE(a.ownerDocument() == document);
    REQUIRE(namesOf(root.childNodes()) == Names{"c"});
  }
}

TEST_CASE("Document fragments", "[dom][node][fragment]")
{
  auto document = newDocument();
  auto root = rootOf(document);
  auto fragment = unwrap(document.createDocumentFragment());
  unwrap(fragment.appendChild(unwrap(document.createElement("x"))));
  unwrap(fragment.appendChild(unwrap(document.createTextNode("y"))));
  unwrap(fragment.appendChild(unwrap(document.createElement("z"))));

  SECTION("Children move and the fragment empties")
  {
    auto first = unwrap(document.createElement("first"));
    unwrap(root.appendChild(first));
    unwrap(root.insertBefore(fragment, first));
    REQUIRE(namesOf(root.childNodes()) == Names{"x", "#text", "z", "first"});
    REQUIRE_FALSE(fragment.hasChildNodes());
    for (const auto &child : root.childNodes())
    {
      REQUIRE(child.parentNode() == root);
    }
  }

  SECTION("Invalid content leaves everything in place")
  {
    REQUIRE(document.appendChild(fragment).error == DomError::HierarchyRequest);
    REQUIRE(fragment.childNodes().size() == 3);
    REQUIRE(document.documentElement() == root);
  }
}

TEST_CASE("Cloning", "[dom][node][clone]")
{
  auto document = newDocument();
  auto root = rootOf(document);
  auto item = unwrap(document.createElement("item"));
  REQUIRE(item.setAttribute("id", "7").ok);
  unwrap(item.appendChild(unwrap(document.createTextNode("body"))));
  unwrap(root.appendChild(item));

  SECTION("Shallow clone keeps attributes but not children")
  {
    auto copy = unwrap(item.cloneNode(false));
    REQUIRE(copy != item);
    REQUIRE(copy.nodeName() == "item");
    REQUIRE(copy.getAttribute("id") == std::string("7"));
    REQUIRE_FALSE(copy.hasChildNodes());
    REQUIRE_FALSE(copy.parentNode().has_value());
    REQUIRE(copy.ownerDocument() == document);

    auto attribute = copy.getAttributeNode("id");
    REQUIRE(attribute.has_value());
    REQUIRE(attribute->ownerElement() == copy);
    REQUIRE(*attribute != *item.getAttributeNode("id"));
  }

  SECTION("Deep clone copies the subtree")
  {
    auto copy = unwrap(item.cloneNode(true));
    auto children = copy.childNodes();
    REQUIRE(children.size() == 1);
    REQUIRE(children[0] != item.childNodes()[0]);
    REQUIRE(children[0].nodeValue() == std::string("body"));
    REQUIRE(children[0].parentNode() == copy);

    REQUIRE(children[0].setNodeValue("changed").ok);
    REQUIRE(item.childNodes()[0].nodeValue() == std::string("body"));
  }

  SECTION("Documents cannot be cloned")
  {
    REQUIRE(document.cloneNode(true).error == DomError::NotSupported);
  }
}

TEST_CASE("Normalize", "[dom][node][normalize]")
{
  auto document = newDocument();
  auto root = rootOf(document);
  auto inner = unwrap(document.createElement("inner"));
  unwrap(root.appendChild(unwrap(document.createTextNode("a"))));
  unwrap(root.appendChild(unwrap(document.createTextNode(""))));
  unwrap(root.appendChild(unwrap(document.createTextNode("b"))));
  unwrap(root.appendChild(inner));
  unwrap(root.appendChild(unwrap(document.createTextNode("c"))));
  unwrap(inner.appendChild(unwrap(document.createTextNode(""))));
  unwrap(inner.appendChild(unwrap(document.createTextNode("x"))));
  unwrap(inner.appendChild(unwrap(document.createTextNode("y"))));

  document.normalize();

  auto children = root.childNodes();
  REQUIRE(namesOf(children) == Names{"#text", "inner", "#text"});
  REQUIRE(children[0].nodeValue() == std::string("ab"));
  REQUIRE(children[2].nodeValue() == std::string("c"));

  auto innerChildren = inner.childNodes();
  REQUIRE(innerChildren.size() == 1);
  REQUIRE(innerChildren[0].nodeValue() == std::string("xy"));
}

TEST_CASE("Node basics", "[dom][node]")
{
  auto document = newDocument();
  auto root = rootOf(document);

  SECTION("Names and values")
  {
    REQUIRE(document.nodeName() == "#document");
    REQUIRE(document.nodeType() == NodeType::Document);
    REQUIRE(root.nodeName() == "root");
    REQUIRE(root.localName() == "root");
    REQUIRE_FALSE(root.nodeValue().has_value());

    auto comment = unwrap(document.createComment("note"));
    REQUIRE(comment.nodeValue() == std::string("note"));
    REQUIRE(comment.unsetNodeValue().ok);
    REQUIRE_FALSE(comment.nodeValue().has_value());
  }

  SECTION("Feature support")
  {
    REQUIRE(root.isSupported("Core", "2.0"));
    REQUIRE(root.isSupported("XML", ""));
    REQUIRE_FALSE(root.isSupported("Events", "2.0"));
    REQUIRE_FALSE(root.isSupported("core", "3.0"));
  }

  SECTION("Handles compare by identity")
  {
    auto again = rootOf(document);
    REQUIRE(again == root);
    REQUIRE(std::hash<RefNode>()(again) == std::hash<RefNode>()(root));
    REQUIRE(unwrap(document.createElement("root")) != root);
  }
}
