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

TEST_CASE("Document creation", "[dom][document]")
{
  DomImplementation implementation;

  SECTION("Namespaced document with five children")
  {
    auto document = unwrap(implementation.createDocument("http://example.org/", "root", std::nullopt));
    REQUIRE(document.nodeType() == NodeType::Document);
    REQUIRE_FALSE(document.ownerDocument().has_value());
    REQUIRE_FALSE(document.docType().has_value());

    auto root = rootOf(document);
    REQUIRE(root.name().toString() == "root");
    REQUIRE(root.namespaceUri() == std::string("http://example.org/"));
    REQUIRE(root.ownerDocument() == document);

    for (int i = 1; i <= 5; ++i)
    {
      auto child = unwrap(document.createElement("child-" + std::to_string(i)));
      unwrap(root.appendChild(child));
    }

    auto third = root.childNodes()[2];
    REQUIRE(third.nodeName() == "child-3");
    std::vector<std::string> following;
    for (auto next = third.nextSibling(); next; next = next->nextSibling())
    {
      following.push_back(next->nodeName());
    }
    REQUIRE(following == std::vector<std::string>{"child-4", "child-5"});
  }

  SECTION("Prefixed document element")
  {
    auto document =
      unwrap(implementation.createDocument("http://example.org/", "ex:root", std::nullopt));
    auto root = rootOf(document);
    REQUIRE(root.prefix() == std::string("ex"));
    REQUIRE(root.localName() == "root");
  }

  SECTION("Invalid root names")
  {
    REQUIRE(implementation.createDocument("", "1root", std::nullopt).error ==
            DomError::InvalidCharacter);
    REQUIRE(implementation.createDocument("", "ex:root", std::nullopt).error ==
            DomError::Namespace);
  }

  SECTION("Document with a document type")
  {
    auto docType = unwrap(implementation.createDocumentType(
      "html", std::string("-//W3C//DTD XHTML 1.0 Strict//EN"), std::nullopt));
    REQUIRE_FALSE(docType.ownerDocument().has_value());

    auto document = unwrap(implementation.createDocument("", "html", docType));
    REQUIRE(document.docType() == docType);
    REQUIRE(docType.ownerDocument() == document);
    REQUIRE(docType.parentNode() == document);
    REQUIRE(docType.publicId() == std::string("-//W3C//DTD XHTML 1.0 Strict//EN"));
    REQUIRE_FALSE(docType.systemId().has_value());
    REQUIRE(document.childNodes().empty());
  }

  SECTION("A document type belongs to one document")
  {
    auto docType = unwrap(implementation.createDocumentType("html", std::nullopt, std::nullopt));
    auto owner = unwrap(implementation.createDocument("", "html", docType));
    REQUIRE(docType.ownerDocument() == owner);

    LogCapture capture;
    REQUIRE(implementation.createDocument("", "html", docType).error == DomError::WrongDocument);
    REQUIRE(capture.contains("already in use"));
  }

  SECTION("The document type argument must be a document type")
  {
    auto other = newDocument();
    auto element = unwrap(other.createElement("e"));
    REQUIRE(implementation.createDocument("", "html", element).error == DomError::InvalidState);
  }

  SECTION("Replacing the document type")
  {
    auto document = newDocument();
    auto first = unwrap(implementation.createDocumentType("a", std::nullopt, std::nullopt));
    auto second = unwrap(implementation.createDocumentType("b", std::nullopt, std::nullopt));
    unwrap(document.appendChild(first));
    REQUIRE(document.appendChild(second).error == DomError::HierarchyRequest);
    unwrap(document.replaceChild(second, first));
    REQUIRE(document.docType() == second);
    REQUIRE_FALSE(first.parentNode().has_value());
  }
}

TEST_CASE("Document factories", "[dom][document][factory]")
{
  auto document = newDocument();

  SECTION("Every created node is detached and owned")
  {
    NodeList created{
      unwrap(document.createElement("e")),
      unwrap(document.createElementNs("http://example.org/", "p:e")),
      unwrap(document.createAttribute("a")),
      unwrap(document.createAttributeNs("http://example.org/", "p:a")),
      unwrap(document.createTextNode("t")),
      unwrap(document.createComment("c")),
      unwrap(document.createCDataSection("d")),
      unwrap(document.createDocumentFragment()),
      unwrap(document.createEntityReference("amp")),
      unwrap(document.createProcessingInstruction("pi", std::nullopt)),
    };
    for (const auto &node : created)
    {
      INFO(node.nodeName());
      REQUIRE_FALSE(node.parentNode().has_value());
      REQUIRE(node.ownerDocument() == document);
    }
    REQUIRE(namesOf(created) ==
            std::vector<std::string>{"e", "p:e", "a", "p:a", "#text", "#comment",
                                     "#cdata-section", "#document-fragment", "amp", "pi"});
  }

  SECTION("Node kinds")
  {
    REQUIRE(unwrap(document.createTextNode("t")).nodeType() == NodeType::Text);
    REQUIRE(unwrap(document.createCDataSection("t")).nodeType() == NodeType::CData);
    REQUIRE(unwrap(document.createComment("t")).nodeType() == NodeType::Comment);
    REQUIRE(unwrap(document.createEntityReference("t")).nodeType() ==
            NodeType::EntityReference);
    REQUIRE(unwrap(document.createProcessingInstruction("t", std::nullopt)).nodeType() ==
            NodeType::ProcessingInstruction);
  }

  SECTION("Attribute values")
  {
    REQUIRE(unwrap(document.createAttribute("a")).value() == std::string(""));
    REQUIRE(unwrap(document.createAttributeWith("a", "v")).value() == std::string("v"));
    auto attribute = unwrap(document.createAttribute("a"));
    REQUIRE(attribute.unsetValue().ok);
    REQUIRE_FALSE(attribute.value().has_value());
  }

  SECTION("Names are validated")
  {
    REQUIRE(document.createElement("").error == DomError::InvalidCharacter);
    REQUIRE(document.createElement("a b").error == DomError::InvalidCharacter);
    REQUIRE(document.createElementNs("", "p:e").error == DomError::Namespace);
    REQUIRE(document.createAttribute("x:").error == DomError::Namespace);
    REQUIRE(document.createEntityReference("&").error == DomError::InvalidCharacter);
  }

  SECTION("Only documents create nodes")
  {
    auto root = rootOf(document);
    LogCapture capture;
    REQUIRE(root.createElement("e").error == DomError::InvalidState);
    REQUIRE(root.createTextNode("t").error == DomError::InvalidState);
    REQUIRE(capture.count() == 2);
  }
}

TEST_CASE("Entities and notations", "[dom][document][doctype]")
{
  DomImplementation implementation;
  auto docType = unwrap(implementation.createDocumentTypeWith(
    "doc", std::nullopt, std::string("doc.dtd"), std::string("<!ENTITY e \"x\">")));
  auto document = unwrap(implementation.createDocument("", "doc", docType));

  auto entity = unwrap(document.createEntity("logo", std::nullopt, std::string("logo.gif"),
                                             std::string("gif")));
  auto notation =
    unwrap(document.createNotation("gif", std::string("image/gif"), std::nullopt));

  REQUIRE(docType.addEntity(entity).ok);
  REQUIRE(docType.addNotation(notation).ok);

  auto entities = docType.entities();
  REQUIRE(entities.size() == 1);
  REQUIRE(entities.begin()->second == entity);
  REQUIRE(entity.systemId() == std::string("logo.gif"));
  REQUIRE(entity.notationName() == std::string("gif"));
  REQUIRE_FALSE(entity.publicId().has_value());
  REQUIRE(entity.ownerDocument() == document);

  auto notations = docType.notations();
  REQUIRE(notations.size() == 1);
  REQUIRE(notation.publicId() == std::string("image/gif"));

  REQUIRE(docType.internalSubset() == std::string("<!ENTITY e \"x\">"));
  REQUIRE(docType.systemId() == std::string("doc.dtd"));

  SECTION("Wrong kinds are refused")
  {
    REQUIRE(docType.addEntity(notation).error == DomError::InvalidState);
    REQUIRE(docType.addNotation(entity).error == DomError::InvalidState);
    REQUIRE(rootOf(document).addEntity(entity).error == DomError::InvalidState);
  }

  SECTION("Neither can be cloned")
  {
    REQUIRE(entity.cloneNode(false).error == DomError::NotSupported);
    REQUIRE(docType.cloneNode(true).error == DomError::NotSupported);
  }
}

TEST_CASE("Implementation features and options", "[dom][implementation]")
{
  DomImplementation implementation;
  REQUIRE(implementation.hasFeature("Core", "2.0"));
  REQUIRE(implementation.hasFeature("xml", "1.0"));
  REQUIRE(implementation.hasFeature("XML", ""));
  REQUIRE_FALSE(implementation.hasFeature("Traversal", "2.0"));
  REQUIRE_FALSE(implementation.hasFeature("Core", "3.0"));
  REQUIRE_FALSE(implementation.options().cdataPadding);

  SECTION("Options from configuration")
  {
    auto loader = xdom::core::ConfigLoader::fromString("[render]\ncdata_padding = true\n");
    auto config = xdom::core::Config::fromLoader(loader);
    auto options = DomImplementation::Options::fromConfig(config);
    REQUIRE(options.cdataPadding);

    auto document = unwrap(DomImplementation(options).createDocument("", "root", std::nullopt));
    REQUIRE(document.implementation().options().cdataPadding);
  }

  SECTION("Missing settings keep the defaults")
  {
    auto loader = xdom::core::ConfigLoader::fromString("[log]\nlevel = \"warn\"\n");
    auto options = DomImplementation::Options::fromConfig(xdom::core::Config::fromLoader(loader));
    REQUIRE_FALSE(options.cdataPadding);
  }
}
