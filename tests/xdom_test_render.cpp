// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xdom, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "test_helpers.hpp"

#include <sstream>

using namespace xdom::dom;
using xdom::test::newDocument;
using xdom::test::rootOf;
using xdom::test::unwrap;

TEST_CASE("Rendering markup", "[dom][render]")
{
  auto document = newDocument();
  auto root = rootOf(document);

  SECTION("Empty document")
  {
    REQUIRE(render(document) == "<root></root>");
  }

  SECTION("Elements with sorted attributes")
  {
    auto item = unwrap(document.createElement("item"));
    REQUIRE(item.setAttribute("z", "last").ok);
    REQUIRE(item.setAttribute("a", "first").ok);
    unwrap(item.appendChild(unwrap(document.createTextNode("hello"))));
    unwrap(root.appendChild(item));

    REQUIRE(render(item) == "<item a=\"first\" z=\"last\">hello</item>");
    REQUIRE(item.toString() == render(item));

    std::ostringstream os;
    os << root;
    REQUIRE(os.str() == "<root><item a=\"first\" z=\"last\">hello</item></root>");
  }

  SECTION("Character data and references")
  {
    unwrap(root.appendChild(unwrap(document.createComment(" note "))));
    unwrap(root.appendChild(unwrap(document.createCDataSection("a<b"))));
    unwrap(root.appendChild(unwrap(document.createEntityReference("amp"))));
    unwrap(root.appendChild(
      unwrap(document.createProcessingInstruction("xml-stylesheet", std::string("href=\"s.css\"")))));
    unwrap(root.appendChild(unwrap(document.createProcessingInstruction("bare", std::nullopt))));

    REQUIRE(render(root) ==
            "<root><!-- note --><![CDATA[a<b]]>&amp;<?xml-stylesheet href=\"s.css\"?><?bare?></root>");
  }

  SECTION("Attributes and fragments on their own")
  {
    auto attribute = unwrap(document.createAttributeWith("lang", "en"));
    REQUIRE(render(attribute) == "lang=\"en\"");

    auto fragment = unwrap(document.createDocumentFragment());
    unwrap(fragment.appendChild(unwrap(document.createTextNode("one"))));
    unwrap(fragment.appendChild(unwrap(document.createElement("two"))));
    REQUIRE(render(fragment) == "one<two></two>");
  }

  SECTION("Prolog before the document element")
  {
    unwrap(document.appendChild(unwrap(document.createComment("prolog"))));
    REQUIRE(render(document) == "<!--prolog--><root></root>");
  }
}

TEST_CASE("Rendering document types", "[dom][render][doctype]")
{
  DomImplementation implementation;

  SECTION("Public and system identifiers")
  {
    auto docType = unwrap(implementation.createDocumentType(
      "html", std::string("-//W3C//DTD XHTML 1.0 Strict//EN"),
      std::string("http://www.w3.org/TR/xhtml1/DTD/xhtml1-strict.dtd")));
    auto document = unwrap(implementation.createDocument("", "html", docType));
    REQUIRE(render(document) ==
            "<!DOCTYPE html PUBLIC \"-//W3C//DTD XHTML 1.0 Strict//EN\" SYSTEM "
            "\"http://www.w3.org/TR/xhtml1/DTD/xhtml1-strict.dtd\"><html></html>");
  }

  SECTION("Internal subset")
  {
    auto docType = unwrap(implementation.createDocumentTypeWith(
      "doc", std::nullopt, std::nullopt, std::string("<!ENTITY e \"x\">")));
    REQUIRE(render(docType) == "<!DOCTYPE doc [<!ENTITY e \"x\">]>");
  }
}

TEST_CASE("CDATA padding", "[dom][render][cdata]")
{
  SECTION("Off by default")
  {
    auto document = newDocument();
    auto cdata = unwrap(document.createCDataSection("data"));
    REQUIRE(render(cdata) == "<![CDATA[data]]>");
  }

  SECTION("Enabled through the implementation options")
  {
    DomImplementation::Options options;
    options.cdataPadding = true;
    auto document = unwrap(DomImplementation(options).createDocument("", "root", std::nullopt));
    auto cdata = unwrap(document.createCDataSection("data"));
    REQUIRE(render(cdata) == "<![CDATA[ data ]]>");
  }
}

TEST_CASE("JSON dump", "[dom][json]")
{
  DomImplementation implementation;
  auto docType = unwrap(implementation.createDocumentType("doc", std::nullopt, std::string("doc.dtd")));
  auto document = unwrap(implementation.createDocument("http://example.org/", "doc", docType));
  auto root = rootOf(document);
  REQUIRE(root.setAttribute("id", "1").ok);
  unwrap(root.appendChild(unwrap(document.createTextNode("body"))));

  Json json = toJson(document);
  REQUIRE(json["type"].get<std::string>() == "Document");
  REQUIRE(json["name"].get<std::string>() == "#document");
  REQUIRE(json["children"].empty());
  REQUIRE(json["docType"]["name"].get<std::string>() == "doc");
  REQUIRE(json["docType"]["systemId"].get<std::string>() == "doc.dtd");
  REQUIRE_FALSE(json["docType"].contains("publicId"));

  const Json &element = json["documentElement"];
  REQUIRE(element["type"].get<std::string>() == "Element");
  REQUIRE(element["namespaceUri"].get<std::string>() == "http://example.org/");
  REQUIRE(element["attributes"]["id"].get<std::string>() == "1");
  REQUIRE(element["children"].size() == 1);
  REQUIRE(element["children"][0]["type"].get<std::string>() == "Text");
  REQUIRE(element["children"][0]["value"].get<std::string>() == "body");

  SECTION("Missing slots are null")
  {
    auto bare = unwrap(implementation.createDocument("", "bare", std::nullopt));
    REQUIRE(toJson(bare)["docType"].is_null());
  }
}
