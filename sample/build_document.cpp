// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xdom, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

/// \file build_document.cpp
/// \brief Builds a small catalogue document and prints it as markup and JSON.
///
/// Usage: `xdom_build_document [config.toml]`. The optional TOML file may
/// carry `[log]` settings (level, file, format, time_format) and a
/// `[render]` table with `cdata_padding`.

#include "xdom/xdom.hpp"

#include <cstdlib>
#include <iostream>

using namespace xdom::dom;

namespace
{
// Unwraps a result, reporting the failure and exiting on error.
template <typename T> T require(const Result<T> &result, const char *what)
{
  if (!result)
  {
    XDOM_LOG_ERROR(what << " failed: " << result.error << " (" << result.message << ")");
    std::exit(EXIT_FAILURE);
  }
  return *result.value;
}

void require(const DomResult &result, const char *what)
{
  if (!result)
  {
    XDOM_LOG_ERROR(what << " failed: " << result.error << " (" << result.message << ")");
    std::exit(EXIT_FAILURE);
  }
}
} // namespace

int main(int argc, char **argv)
{
  xdom::core::Config config;
  if (argc > 1)
  {
    xdom::core::ConfigLoader loader(argv[1]);
    if (!loader.reload())
    {
      std::cerr << "Cannot read configuration file " << argv[1] << std::endl;
      return EXIT_FAILURE;
    }
    config = xdom::core::Config::fromLoader(loader);
  }
  config.applyLogging();

  const std::string catalogueNs = "urn:example:catalogue";
  DomImplementation implementation(DomImplementation::Options::fromConfig(config));

  auto docType = require(implementation.createDocumentType("cat:catalogue", std::nullopt,
                                                           std::string("catalogue.dtd")),
                         "createDocumentType");
  auto document =
    require(implementation.createDocument(catalogueNs, "cat:catalogue", docType), "createDocument");
  auto root = *document.documentElement();
  require(root.setAttribute("xmlns:cat", catalogueNs), "declare namespace");

  for (const char *title : {"Dune", "Solaris", "Neuromancer"})
  {
    auto book = require(document.createElementNs(catalogueNs, "cat:book"), "createElementNs");
    require(book.setAttribute("title", title), "setAttribute");
    require(book.appendChild(require(document.createTextNode(title), "createTextNode")),
            "appendChild");
    require(root.appendChild(book), "appendChild");
  }

  auto note = require(document.createCDataSection("<ordered by title>"), "createCDataSection");
  require(root.appendChild(note), "appendChild");

  // Split the last title in two and glue it back together again.
  auto lastBook = *root.childNodes()[2].firstChild();
  if (Text *text = asText(lastBook))
  {
    require(text->split(5), "split");
  }
  root.normalize();

  if (const NamespacedElement *element = asNamespacedElement(root))
  {
    XDOM_LOG_INFO("prefix for " << catalogueNs << ": "
                                << element->lookupPrefix(catalogueNs).value_or("<none>"));
  }
  XDOM_LOG_INFO("books: " << document.getElementsByTagNameNs(catalogueNs, "book").size());

  std::cout << document << std::endl;
  std::cout << toJson(document).dump(2) << std::endl;
  return EXIT_SUCCESS;
}
