// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xdom, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <xdom/core/config.hpp>
#include <xdom/dom/ref_node.hpp>

#include <optional>
#include <string>

namespace xdom
{
namespace dom
{

/// \brief DOM `DOMImplementation`: the entry point that creates documents
/// and document types.
///
/// Constructed explicitly and copied into every Document it creates, so a
/// document always knows the options it was built with.
class DomImplementation
{
public:
  struct Options
  {
    /// Render CDATA sections as `<![CDATA[ data ]]>`.
    bool cdataPadding{false};

    static Options fromConfig(const core::Config &config)
    {
      Options options;
      options.cdataPadding = config.render.cdataPadding.value_or(false);
      return options;
    }
  };

  DomImplementation() = default;
  explicit DomImplementation(Options options) : _options(options) {}

  const Options &options() const { return _options; }

  /// \brief Creates a Document whose document element is named
  /// \p qualifiedName in \p namespaceUri.
  ///
  /// A supplied \p docType must be an unused DocumentType; it is adopted by
  /// the new document.
  Result<RefNode> createDocument(const std::string &namespaceUri,
                                 const std::string &qualifiedName,
                                 const std::optional<RefNode> &docType) const;

  Result<RefNode> createDocumentType(const std::string &qualifiedName,
                                     const std::optional<std::string> &publicId,
                                     const std::optional<std::string> &systemId) const;

  Result<RefNode> createDocumentTypeWith(const std::string &qualifiedName,
                                         const std::optional<std::string> &publicId,
                                         const std::optional<std::string> &systemId,
                                         const std::optional<std::string> &internalSubset) const;

  /// \brief True for `Core` and `XML` (any case) at version 1.0, 2.0 or "".
  bool hasFeature(const std::string &feature, const std::string &version) const;

private:
  Options _options;
};

} // namespace dom
} // namespace xdom
