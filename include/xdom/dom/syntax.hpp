// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xdom, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

namespace xdom
{
namespace dom
{
namespace syntax
{

// Reserved namespaces
constexpr const char *XML_NS_PREFIX = "xml";
constexpr const char *XML_NS_URI = "http://www.w3.org/XML/1998/namespace";
constexpr const char *XMLNS_NS_ATTRIBUTE = "xmlns";
constexpr const char *XMLNS_NS_URI = "http://www.w3.org/2000/xmlns/";

// Node names of the unnamed node kinds
constexpr const char *XML_NAME_TEXT = "#text";
constexpr const char *XML_NAME_CDATA = "#cdata-section";
constexpr const char *XML_NAME_COMMENT = "#comment";
constexpr const char *XML_NAME_DOCUMENT = "#document";
constexpr const char *XML_NAME_DOCUMENT_FRAGMENT = "#document-fragment";

constexpr char XML_NS_SEPARATOR = ':';
constexpr const char *WILD_CARD = "*";

// Markup delimiters used by the diagnostic renderer
constexpr const char *XML_ELEMENT_START_START = "<";
constexpr const char *XML_ELEMENT_START_END = ">";
constexpr const char *XML_ELEMENT_END_START = "</";
constexpr const char *XML_ELEMENT_END_END = ">";
constexpr const char *XML_CDATA_START = "<![CDATA[";
constexpr const char *XML_CDATA_END = "]]>";
constexpr const char *XML_PI_START = "<?";
constexpr const char *XML_PI_END = "?>";
constexpr const char *XML_COMMENT_START = "<!--";
constexpr const char *XML_COMMENT_END = "-->";
constexpr const char *XML_DOCTYPE_START = "<!DOCTYPE";
constexpr const char *XML_DOCTYPE_PUBLIC = "PUBLIC";
constexpr const char *XML_DOCTYPE_SYSTEM = "SYSTEM";
constexpr const char *XML_DOCTYPE_END = ">";
constexpr const char *XML_ENTITY_REF_START = "&";
constexpr const char *XML_ENTITY_REF_END = ";";

// Feature names and versions recognised by hasFeature()
constexpr const char *XML_FEATURE_CORE = "core";
constexpr const char *XML_FEATURE_XML = "xml";
constexpr const char *XML_FEATURE_V1 = "1.0";
constexpr const char *XML_FEATURE_V2 = "2.0";

} // namespace syntax
} // namespace dom
} // namespace xdom
