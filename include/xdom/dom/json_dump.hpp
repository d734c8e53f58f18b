// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xdom, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <xdom/dom/ref_node.hpp>

#include <nlohmann/json.hpp>

namespace xdom
{
namespace dom
{

using Json = nlohmann::json;

/// \brief Structural snapshot of \p node and its subtree for diagnostics.
///
/// Every node becomes an object with `type`, `name` and `children`; `value`
/// and `namespaceUri` appear when set. Elements add an `attributes` object,
/// documents their `docType` and `documentElement`, and DocumentType, Entity
/// and Notation nodes their public and system identifiers.
Json toJson(const RefNode &node);

} // namespace dom
} // namespace xdom
