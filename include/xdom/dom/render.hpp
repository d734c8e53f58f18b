// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xdom, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <xdom/dom/ref_node.hpp>

#include <ostream>
#include <string>

namespace xdom
{
namespace dom
{

/// \brief Writes the diagnostic markup form of \p node and its subtree.
///
/// This is not a serializer: nothing is escaped. Attributes are written in
/// name order so the output is deterministic. CDATA padding follows the
/// options of the owning document's DomImplementation.
void render(std::ostream &os, const RefNode &node);

std::string render(const RefNode &node);

} // namespace dom
} // namespace xdom
