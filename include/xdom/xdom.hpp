// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xdom, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "xdom/core/config.hpp"
#include "xdom/core/config_loader.hpp"
#include "xdom/core/logger.hpp"
#include "xdom/dom/convert.hpp"
#include "xdom/dom/error.hpp"
#include "xdom/dom/implementation.hpp"
#include "xdom/dom/json_dump.hpp"
#include "xdom/dom/name.hpp"
#include "xdom/dom/node_impl.hpp"
#include "xdom/dom/node_type.hpp"
#include "xdom/dom/rc_cell.hpp"
#include "xdom/dom/ref_node.hpp"
#include "xdom/dom/render.hpp"
#include "xdom/dom/syntax.hpp"
#include "xdom/dom/traits.hpp"
