// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xdom, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "xdom/dom/rc_cell.hpp"

#include <string>
#include <unordered_set>

using xdom::dom::BorrowError;
using xdom::dom::RcCell;
using xdom::dom::WeakCell;

TEST_CASE("RcCell borrows", "[dom][rc_cell]")
{
  auto cell = RcCell<int>::make(5);

  SECTION("Shared borrows coexist")
  {
    auto first = cell.borrow();
    auto second = cell.borrow();
    REQUIRE(*first == 5);
    REQUIRE(*second == 5);
    REQUIRE_THROWS_AS(cell.borrowMut(), BorrowError);
    REQUIRE_FALSE(cell.tryBorrowMut().has_value());
  }

  SECTION("Exclusive borrow excludes everything else")
  {
    {
      auto writer = cell.borrowMut();
      *writer = 7;
      REQUIRE_THROWS_AS(cell.borrow(), BorrowError);
      REQUIRE_THROWS_AS(cell.borrowMut(), BorrowError);
      REQUIRE_FALSE(cell.tryBorrow().has_value());
    }
    REQUIRE(*cell.borrow() == 7);
  }

  SECTION("Guards release on scope exit")
  {
    {
      auto reader = cell.borrow();
    }
    {
      auto writer = cell.tryBorrowMut();
      REQUIRE(writer.has_value());
      **writer = 9;
    }
    REQUIRE(*cell.borrow() == 9);
  }

  SECTION("BorrowError is a logic error")
  {
    auto writer = cell.borrowMut();
    REQUIRE_THROWS_AS(cell.borrow(), std::logic_error);
  }
}

TEST_CASE("RcCell ownership", "[dom][rc_cell]")
{
  SECTION("Copies share the value and identity")
  {
    auto a = RcCell<std::string>::make("value");
    auto b = a;
    auto c = RcCell<std::string>::make("value");

    REQUIRE(a == b);
    REQUIRE(a != c);
    REQUIRE(a.strongCount() == 2);

    b.borrowMut()->append("!");
    REQUIRE(*a.borrow() == "value!");

    std::unordered_set<RcCell<std::string>> cells{a, b, c};
    REQUIRE(cells.size() == 2);
  }

  SECTION("Weak references do not keep the value alive")
  {
    WeakCell<int> weak;
    {
      auto strong = RcCell<int>::make(1);
      weak = strong.downgrade();
      REQUIRE(strong.strongCount() == 1);

      auto upgraded = weak.upgrade();
      REQUIRE(upgraded.has_value());
      REQUIRE(*upgraded == strong);
      REQUIRE(strong.strongCount() == 2);
    }
    REQUIRE(weak.expired());
    REQUIRE_FALSE(weak.upgrade().has_value());
  }
}
