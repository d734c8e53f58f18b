// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xdom, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <xdom/dom/error.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <utility>

namespace xdom
{
namespace dom
{

template <typename T> class WeakCell;

namespace detail
{
/// \brief Storage shared by every handle to one value. `borrows` is the
/// number of outstanding shared borrows, or -1 while an exclusive borrow is
/// held. Not atomic: a cell belongs to one thread at a time.
template <typename T> struct Cell
{
  template <typename... Args>
  explicit Cell(Args &&...args) : value(std::forward<Args>(args)...)
  {
  }

  T value;
  int borrows{0};
};
} // namespace detail

/// \brief Strong, shared handle to a value with runtime-checked borrows.
///
/// Copies share the same value; the value is destroyed together with the last
/// strong handle. Equality and hashing are by identity. Any number of shared
/// borrows may be outstanding, or exactly one exclusive borrow; a conflicting
/// request throws BorrowError.
template <typename T> class RcCell
{
public:
  /// \brief Shared borrow guard. Releases the borrow when destroyed.
  class Ref
  {
  public:
    explicit Ref(std::shared_ptr<detail::Cell<T>> cell) : _cell(std::move(cell))
    {
      ++_cell->borrows;
    }
    Ref(const Ref &) = delete;
    Ref &operator=(const Ref &) = delete;
    Ref(Ref &&other) noexcept : _cell(std::move(other._cell)) {}
    Ref &operator=(Ref &&) = delete;
    ~Ref()
    {
      if (_cell)
      {
        --_cell->borrows;
      }
    }

    const T &operator*() const { return _cell->value; }
    const T *operator->() const { return &_cell->value; }

  private:
    std::shared_ptr<detail::Cell<T>> _cell;
  };

  /// \brief Exclusive borrow guard. Releases the borrow when destroyed.
  class RefMut
  {
  public:
    explicit RefMut(std::shared_ptr<detail::Cell<T>> cell) : _cell(std::move(cell))
    {
      _cell->borrows = -1;
    }
    RefMut(const RefMut &) = delete;
    RefMut &operator=(const RefMut &) = delete;
    RefMut(RefMut &&other) noexcept : _cell(std::move(other._cell)) {}
    RefMut &operator=(RefMut &&) = delete;
    ~RefMut()
    {
      if (_cell)
      {
        _cell->borrows = 0;
      }
    }

    T &operator*() const { return _cell->value; }
    T *operator->() const { return &_cell->value; }

  private:
    std::shared_ptr<detail::Cell<T>> _cell;
  };

  template <typename... Args> static RcCell make(Args &&...args)
  {
    return RcCell(std::make_shared<detail::Cell<T>>(std::forward<Args>(args)...));
  }

  /// \throws BorrowError if an exclusive borrow is outstanding.
  Ref borrow() const
  {
    if (_cell->borrows < 0)
    {
      throw BorrowError("RcCell: already mutably borrowed");
    }
    return Ref(_cell);
  }

  /// \throws BorrowError if any borrow is outstanding.
  RefMut borrowMut() const
  {
    if (_cell->borrows != 0)
    {
      throw BorrowError("RcCell: already borrowed");
    }
    return RefMut(_cell);
  }

  std::optional<Ref> tryBorrow() const
  {
    if (_cell->borrows < 0)
    {
      return std::nullopt;
    }
    return std::optional<Ref>(std::in_place, _cell);
  }

  std::optional<RefMut> tryBorrowMut() const
  {
    if (_cell->borrows != 0)
    {
      return std::nullopt;
    }
    return std::optional<RefMut>(std::in_place, _cell);
  }

  WeakCell<T> downgrade() const { return WeakCell<T>(_cell); }

  long strongCount() const { return _cell.use_count(); }

  bool operator==(const RcCell &other) const { return _cell == other._cell; }
  bool operator!=(const RcCell &other) const { return _cell != other._cell; }

  std::size_t identityHash() const { return std::hash<const void *>()(_cell.get()); }

private:
  friend class WeakCell<T>;

  explicit RcCell(std::shared_ptr<detail::Cell<T>> cell) : _cell(std::move(cell)) {}

  std::shared_ptr<detail::Cell<T>> _cell;
};

/// \brief Non-owning back-reference to an RcCell value.
template <typename T> class WeakCell
{
public:
  WeakCell() = default;

  /// \brief Returns a strong handle, or nothing once the value is destroyed.
  std::optional<RcCell<T>> upgrade() const
  {
    if (auto cell = _cell.lock())
    {
      return RcCell<T>(std::move(cell));
    }
    return std::nullopt;
  }

  bool expired() const { return _cell.expired(); }

  void reset() { _cell.reset(); }

private:
  friend class RcCell<T>;

  explicit WeakCell(const std::shared_ptr<detail::Cell<T>> &cell) : _cell(cell) {}

  std::weak_ptr<detail::Cell<T>> _cell;
};

} // namespace dom
} // namespace xdom

namespace std
{
template <typename T> struct hash<xdom::dom::RcCell<T>>
{
  std::size_t operator()(const xdom::dom::RcCell<T> &cell) const { return cell.identityHash(); }
};
} // namespace std
