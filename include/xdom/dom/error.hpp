// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xdom, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace xdom
{
namespace dom
{

/// \brief DOM exception codes, reported as values rather than thrown.
enum class DomError
{
  None = 0,
  IndexSize,        ///< Offset or count outside character data
  Syntax,           ///< Operation not applicable to this kind of node
  InvalidState,     ///< Structural precondition violated
  HierarchyRequest, ///< Child kind not allowed under parent
  WrongDocument,    ///< Node belongs to another document
  Namespace,        ///< Prefix/URI combination not allowed
  InvalidCharacter, ///< Name contains an illegal character
  NotFound,         ///< Referenced node is not where it was expected
  NotSupported,     ///< Operation not supported for this kind of node
  InUseAttribute    ///< Attribute already owned by another element
};

inline const char *errorToString(DomError error)
{
  switch (error)
  {
  case DomError::None:
    return "None";
  case DomError::IndexSize:
    return "IndexSize";
  case DomError::Syntax:
    return "Syntax";
  case DomError::InvalidState:
    return "InvalidState";
  case DomError::HierarchyRequest:
    return "HierarchyRequest";
  case DomError::WrongDocument:
    return "WrongDocument";
  case DomError::Namespace:
    return "Namespace";
  case DomError::InvalidCharacter:
    return "InvalidCharacter";
  case DomError::NotFound:
    return "NotFound";
  case DomError::NotSupported:
    return "NotSupported";
  case DomError::InUseAttribute:
    return "InUseAttribute";
  }
  return "Unknown";
}

inline std::ostream &operator<<(std::ostream &os, DomError error)
{
  return os << errorToString(error);
}

// Diagnostic messages shared by the warning and error paths
constexpr const char *MSG_INDEX_ERROR = "offset or count out of range";
constexpr const char *MSG_INVALID_EXTENSION = "node extension state does not match node type";
constexpr const char *MSG_INVALID_NAME = "invalid name";
constexpr const char *MSG_INVALID_NODE_TYPE = "operation not valid for this node type";
constexpr const char *MSG_NO_PARENT_NODE = "node has no parent";
constexpr const char *MSG_CHILD_NOT_ALLOWED = "child node type not allowed here";
constexpr const char *MSG_WRONG_DOCUMENT = "node belongs to a different document";
constexpr const char *MSG_NOT_A_CHILD = "node is not a child of this node";

/// \brief Outcome of a DOM operation that yields no value.
struct DomResult
{
  bool ok{true};
  DomError error{DomError::None};
  std::string message;

  static DomResult success() { return {true, DomError::None, ""}; }

  static DomResult failure(DomError e, const std::string &m = "") { return {false, e, m}; }

  explicit operator bool() const { return ok; }
};

/// \brief Outcome of a DOM operation that yields a value on success.
template <typename T> struct Result
{
  bool ok{false};
  DomError error{DomError::None};
  std::string message;
  std::optional<T> value;

  static Result success(T v)
  {
    Result r;
    r.ok = true;
    r.value = std::move(v);
    return r;
  }

  static Result failure(DomError e, const std::string &m = "")
  {
    Result r;
    r.error = e;
    r.message = m;
    return r;
  }

  /// \brief Carries the failure of another operation forward.
  static Result failure(const DomResult &other) { return failure(other.error, other.message); }

  template <typename U> static Result failure(const Result<U> &other)
  {
    return failure(other.error, other.message);
  }

  DomResult status() const
  {
    return ok ? DomResult::success() : DomResult::failure(error, message);
  }

  explicit operator bool() const { return ok; }
};

/// \brief Raised when a node cell is borrowed in a conflicting way.
///
/// This is a programming error (re-entrant aliasing within one thread), not a
/// DOM error, and is the only failure in the tree model reported by throwing.
class BorrowError : public std::logic_error
{
public:
  explicit BorrowError(const std::string &what) : std::logic_error(what) {}
};

} // namespace dom
} // namespace xdom
