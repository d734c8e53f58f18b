// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Shared test helpers for the xdom test suite

#pragma once

#include "xdom/xdom.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace xdom
{
namespace test
{

/// \brief Value of a successful result; throws so a failure surfaces in the
/// enclosing REQUIRE_NOTHROW or test case.
template <typename T> T unwrap(const dom::Result<T> &result)
{
  if (!result.ok)
  {
    throw std::runtime_error(std::string("unexpected failure: ") +
                             dom::errorToString(result.error) + " " + result.message);
  }
  return *result.value;
}

/// \brief Builds a document with a `root` element in no namespace.
inline dom::RefNode newDocument(const std::string &rootName = "root")
{
  dom::DomImplementation implementation;
  return unwrap(implementation.createDocument("", rootName, std::nullopt));
}

inline dom::RefNode rootOf(const dom::RefNode &document)
{
  auto root = document.documentElement();
  if (!root)
  {
    throw std::runtime_error("document has no document element");
  }
  return *root;
}

/// \brief Collects warnings and errors while in scope.
class LogCapture
{
public:
  LogCapture()
  {
    core::Logger::setExternalHandler(
      [this](core::Logger::Level level, const std::string &, const std::string &raw)
      {
        if (level >= core::Logger::Level::Warning)
        {
          std::lock_guard<std::mutex> lock(_mutex);
          _messages.push_back(raw);
        }
      });
  }

  ~LogCapture() { core::Logger::clearExternalHandler(); }

  LogCapture(const LogCapture &) = delete;
  LogCapture &operator=(const LogCapture &) = delete;

  bool contains(const std::string &needle) const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return std::any_of(_messages.begin(), _messages.end(),
                       [&](const std::string &m) { return m.find(needle) != std::string::npos; });
  }

  std::size_t count() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _messages.size();
  }

private:
  mutable std::mutex _mutex;
  std::vector<std::string> _messages;
};

/// \brief Node names of \p nodes, in order.
inline std::vector<std::string> namesOf(const dom::NodeList &nodes)
{
  std::vector<std::string> names;
  for (const auto &node : nodes)
  {
    names.push_back(node.nodeName());
  }
  return names;
}

} // namespace test
} // namespace xdom
