#pragma once

#include <stdexcept>
#include <string>

namespace bmssp_core {

struct TypeError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct ValueError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct RuntimeError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// A requested node label does not exist in the graph.
struct NodeNotFound : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// The target is unreachable from every source.
struct NoPath : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// The algorithm is not defined for this kind of graph (e.g. undirected).
struct NotImplementedError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

} // namespace bmssp_core
