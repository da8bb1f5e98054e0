/*
  Pybind11 module exposing BMSSP-Core C++ APIs to Python.

  Notes:
    - Node labels are int or str; edge attributes are dicts of float/str.
    - `weight` may be an attribute name or a callable (u, v, attrs) -> float | None.
    - The GIL is released around each search call only when `weight` is a string;
      callables are invoked from the search loop and need the GIL.
    - from_arrays accepts NumPy arrays (C-contiguous) and converts to spans.
*/
#include <pybind11/pybind11.h>
#include <pybind11/functional.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "bmssp_core/error.hpp"
#include "bmssp_core/labeled_digraph.hpp"
#include "bmssp_core/params.hpp"
#include "bmssp_core/shortest_paths.hpp"
#include "bmssp_core/types.hpp"
#include "bmssp_core/weight.hpp"

namespace py = pybind11;
using namespace bmssp_core;

// Helpers to check NumPy arrays
template <typename T>
static std::span<const T> as_span(const py::array& arr, const char* name) {
  if (!py::isinstance<py::array_t<T>>(arr)) {
    throw py::type_error(std::string(name) + ": expected numpy array of correct dtype");
  }
  if (!(arr.flags() & py::array::c_style)) {
    throw py::type_error(std::string(name) + ": array must be C-contiguous (use np.ascontiguousarray)");
  }
  auto buf = arr.request();
  if (buf.ndim != 1) throw py::type_error(std::string(name) + ": must be a 1-D array");
  return std::span<const T>(static_cast<const T*>(buf.ptr), static_cast<std::size_t>(buf.size));
}

// str -> attribute key; callable -> WeightCallback that re-acquires the GIL.
static std::pair<WeightSpec, bool> as_weight_spec(const py::object& weight) {
  if (py::isinstance<py::str>(weight)) {
    return {WeightSpec{py::cast<std::string>(weight)}, true};
  }
  if (!PyCallable_Check(weight.ptr())) {
    throw py::type_error("weight must be a str or a callable (u, v, attrs) -> float | None");
  }
  auto fn = py::reinterpret_borrow<py::function>(weight);
  WeightCallback cb = [fn](const NodeLabel& u, const NodeLabel& v, const EdgeAttrs& attrs)
      -> std::optional<Weight> {
    py::gil_scoped_acquire acquire;
    py::object r = fn(u, v, attrs);
    if (r.is_none()) return std::nullopt;
    return py::cast<double>(r);
  };
  return {WeightSpec{std::move(cb)}, false};
}

// Run `fn` with the GIL released when the weight is an attribute key;
// callable weights call back into Python from the search loop.
template <typename Fn>
static auto run_search(bool release_gil, Fn&& fn) {
  if (release_gil) {
    py::gil_scoped_release nogil;
    return fn();
  }
  return fn();
}

PYBIND11_MODULE(_bmssp_core, m) {
  m.doc() = "BMSSP-Core C++ bindings";

  static py::exception<NodeNotFound> node_not_found(m, "NodeNotFound", PyExc_KeyError);
  static py::exception<NoPath> no_path(m, "NoPath", PyExc_RuntimeError);
  py::register_exception_translator([](std::exception_ptr p) {
    try {
      if (p) std::rethrow_exception(p);
    } catch (const NodeNotFound& e) {
      PyErr_SetString(node_not_found.ptr(), e.what());
    } catch (const NoPath& e) {
      PyErr_SetString(no_path.ptr(), e.what());
    } catch (const ValueError& e) {
      PyErr_SetString(PyExc_ValueError, e.what());
    } catch (const TypeError& e) {
      PyErr_SetString(PyExc_TypeError, e.what());
    } catch (const NotImplementedError& e) {
      PyErr_SetString(PyExc_NotImplementedError, e.what());
    } catch (const RuntimeError& e) {
      PyErr_SetString(PyExc_RuntimeError, e.what());
    }
  });

  py::class_<BmsspParams>(m, "BmsspParams")
      .def_readonly("k", &BmsspParams::k)
      .def_readonly("t", &BmsspParams::t)
      .def_readonly("levels", &BmsspParams::levels)
      .def_readonly("counter", &BmsspParams::counter)
      .def_readonly("edge_adjustment", &BmsspParams::edge_adjustment);

  m.def("derive_params", &derive_params, py::arg("n"), py::arg("m"), py::arg("precision") = 0);

  py::class_<LabeledDiGraph>(m, "LabeledDiGraph")
      .def(py::init<bool, bool>(), py::kw_only(),
           py::arg("directed") = true, py::arg("multigraph") = false)
      .def_static(
          "from_arrays",
          [](std::int32_t num_nodes, py::array src, py::array dst, py::array weight, bool add_reverse) {
            auto src_s = as_span<std::int32_t>(src, "src");
            auto dst_s = as_span<std::int32_t>(dst, "dst");
            if (src_s.size() != dst_s.size()) throw py::type_error("src and dst must have the same length");
            py::array_t<double, py::array::c_style | py::array::forcecast> w64(weight);
            auto wbuf = w64.request();
            std::span<const Weight> w_s(static_cast<const Weight*>(wbuf.ptr), static_cast<std::size_t>(wbuf.size));
            return LabeledDiGraph::from_arrays(num_nodes, src_s, dst_s, w_s, add_reverse);
          },
          py::arg("num_nodes"), py::arg("src"), py::arg("dst"), py::arg("weight"),
          py::kw_only(), py::arg("add_reverse") = false)
      .def("add_node", &LabeledDiGraph::add_node, py::arg("label"), py::arg("attrs") = NodeAttrs{})
      .def("add_edge", &LabeledDiGraph::add_edge, py::arg("u"), py::arg("v"), py::arg("attrs") = EdgeAttrs{})
      .def("add_weighted_edges", &LabeledDiGraph::add_weighted_edges,
           py::arg("edges"), py::arg("key") = std::string("weight"))
      .def("add_cycle", &LabeledDiGraph::add_cycle, py::arg("labels"), py::arg("attrs") = EdgeAttrs{})
      .def("to_directed", &LabeledDiGraph::to_directed)
      .def("is_directed", &LabeledDiGraph::is_directed)
      .def("is_multigraph", &LabeledDiGraph::is_multigraph)
      .def("num_nodes", &LabeledDiGraph::num_nodes)
      .def("num_edges", &LabeledDiGraph::num_edges)
      .def("has_node", &LabeledDiGraph::has_node)
      .def("__contains__", &LabeledDiGraph::has_node)
      .def("node_attrs", &LabeledDiGraph::node_attrs, py::arg("label"))
      .def("labels", [](const LabeledDiGraph& g) {
        return std::vector<NodeLabel>(g.labels().begin(), g.labels().end());
      });

  m.def("bmssp",
        [](const LabeledDiGraph& g, const std::vector<NodeLabel>& sources, std::optional<NodeLabel> target,
           py::object weight, int precision, bool with_predecessors) {
          auto ws = as_weight_spec(weight);
          BmsspOptions opts;
          opts.target = std::move(target);
          opts.weight = std::move(ws.first);
          opts.precision = precision;
          opts.with_predecessors = with_predecessors;
          auto res = run_search(ws.second, [&] { return bmssp(g, sources, opts); });
          if (with_predecessors) {
            return py::make_tuple(std::move(res.distances), std::move(res.paths), std::move(res.predecessors));
          }
          return py::make_tuple(std::move(res.distances), std::move(res.paths));
        },
        py::arg("g"), py::arg("sources"), py::arg("target") = py::none(), py::kw_only(),
        py::arg("weight") = "weight", py::arg("precision") = 0, py::arg("with_predecessors") = false);

  m.def("single_source_bmssp_path",
        [](const LabeledDiGraph& g, const NodeLabel& source, const NodeLabel& target,
           py::object weight, int precision) {
          auto ws = as_weight_spec(weight);
          return run_search(ws.second, [&] { return single_source_bmssp_path(g, source, target, ws.first, precision); });
        },
        py::arg("g"), py::arg("source"), py::arg("target"), py::kw_only(),
        py::arg("weight") = "weight", py::arg("precision") = 0);

  m.def("single_source_bmssp_path_length",
        [](const LabeledDiGraph& g, const NodeLabel& source, const NodeLabel& target,
           py::object weight, int precision) {
          auto ws = as_weight_spec(weight);
          return run_search(ws.second, [&] { return single_source_bmssp_path_length(g, source, target, ws.first, precision); });
        },
        py::arg("g"), py::arg("source"), py::arg("target"), py::kw_only(),
        py::arg("weight") = "weight", py::arg("precision") = 0);

  m.def("multi_source_bmssp_path",
        [](const LabeledDiGraph& g, const std::vector<NodeLabel>& sources, py::object weight, int precision) {
          auto ws = as_weight_spec(weight);
          return run_search(ws.second, [&] { return multi_source_bmssp_path(g, sources, ws.first, precision); });
        },
        py::arg("g"), py::arg("sources"), py::kw_only(),
        py::arg("weight") = "weight", py::arg("precision") = 0);

  m.def("multi_source_bmssp_path_length",
        [](const LabeledDiGraph& g, const std::vector<NodeLabel>& sources, py::object weight, int precision) {
          auto ws = as_weight_spec(weight);
          return run_search(ws.second, [&] { return multi_source_bmssp_path_length(g, sources, ws.first, precision); });
        },
        py::arg("g"), py::arg("sources"), py::kw_only(),
        py::arg("weight") = "weight", py::arg("precision") = 0);

  m.def("dijkstra_path_length_map",
        [](const LabeledDiGraph& g, const std::vector<NodeLabel>& sources, py::object weight, int precision) {
          auto ws = as_weight_spec(weight);
          return run_search(ws.second, [&] { return dijkstra_path_length_map(g, sources, ws.first, precision); });
        },
        py::arg("g"), py::arg("sources"), py::kw_only(),
        py::arg("weight") = "weight", py::arg("precision") = 0);
}
