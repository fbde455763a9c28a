// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <pybind11/pybind11.h>

namespace py = pybind11;

void bind_settings(py::module& m);
void bind_gates(py::module& m);
void bind_symbols(py::module& m);
void bind_term(py::module& m);
void bind_term_group(py::module& m);
void bind_hamiltonian(py::module& m);
void bind_time_evolution(py::module& m);
void bind_logger(py::module& m);

PYBIND11_MODULE(_qterm, m) {
  m.doc() = "qterm C++ core bindings";

  auto data = m.def_submodule("data");
  data.doc() = R"(Data submodule)";

  auto algorithms = m.def_submodule("algorithms");
  algorithms.doc() = R"(Algorithms submodule)";

  auto utils = m.def_submodule("utils");
  utils.doc() = R"(Utilities submodule)";

  // Gates and symbols must be registered before the terms that return them
  bind_settings(data);
  bind_gates(data);
  bind_symbols(data);
  bind_term(data);
  bind_term_group(data);
  bind_hamiltonian(data);

  bind_time_evolution(algorithms);

  bind_logger(utils);
}
