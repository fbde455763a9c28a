// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <pybind11/complex.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <memory>
#include <qterm/data/term_group.hpp>
#include <vector>

namespace py = pybind11;

namespace {

using qterm::data::Term;
using qterm::data::TermGroup;

// Term exposes no mutators to Python, so group members stay unchanged
std::shared_ptr<Term> unconst(const std::shared_ptr<const Term>& term) {
  return std::const_pointer_cast<Term>(term);
}

std::vector<std::shared_ptr<Term>> members_of(const TermGroup& group) {
  std::vector<std::shared_ptr<Term>> members;
  members.reserve(group.size());
  for (const auto& term : group) {
    members.push_back(unconst(term));
  }
  return members;
}

}  // namespace

void bind_term_group(py::module& data) {
  py::class_<TermGroup> group(data, "TermGroup", R"(
Terms whose qubits all lie within the qubits of the group's first term.

A group can be collapsed into a single dense term, e.g. to build one
Trotter gate per group.

Examples:
    >>> groups = TermGroup.from_terms(hamiltonian.terms)
    >>> gates = [g.term().exponential_gate(0.01) for g in groups]
)");

  group.def(py::init([](std::shared_ptr<Term> seed) {
              return TermGroup(std::move(seed));
            }),
            py::arg("seed"));
  group.def("can_append", &TermGroup::can_append, py::arg("term"));
  group.def(
      "append",
      [](TermGroup& self, std::shared_ptr<Term> term) {
        self.append(std::move(term));
      },
      py::arg("term"));
  group.def_static(
      "from_terms",
      [](const std::vector<std::shared_ptr<Term>>& terms) {
        return TermGroup::from_terms(
            std::vector<std::shared_ptr<const Term>>(terms.begin(),
                                                     terms.end()));
      },
      py::arg("terms"),
      R"(
Greedily group terms, larger terms first.

Each term joins the first existing group that contains all of its qubits,
and otherwise starts a new group.

Args:
    terms (list[Term]): Terms to group

Returns:
    list[TermGroup]: Groups covering every term exactly once
)");
  group.def("term", [](const TermGroup& self) { return unconst(self.term()); },
            "The merged term of the group, cached until the next append.");
  group.def("to_term", &TermGroup::to_term,
            py::arg("coefficients") = qterm::data::CoefficientMap{},
            R"(
Merge the group after rescaling each member by its Hamiltonian's coefficient.

Args:
    coefficients (dict[int, complex]): Factor per Hamiltonian id; members of
        other Hamiltonians are merged unscaled

Returns:
    Term: A new merged term
)");
  group.def_property_readonly("target_qubits", &TermGroup::get_target_qubits);
  group.def_property_readonly("terms", &members_of);
  group.def("__len__", &TermGroup::size);
  group.def("__getitem__", [](const TermGroup& self, std::size_t index) {
    return unconst(self.at(index));
  });
  group.def("__repr__", [](const TermGroup& self) {
    return "<qterm.data.TermGroup of " + std::to_string(self.size()) +
           " terms on " + std::to_string(self.get_target_qubits().size()) +
           " qubits>";
  });
}
