// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <qterm/algorithms/time_evolution.hpp>
#include <qterm/data/hamiltonian.hpp>
#include <qterm/data/settings.hpp>
#include <qterm/data/symbolic_term.hpp>
#include <qterm/data/symbols.hpp>
#include <qterm/data/term.hpp>
#include <qterm/data/term_group.hpp>
#include <qterm/gates/unitary.hpp>
#include <qterm/utils/logger.hpp>
