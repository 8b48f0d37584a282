// PyBind11 bindings for the statebeam C++ core.
// Exposes SequenceState, BeamSearch over SequenceState with a Python scorer,
// and the prefix tree builder.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "search/state.hpp"
#include "search/sequence_state.hpp"
#include "search/scored_transition.hpp"
#include "search/prefix_tree.hpp"
#include "search/search_config.hpp"
#include "search/beam_search.hpp"
#include "util/logging.hpp"

#include <optional>
#include <string>

namespace py = pybind11;

using SequenceBeamSearch = statebeam::BeamSearch<statebeam::SequenceState>;

PYBIND11_MODULE(statebeam_bindings, m) {
    m.doc() = "statebeam C++ Core Bindings";

    // ── SequenceState ──
    py::class_<statebeam::SequenceState>(m, "SequenceState")
        .def(py::init<std::vector<int>, std::vector<statebeam::ActionHistory>,
                      std::vector<double>, std::set<statebeam::ActionId>>(),
             py::arg("batch_indices"), py::arg("action_history"),
             py::arg("score"), py::arg("terminal_actions"))
        .def_static("initial", &statebeam::SequenceState::initial,
                    py::arg("batch_size"), py::arg("terminal_actions"))
        .def_property_readonly("batch_indices", &statebeam::SequenceState::batchIndices)
        .def_property_readonly("action_history", &statebeam::SequenceState::actionHistories)
        .def_property_readonly("score", &statebeam::SequenceState::scores)
        .def_property_readonly("terminal_actions", &statebeam::SequenceState::terminalActions)
        .def("group_size", &statebeam::SequenceState::groupSize)
        .def("is_finished", &statebeam::SequenceState::isFinished)
        .def("combine_states", &statebeam::SequenceState::combineStates)
        .def("member", &statebeam::SequenceState::member);

    // ── BeamSearchConfig ──
    py::class_<statebeam::BeamSearchConfig>(m, "BeamSearchConfig")
        .def(py::init<>())
        .def_readwrite("beam_size", &statebeam::BeamSearchConfig::beam_size)
        .def_readwrite("per_node_beam_size", &statebeam::BeamSearchConfig::per_node_beam_size)
        .def_readwrite("keep_beam_details", &statebeam::BeamSearchConfig::keep_beam_details)
        .def("validate", &statebeam::BeamSearchConfig::validate);

    // ── PrefixTree ──
    py::class_<statebeam::PrefixTree>(m, "PrefixTree")
        .def(py::init<>())
        .def("add", &statebeam::PrefixTree::add)
        .def("allowed", [](const statebeam::PrefixTree& self, const statebeam::ActionHistory& prefix)
                -> std::optional<std::set<statebeam::ActionId>> {
            const std::set<statebeam::ActionId>* actions = self.allowed(prefix);
            if (!actions) return std::nullopt;
            return *actions;
        }, py::arg("prefix"))
        .def("contains", &statebeam::PrefixTree::contains)
        .def("__len__", &statebeam::PrefixTree::size);

    m.def("construct_prefix_tree", &statebeam::constructPrefixTree,
          py::arg("targets"), py::arg("masks") = std::vector<statebeam::TargetMask>{});

    // ── BeamSearch ──
    py::class_<SequenceBeamSearch>(m, "BeamSearch")
        .def(py::init<int, std::optional<int>, std::optional<statebeam::ActionHistory>, bool>(),
             py::arg("beam_size"), py::arg("per_node_beam_size") = std::nullopt,
             py::arg("initial_sequence") = std::nullopt,
             py::arg("keep_beam_details") = false)
        .def(py::init<const statebeam::BeamSearchConfig&>(), py::arg("config"))
        .def("constrained_to",
             py::overload_cast<const statebeam::ActionHistory&, bool>(
                 &SequenceBeamSearch::constrainedTo, py::const_),
             py::arg("initial_sequence"), py::arg("keep_beam_details") = true)
        .def("search", [](SequenceBeamSearch& self, int num_steps,
                          const statebeam::SequenceState& initial_state,
                          const statebeam::ActionScorer& scorer,
                          bool keep_final_unfinished_states) {
            statebeam::ScoredTransitionFunction transition(scorer);
            return self.search(num_steps, initial_state, transition, keep_final_unfinished_states);
        }, py::arg("num_steps"), py::arg("initial_state"), py::arg("scorer"),
           py::arg("keep_final_unfinished_states") = true)
        .def_property_readonly("beam_size", &SequenceBeamSearch::beamSize)
        .def_property_readonly("per_node_beam_size", &SequenceBeamSearch::perNodeBeamSize)
        .def_property_readonly("is_constrained", &SequenceBeamSearch::isConstrained)
        .def_property_readonly("beams", [](const SequenceBeamSearch& self)
                -> std::optional<std::vector<statebeam::BeamStep>> {
            if (!self.keepsBeamDetails()) return std::nullopt;
            return self.beams();
        })
        .def("beams_for", [](const SequenceBeamSearch& self, int batch_index) {
            return self.beamTrace().steps(batch_index);
        }, py::arg("batch_index"));

    m.def("set_log_level", [](const std::string& level) {
        statebeam::setLogLevel(spdlog::level::from_str(level));
    }, py::arg("level"));
}
