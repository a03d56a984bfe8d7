#include "bind_forward.hpp"
#include <skillroute/skillroute.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

using namespace skillroute;

// ---------------------------------------------------------------------------
// bind_dispatch  --  built-in strategies and DispatchEngine
// ---------------------------------------------------------------------------
void bind_dispatch(py::module_& m) {

    // ===================================================================
    // Strategies
    // ===================================================================
    py::class_<SelectionStrategy, std::shared_ptr<SelectionStrategy>>(m, "SelectionStrategy")
        .def("rank", &SelectionStrategy::rank, py::arg("candidates"))
        .def("name", &SelectionStrategy::name);

    m.def("make_strategy",
          [](RoutingStrategy s) -> std::shared_ptr<SelectionStrategy> {
              return make_strategy(s);
          },
          py::arg("strategy"));

    m.def("tie_break_before", &tie_break_before, py::arg("a"), py::arg("b"));

    // ===================================================================
    // DispatchEngine
    // ===================================================================
    py::class_<DispatchEngine, std::shared_ptr<DispatchEngine>>(m, "DispatchEngine")
        .def(py::init<std::shared_ptr<AgentDirectory>, std::shared_ptr<RuleStore>,
                      std::shared_ptr<TaskQueueManager>, RoutingConfig>(),
             py::arg("agents"), py::arg("rules"), py::arg("queue"),
             py::arg("config") = RoutingConfig{})

        // ------------- Routing -------------
        // Released GIL: Python monitors re-acquire it per event
        .def("route", &DispatchEngine::route, py::arg("context"),
             py::call_guard<py::gil_scoped_release>())
        .def("resume_queued", &DispatchEngine::resume_queued, py::arg("queue_id"),
             py::call_guard<py::gil_scoped_release>())
        .def("cancel",  &DispatchEngine::cancel,  py::arg("task_id"))
        .def("release", &DispatchEngine::release, py::arg("agent_id"))

        // ------------- Queries -------------
        .def("available_agents",  &DispatchEngine::available_agents,
             py::arg("team_id") = std::nullopt)
        .def("check_agent_match", &DispatchEngine::check_agent_match,
             py::arg("agent_id"), py::arg("context"))
        .def("config", &DispatchEngine::config, py::return_value_policy::copy)

        // ------------- Configuration -------------
        .def("register_skill_hierarchy", &DispatchEngine::register_skill_hierarchy,
             py::arg("skill_id"), py::arg("parent_ids"))
        .def("clear_skill_hierarchy", &DispatchEngine::clear_skill_hierarchy)
        .def("set_selection_strategy",
             [](DispatchEngine& self, RoutingStrategy slot, RoutingStrategy impl) {
                 self.set_selection_strategy(slot, make_strategy(impl));
             },
             py::arg("strategy"), py::arg("implementation"))
        .def("set_monitor", &DispatchEngine::set_monitor, py::arg("monitor"));
}
