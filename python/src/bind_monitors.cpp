#include "bind_forward.hpp"
#include <skillroute/skillroute.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

using namespace skillroute;

// Python monitors run on whichever thread routed the task
class PyMonitor : public Monitor {
public:
    using Monitor::Monitor;

    void on_event(const MonitorEvent& event) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(void, Monitor, on_event, event);
    }
};

namespace {

std::string describe(const MonitorEvent& e) {
    std::string out = "<MonitorEvent " + std::string(to_string(e.type));
    if (e.task_id) out += " task='" + *e.task_id + "'";
    if (e.agent_id) out += " agent='" + *e.agent_id + "'";
    if (e.queue_id) out += " queue='" + *e.queue_id + "'";
    if (e.queue_length) out += " length=" + std::to_string(*e.queue_length);
    return out + ">";
}

MetricsMonitor::AlertCallback wrap_alert(py::function cb) {
    return [cb = py::object(std::move(cb))](const std::string& msg) {
        py::gil_scoped_acquire acquire;
        cb(msg);
    };
}

} // anonymous namespace

void bind_monitors(py::module_& m) {
    // ---- Events -----------------------------------------------------------

    py::class_<MonitorEvent>(m, "MonitorEvent")
        .def(py::init<>())
        .def_readwrite("type",         &MonitorEvent::type)
        .def_readwrite("timestamp",    &MonitorEvent::timestamp)
        .def_readwrite("message",      &MonitorEvent::message)
        .def_readwrite("decision_id",  &MonitorEvent::decision_id)
        .def_readwrite("task_id",      &MonitorEvent::task_id)
        .def_readwrite("agent_id",     &MonitorEvent::agent_id)
        .def_readwrite("queue_id",     &MonitorEvent::queue_id)
        .def_readwrite("rule_id",      &MonitorEvent::rule_id)
        .def_readwrite("score",        &MonitorEvent::score)
        .def_readwrite("queue_length", &MonitorEvent::queue_length)
        .def("__repr__", &describe);

    m.def("event_name", [](EventType t) { return std::string(to_string(t)); },
          py::arg("type"));

    // ---- Monitors ---------------------------------------------------------

    py::class_<Monitor, PyMonitor, std::shared_ptr<Monitor>>(m, "Monitor")
        .def(py::init<>())
        .def("on_event", &Monitor::on_event, py::arg("event"));

    // Verbosity is bound in bindings.cpp
    py::class_<ConsoleMonitor, Monitor, std::shared_ptr<ConsoleMonitor>>(m, "ConsoleMonitor")
        .def(py::init<ConsoleMonitor::Verbosity>(),
             py::arg("verbosity") = ConsoleMonitor::Verbosity::Normal);

    py::class_<MetricsMonitor::Metrics>(m, "Metrics")
        .def(py::init<>())
        .def_readonly("total_routed",        &MetricsMonitor::Metrics::total_routed)
        .def_readonly("assigned",            &MetricsMonitor::Metrics::assigned)
        .def_readonly("queued",              &MetricsMonitor::Metrics::queued)
        .def_readonly("escalated",           &MetricsMonitor::Metrics::escalated)
        .def_readonly("reassign_attempts",   &MetricsMonitor::Metrics::reassign_attempts)
        .def_readonly("capacity_races_lost", &MetricsMonitor::Metrics::capacity_races_lost)
        .def_readonly("resumed",             &MetricsMonitor::Metrics::resumed)
        .def_readonly("cancelled",           &MetricsMonitor::Metrics::cancelled)
        .def_readonly("released",            &MetricsMonitor::Metrics::released)
        .def_readonly("average_match_score", &MetricsMonitor::Metrics::average_match_score)
        .def_readonly("last_queue_length",   &MetricsMonitor::Metrics::last_queue_length)
        .def("__repr__", [](const MetricsMonitor::Metrics& mt) {
            return "<Metrics routed=" + std::to_string(mt.total_routed)
                 + " assigned=" + std::to_string(mt.assigned)
                 + " queued=" + std::to_string(mt.queued)
                 + " escalated=" + std::to_string(mt.escalated) + ">";
        });

    py::class_<MetricsMonitor, Monitor, std::shared_ptr<MetricsMonitor>>(m, "MetricsMonitor")
        .def(py::init<>())
        .def("get_metrics", &MetricsMonitor::get_metrics)
        .def("reset_metrics", &MetricsMonitor::reset_metrics)
        .def("set_queue_size_alert_threshold",
            [](MetricsMonitor& self, std::size_t threshold, py::function cb) {
                self.set_queue_size_alert_threshold(threshold, wrap_alert(std::move(cb)));
            },
            py::arg("threshold"), py::arg("callback"));

    py::class_<CompositeMonitor, Monitor, std::shared_ptr<CompositeMonitor>>(m, "CompositeMonitor")
        .def(py::init<>())
        .def("add_monitor", &CompositeMonitor::add_monitor, py::arg("monitor"));
}
