#include "bind_forward.hpp"
#include <skillroute/skillroute.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

using namespace skillroute;

// ---------------------------------------------------------------------------
// bind_core  --  AgentProfile, AgentDirectory, RuleStore, TaskQueueManager
// ---------------------------------------------------------------------------
void bind_core(py::module_& m) {

    // ===================================================================
    // AgentProfile
    // ===================================================================
    py::class_<AgentProfile>(m, "AgentProfile")
        .def(py::init<>())
        .def_readwrite("id",                   &AgentProfile::id)
        .def_readwrite("name",                 &AgentProfile::name)
        .def_readwrite("email",                &AgentProfile::email)
        .def_readwrite("phone",                &AgentProfile::phone)
        .def_readwrite("role",                 &AgentProfile::role)
        .def_readwrite("availability",         &AgentProfile::availability)
        .def_readwrite("skills",               &AgentProfile::skills)
        .def_readwrite("languages",            &AgentProfile::languages)
        .def_readwrite("current_task_count",   &AgentProfile::current_task_count)
        .def_readwrite("max_concurrent_tasks", &AgentProfile::max_concurrent_tasks)
        .def_readwrite("team_id",              &AgentProfile::team_id)
        .def_readonly("created_at",            &AgentProfile::created_at)
        .def_readonly("updated_at",            &AgentProfile::updated_at)
        .def("has_skill",    &AgentProfile::has_skill,
             py::arg("skill_id"), py::arg("minimum") = ProficiencyLevel::Basic)
        .def("speaks",       &AgentProfile::speaks, py::arg("language"))
        .def("load_ratio",   &AgentProfile::load_ratio)
        .def("is_available", &AgentProfile::is_available)
        .def("has_capacity", &AgentProfile::has_capacity, py::arg("ratio") = 1.0)
        // __repr__
        .def("__repr__", [](const AgentProfile& a) {
            return "<AgentProfile id='" + a.id + "' name='" + a.name
                 + "' availability=" + std::string(to_string(a.availability))
                 + " load=" + std::to_string(a.current_task_count) + "/"
                 + std::to_string(a.max_concurrent_tasks) + ">";
        });

    // ===================================================================
    // AgentDirectory
    // ===================================================================
    py::class_<AgentDirectory, std::shared_ptr<AgentDirectory>>(m, "AgentDirectory")
        .def(py::init<>())
        .def("upsert",  &AgentDirectory::upsert, py::arg("profile"))
        .def("remove",  &AgentDirectory::remove, py::arg("id"))
        .def("clear",   &AgentDirectory::clear)
        .def("all",     &AgentDirectory::all)
        .def("available", &AgentDirectory::available,
             py::arg("team_id") = std::nullopt)
        .def("by_id",   &AgentDirectory::by_id, py::arg("id"))
        .def("by_skill", &AgentDirectory::by_skill,
             py::arg("skill_id"), py::arg("min_proficiency") = std::nullopt)
        .def("size",    &AgentDirectory::size)
        .def("__len__", &AgentDirectory::size)
        .def("set_availability", &AgentDirectory::set_availability,
             py::arg("id"), py::arg("value"))
        .def("set_task_count",   &AgentDirectory::set_task_count,
             py::arg("id"), py::arg("value"))
        .def("try_acquire_task_slot", &AgentDirectory::try_acquire_task_slot,
             py::arg("id"), py::arg("ratio") = 1.0)
        .def("release_task_slot", &AgentDirectory::release_task_slot, py::arg("id"));

    // ===================================================================
    // RuleStore
    // ===================================================================
    py::class_<RuleStore, std::shared_ptr<RuleStore>>(m, "RuleStore")
        .def(py::init<>())
        .def("upsert",   &RuleStore::upsert, py::arg("rule"))
        .def("remove",   &RuleStore::remove, py::arg("id"))
        .def("clear",    &RuleStore::clear)
        .def("all",      &RuleStore::all)
        .def("active",   &RuleStore::active)
        .def("by_id",    &RuleStore::by_id, py::arg("id"))
        .def("matching", &RuleStore::matching,
             py::arg("query"), py::arg("at") = std::nullopt)
        .def("size",     &RuleStore::size)
        .def("__len__",  &RuleStore::size)
        .def_static("conditions_match", &RuleStore::conditions_match,
                    py::arg("rule"), py::arg("query"), py::arg("at") = std::nullopt)
        .def_static("within", &RuleStore::within, py::arg("range"), py::arg("at"));

    // ===================================================================
    // TaskQueueManager
    // ===================================================================
    py::class_<TaskQueueManager, std::shared_ptr<TaskQueueManager>>(m, "TaskQueueManager")
        .def(py::init<QueueConfig>(), py::arg("config") = QueueConfig{})
        .def("ensure_queue", &TaskQueueManager::ensure_queue, py::arg("queue_id"))
        .def("queue_for",    &TaskQueueManager::queue_for, py::arg("context"))
        .def("enqueue",      &TaskQueueManager::enqueue,
             py::arg("task_id"), py::arg("context"), py::arg("priority"))
        .def("dequeue",      &TaskQueueManager::dequeue, py::arg("queue_id"))
        .def("peek",         &TaskQueueManager::peek, py::arg("queue_id"))
        .def("queue_of",     &TaskQueueManager::queue_of, py::arg("task_id"))
        .def("position",     &TaskQueueManager::position, py::arg("task_id"))
        .def("estimated_wait_seconds", &TaskQueueManager::estimated_wait_seconds,
             py::arg("queue_id"))
        .def("remove",       &TaskQueueManager::remove, py::arg("task_id"))
        .def("length",       &TaskQueueManager::length, py::arg("queue_id"))
        .def("total_length", &TaskQueueManager::total_length)
        .def("tasks",        &TaskQueueManager::tasks, py::arg("queue_id"))
        .def("waiting_longer_than", &TaskQueueManager::waiting_longer_than,
             py::arg("queue_id"), py::arg("max_wait"))
        .def("queue_ids",    &TaskQueueManager::queue_ids)
        .def("clear",        &TaskQueueManager::clear)
        .def("config",       &TaskQueueManager::config,
             py::return_value_policy::copy);
}
