#include "bind_forward.hpp"
#include <skillroute/skillroute.hpp>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

using namespace skillroute;

// Trampoline so a Python object can act as the triage service
class PyTriageAssessor : public TriageAssessor {
public:
    using TriageAssessor::TriageAssessor;

    TriageResult assess(const TriageInput& input) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(TriageResult, TriageAssessor, assess, input);
    }

    bool is_vip(const std::string& text) const override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(bool, TriageAssessor, is_vip, text);
    }
};

void bind_triage(py::module_& m) {

    // ---- Enums ------------------------------------------------------------

    py::enum_<TriageUrgency>(m, "TriageUrgency")
        .value("HighPriority", TriageUrgency::HighPriority)
        .value("High",         TriageUrgency::High)
        .value("Normal",       TriageUrgency::Normal)
        .value("Low",          TriageUrgency::Low);

    py::enum_<LeadChannel>(m, "LeadChannel")
        .value("Whatsapp", LeadChannel::Whatsapp)
        .value("Voice",    LeadChannel::Voice)
        .value("Web",      LeadChannel::Web)
        .value("WebForm",  LeadChannel::WebForm)
        .value("Hubspot",  LeadChannel::Hubspot)
        .value("Facebook", LeadChannel::Facebook)
        .value("Google",   LeadChannel::Google)
        .value("Referral", LeadChannel::Referral)
        .value("Manual",   LeadChannel::Manual);

    // ---- Structs ----------------------------------------------------------

    py::class_<TriageInput>(m, "TriageInput")
        .def(py::init<>())
        .def_readwrite("lead_id",                   &TriageInput::lead_id)
        .def_readwrite("lead_score",                &TriageInput::lead_score)
        .def_readwrite("channel",                   &TriageInput::channel)
        .def_readwrite("message_content",           &TriageInput::message_content)
        .def_readwrite("procedure_interest",        &TriageInput::procedure_interest)
        .def_readwrite("has_existing_relationship", &TriageInput::has_existing_relationship)
        .def_readwrite("contact_phone",             &TriageInput::contact_phone);

    py::class_<TriageResult>(m, "TriageResult")
        .def(py::init<>())
        .def_readwrite("urgency_level",          &TriageResult::urgency_level)
        .def_readwrite("routing_recommendation", &TriageResult::routing_recommendation)
        .def_readwrite("suggested_owner",        &TriageResult::suggested_owner)
        .def_readwrite("medical_flags",          &TriageResult::medical_flags)
        .def_readwrite("notes",                  &TriageResult::notes);

    py::class_<TriageRoutingConfig>(m, "TriageRoutingConfig")
        .def(py::init<>())
        .def_readwrite("urgency_priority",   &TriageRoutingConfig::urgency_priority)
        .def_readwrite("lead_score_boost",   &TriageRoutingConfig::lead_score_boost)
        .def_readwrite("procedure_skills",   &TriageRoutingConfig::procedure_skills)
        .def_readwrite("sla_minutes",        &TriageRoutingConfig::sla_minutes)
        .def_readwrite("default_sla_minutes", &TriageRoutingConfig::default_sla_minutes)
        .def_readwrite("default_procedure_proficiency",
                       &TriageRoutingConfig::default_procedure_proficiency)
        .def_readwrite("vip_skill_id",        &TriageRoutingConfig::vip_skill_id)
        .def_readwrite("escalation_skill_id", &TriageRoutingConfig::escalation_skill_id)
        .def_readwrite("vip_skill_required",  &TriageRoutingConfig::vip_skill_required)
        .def_readwrite("use_suggested_owner_as_preference",
                       &TriageRoutingConfig::use_suggested_owner_as_preference);

    py::class_<TriageRoutingResult>(m, "TriageRoutingResult")
        .def(py::init<>())
        .def_readonly("triage_result", &TriageRoutingResult::triage_result)
        .def_readonly("context",       &TriageRoutingResult::context)
        .def_readonly("decision",      &TriageRoutingResult::decision);

    // ===================================================================
    // TriageAssessor
    // ===================================================================
    py::class_<TriageAssessor, PyTriageAssessor, std::shared_ptr<TriageAssessor>>(m, "TriageAssessor")
        .def(py::init<>())
        .def("assess", &TriageAssessor::assess, py::arg("input"))
        .def("is_vip", &TriageAssessor::is_vip, py::arg("text"));

    // ===================================================================
    // TriageRouter
    // ===================================================================
    py::class_<TriageRouter, std::shared_ptr<TriageRouter>>(m, "TriageRouter")
        .def(py::init<std::shared_ptr<TriageAssessor>, std::shared_ptr<DispatchEngine>,
                      TriageRoutingConfig>(),
             py::arg("assessor"), py::arg("engine"),
             py::arg("config") = TriageRoutingConfig{})
        .def("route", &TriageRouter::route, py::arg("input"),
             py::call_guard<py::gil_scoped_release>())
        .def("triage_only", &TriageRouter::triage_only, py::arg("input"),
             py::call_guard<py::gil_scoped_release>())
        .def("update_procedure_mapping", &TriageRouter::update_procedure_mapping,
             py::arg("procedure"), py::arg("skills"))
        .def("config",      &TriageRouter::config)
        .def("sla_minutes", &TriageRouter::sla_minutes, py::arg("recommendation"))
        .def("build_context", &TriageRouter::build_context,
             py::arg("input"), py::arg("result"), py::arg("vip"))
        .def_static("map_channel", &TriageRouter::map_channel, py::arg("channel"))
        .def_static("map_urgency", &TriageRouter::map_urgency, py::arg("urgency"));
}
