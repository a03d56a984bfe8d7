#pragma once

#include "skillroute/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace skillroute {

// Urgency as classified by the external triage component
enum class TriageUrgency {
    HighPriority,
    High,
    Normal,
    Low
};

// Lead source channels known to the CRM
enum class LeadChannel {
    Whatsapp,
    Voice,
    Web,
    WebForm,
    Hubspot,
    Facebook,
    Google,
    Referral,
    Manual
};

struct TriageInput {
    std::string              lead_id;
    LeadScore                lead_score{LeadScore::Cold};
    LeadChannel              channel{LeadChannel::Web};
    std::string              message_content;
    std::vector<std::string> procedure_interest;
    bool                     has_existing_relationship{false};
    std::string              contact_phone;
};

struct TriageResult {
    TriageUrgency              urgency_level{TriageUrgency::Normal};
    // next_available_slot | same_day | next_business_day | nurture_sequence
    std::string                routing_recommendation;
    std::optional<std::string> suggested_owner;
    std::vector<std::string>   medical_flags;
    std::string                notes;
};

// External urgency/intent classifier. Called synchronously; any exception it
// throws propagates to the caller of TriageRouter.
class TriageAssessor {
public:
    virtual ~TriageAssessor() = default;

    virtual TriageResult assess(const TriageInput& input) = 0;
    virtual bool is_vip(const std::string& text) const = 0;
};

inline const char* to_string(TriageUrgency u) {
    switch (u) {
        case TriageUrgency::HighPriority: return "high_priority";
        case TriageUrgency::High:         return "high";
        case TriageUrgency::Normal:       return "normal";
        case TriageUrgency::Low:          return "low";
    }
    return "unknown";
}

inline const char* to_string(LeadChannel c) {
    switch (c) {
        case LeadChannel::Whatsapp: return "whatsapp";
        case LeadChannel::Voice:    return "voice";
        case LeadChannel::Web:      return "web";
        case LeadChannel::WebForm:  return "web_form";
        case LeadChannel::Hubspot:  return "hubspot";
        case LeadChannel::Facebook: return "facebook";
        case LeadChannel::Google:   return "google";
        case LeadChannel::Referral: return "referral";
        case LeadChannel::Manual:   return "manual";
    }
    return "unknown";
}

} // namespace skillroute
