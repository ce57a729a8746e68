#include "types.hpp"

namespace protocol {

const char* status_name(CampaignStatus status) {
    switch (status) {
        case CampaignStatus::Active:            return "Active";
        case CampaignStatus::DecryptionPending: return "DecryptionPending";
        case CampaignStatus::Successful:        return "Successful";
        case CampaignStatus::Failed:            return "Failed";
        case CampaignStatus::Withdrawn:         return "Withdrawn";
        case CampaignStatus::DecryptionFailed:  return "DecryptionFailed";
    }
    return "Unknown";
}

bool is_refund_eligible(CampaignStatus status) {
    return status == CampaignStatus::Failed || status == CampaignStatus::DecryptionFailed;
}

} // namespace protocol
