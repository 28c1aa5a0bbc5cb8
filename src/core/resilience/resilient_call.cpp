#include "core/resilience/resilient_call.h"

namespace cr {

QString callStatusToString(CallStatus status)
{
    switch (status) {
    case CallStatus::Success:  return QStringLiteral("success");
    case CallStatus::Rejected: return QStringLiteral("rejected");
    case CallStatus::Failed:   return QStringLiteral("failed");
    }
    return QStringLiteral("unknown");
}

} // namespace cr
