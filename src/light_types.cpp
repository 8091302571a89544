#include "light_types.h"

namespace lumactl {

QString cmdStatusName(CmdStatus status)
{
    switch (status) {
    case CmdStatus::Success:
        return QStringLiteral("success");
    case CmdStatus::InvalidArgument:
        return QStringLiteral("invalid argument");
    case CmdStatus::MissingParameter:
        return QStringLiteral("missing parameter");
    case CmdStatus::Timeout:
        return QStringLiteral("timeout");
    case CmdStatus::Cancelled:
        return QStringLiteral("cancelled");
    case CmdStatus::NotSupported:
        return QStringLiteral("not supported");
    case CmdStatus::DeviceFailure:
        return QStringLiteral("device failure");
    }
    return QStringLiteral("unknown");
}

} // namespace lumactl
