#include "core/generation/generator.h"

namespace dq {

QString generationStatusToString(GenerationResult::Status status)
{
    switch (status) {
    case GenerationResult::Status::Success:         return QStringLiteral("success");
    case GenerationResult::Status::Timeout:         return QStringLiteral("timeout");
    case GenerationResult::Status::NetworkError:    return QStringLiteral("network_error");
    case GenerationResult::Status::HttpError:       return QStringLiteral("http_error");
    case GenerationResult::Status::InvalidResponse: return QStringLiteral("invalid_response");
    case GenerationResult::Status::NotConfigured:   return QStringLiteral("not_configured");
    }
    return QStringLiteral("unknown");
}

} // namespace dq
