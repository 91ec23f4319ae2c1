#include "shardex/error_handling.hpp"

namespace shardex {

std::string ErrorCategory::message(int ev) const {
    switch (static_cast<ErrorCode>(ev)) {
        case ErrorCode::SUCCESS: return "Success";

        case ErrorCode::ORDER_INVALID: return "Invalid order";
        case ErrorCode::ORDER_DUPLICATE: return "Duplicate order";
        case ErrorCode::ORDER_NOT_FOUND: return "Order not found";

        case ErrorCode::RISK_LIMIT_EXCEEDED: return "Risk limit exceeded";
        case ErrorCode::POSITION_LIMIT_EXCEEDED: return "Position limit exceeded";

        case ErrorCode::MEMORY_POOL_EXHAUSTED: return "Memory pool exhausted";
        case ErrorCode::SHARD_BUSY: return "Shard busy";

        case ErrorCode::FILE_NOT_FOUND: return "File not found";
        case ErrorCode::CONFIG_INVALID: return "Invalid configuration";
        case ErrorCode::CONFIG_INTEGRITY_FAILED: return "Configuration integrity check failed";

        case ErrorCode::INTERNAL_INVARIANT_VIOLATION: return "Internal invariant violation";

        default: return "Unknown error";
    }
}

const ErrorCategory& error_category() {
    static ErrorCategory instance;
    return instance;
}

std::error_code make_error_code(ErrorCode ec) {
    return {static_cast<int>(ec), error_category()};
}

} // namespace shardex
