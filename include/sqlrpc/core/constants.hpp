#pragma once

#include <chrono>
#include <cstddef>

namespace sqlrpc {

namespace io {
inline constexpr std::size_t kReadBufferSize = 4096;
inline constexpr std::size_t kMaxMessageSize = 64 * 1024 * 1024;
// Worker side of the message pipe after the fork.
inline constexpr int kWorkerMessageFd = 3;
}  // namespace io

namespace timing {
inline constexpr auto kShutdownDrain = std::chrono::milliseconds(5000);
inline constexpr auto kShutdownPollInterval = std::chrono::milliseconds(50);
inline constexpr auto kMonitorPollInterval = std::chrono::milliseconds(100);
inline constexpr auto kSignalPollInterval = std::chrono::milliseconds(250);
inline constexpr auto kIdleWait = std::chrono::milliseconds(1000);
}  // namespace timing

namespace rpc_code {
inline constexpr int kParseError = -32700;
inline constexpr int kInvalidRequest = -32600;
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams = -32602;
inline constexpr int kInternalError = -32603;
inline constexpr int kRuntimeError = 10001;
inline constexpr int kDatabaseError = 10003;
inline constexpr int kCompilationError = 10004;
inline constexpr int kTimeout = 10008;
inline constexpr int kKilled = 10009;
inline constexpr int kServerCompiling = 10010;
inline constexpr int kServerError = 10011;
inline constexpr int kDuplicateRequest = 10012;
}  // namespace rpc_code

}  // namespace sqlrpc
