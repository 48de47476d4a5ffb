#pragma once

#include <string>

#include "api/exec_service.hpp"
#include "nlohmann/json.hpp"

namespace codebox::api {

// JSON request/response shim over ExecService, one object per call:
//   {"op": "executor.run", "language": "javascript", "files": [...], ...}
//   {"op": "session.create" | "session.upload" | "session.run" |
//          "session.download" | "session.list_files" |
//          "session.set_working_dir" | "session.close", "session": N, ...}
// Replies are {"ok": true, "value": ...} or {"ok": false, "error": {...}}.
class RpcDispatcher {
public:
    explicit RpcDispatcher(ExecService& service);

    nlohmann::json Dispatch(const nlohmann::json& request);
    // Parses one line; a malformed line yields an internal error reply.
    std::string DispatchLine(const std::string& line);

private:
    ExecService& service_;
};

}  // namespace codebox::api
