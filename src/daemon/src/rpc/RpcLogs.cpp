/*
 * Valheim Server Manager — RPC: Server and framework logs
 * (c) 2025 ValheimServerManager contributors
 */
#include <algorithm>
#include <nlohmann/json.hpp>
#include <string>

#include "include/Daemon.hpp"
#include "include/CommandRegistry.hpp"   // ok_ / err_
#include "include/LogTailer.hpp"
#include "include/Log.hpp"

namespace vsm {

using nlohmann::json;

namespace {

constexpr int kDefaultLines = 50;
constexpr int kMaxLines     = 1000;

bool lineCount_(const RpcRequest& rq, size_t& out) {
    const json p = paramsAsObject(rq);
    auto it = p.find("lines");
    if (it == p.end()) {
        out = kDefaultLines;
        return true;
    }
    if (!it->is_number_integer()) return false;
    const int n = it->get<int>();
    if (n <= 0 || n > kMaxLines) return false;
    out = static_cast<size_t>(n);
    return true;
}

} // namespace

void BindRpcLogs(Daemon& self, CommandRegistry& reg) {
    // Params: { lines?: 1..1000 }. Buffered lines of this run, else the log file tail.
    reg.add(
        "logs.tail",
        "Recent dedicated server log lines",
        [&self](const RpcRequest& rq) -> RpcResult {
            size_t n = 0;
            if (!lineCount_(rq, n)) {
                return err_(rq, "logs.tail", rpc_errors::kInvalidParams, "'lines' must be 1..1000");
            }
            json lines = json::array();
            const auto entries = self.serverLog().recent(n);
            if (!entries.empty()) {
                for (const auto& e : entries) {
                    lines.push_back(json{
                        {"ts",      e.timestampMs},
                        {"level",   serverLogLevelName(e.level)},
                        {"message", e.message}
                    });
                }
                return ok_(rq, "logs.tail", json{{"source", "buffer"}, {"lines", lines}});
            }

            const std::string path = self.watchdog().logPath();
            if (path.empty()) return ok_(rq, "logs.tail", json{{"source", "none"}, {"lines", lines}});
            for (const auto& raw : LogTailer::readLastLines(path, n)) {
                const ServerLogEntry e = parseLogLine(raw);
                lines.push_back(json{
                    {"ts",      e.timestampMs},
                    {"level",   serverLogLevelName(e.level)},
                    {"message", e.message}
                });
            }
            return ok_(rq, "logs.tail", json{{"source", path}, {"lines", lines}});
        }
    );

    reg.add(
        "framework.tail",
        "Recent BepInEx log lines",
        [&self](const RpcRequest& rq) -> RpcResult {
            size_t n = 0;
            if (!lineCount_(rq, n)) {
                return err_(rq, "framework.tail", rpc_errors::kInvalidParams, "'lines' must be 1..1000");
            }
            std::string path = self.framework().logPath();
            if (path.empty()) path = self.config().framework.logFile;

            json lines = json::array();
            for (const auto& raw : LogTailer::readLastLines(path, n)) {
                const FrameworkLogEntry e = parseFrameworkLogLine(raw);
                lines.push_back(json{
                    {"level",   frameworkLogLevelName(e.level)},
                    {"source",  e.source},
                    {"message", e.message}
                });
            }
            return ok_(rq, "framework.tail", json{
                {"file",      path},
                {"following", self.framework().running()},
                {"lines",     lines}
            });
        }
    );
}

} // namespace vsm
