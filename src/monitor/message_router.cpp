#include "../../include/monitor/message_router.hpp"
#include "../../include/errors.hpp"
#include "../../include/util/time_utils.hpp"

#include <algorithm>
#include <exception>
#include <string>
#include <type_traits>
#include <variant>

namespace exomon::monitor {

using namespace protocol;

namespace {

std::string stamp(const Envelope& env) {
    return "[" + env.time + "] ";
}

std::string online_marker(bool online) {
    return online ? "[online] " : "[offline] ";
}

std::string join(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i)
            out += sep;
        out += items[i];
    }
    return out;
}

} // namespace

MessageRouter::MessageRouter(AggregateStats& stats, IFeedSink& feed, bool show_unknown)
    : stats_(stats), feed_(feed), show_unknown_(show_unknown) {}

void MessageRouter::dispatch(const Envelope& env) {
    stats_.record_message();

    try {
        RenderRequest request = std::visit(
            [&](const auto& payload) -> RenderRequest {
                using T = std::decay_t<decltype(payload)>;
                if constexpr (std::is_same_v<T, WelcomePayload>)
                    return on_welcome(env, payload);
                else if constexpr (std::is_same_v<T, LogEntryPayload>)
                    return on_log_entry(env, payload);
                else if constexpr (std::is_same_v<T, PerformanceMetricsPayload>)
                    return on_performance(env, payload);
                else if constexpr (std::is_same_v<T, ServiceStatusPayload>)
                    return on_service_status(env, payload);
                else if constexpr (std::is_same_v<T, NetworkDiscoveryPayload>)
                    return on_network_discovery(env, payload);
                else if constexpr (std::is_same_v<T, DebugMessagePayload>)
                    return on_debug_message(env, payload);
                else
                    return on_unknown(env, payload);
            },
            env.payload);

        if (!request.empty())
            feed_.emit(request);
    } catch (const std::exception& e) {
        HandlerFault fault(env.type_tag(), e.what());
        stats_.record_handler_fault();
        RenderRequest report;
        report.add(Tone::Error, "Error processing " + fault.message_type() + " message: " + fault.what());
        feed_.emit(report);
    }
}

RenderRequest MessageRouter::on_welcome(const Envelope& env, const WelcomePayload& p) {
    RenderRequest r;
    r.add(Tone::Success, stamp(env) + "Connected to " + p.server + " v" + p.version);
    r.add(Tone::Plain, "   Capabilities: " + join(p.capabilities, ", "));
    r.add(Tone::Dim, separator('-'));
    return r;
}

RenderRequest MessageRouter::on_log_entry(const Envelope& env, const LogEntryPayload& p) {
    Severity severity = stats_.record_log_entry(p.is_error, p.level);

    Tone tone = Tone::Info;
    if (severity == Severity::Error)
        tone = Tone::Error;
    else if (severity == Severity::Warning)
        tone = Tone::Warning;

    RenderRequest r;
    r.add(tone, stamp(env) + "[" + p.level + "] " + p.message);
    return r;
}

RenderRequest MessageRouter::on_performance(const Envelope& env, const PerformanceMetricsPayload& p) {
    PerformanceSample sample;
    sample.captured_at_ns = util::wall_clock_ns();
    sample.cpu = p.cpu;
    sample.memory = p.memory;
    sample.disk = p.disk;
    sample.gpu = p.gpu;
    stats_.record_performance(sample);

    auto reach = [](bool ok) { return ok ? std::string("up") : std::string("down"); };

    RenderRequest r;
    r.add(Tone::Highlight, stamp(env) + "CPU: " + format_fixed(p.cpu) + "% | Memory: " + format_fixed(p.memory) +
                               "% | Disk: " + format_fixed(p.disk) + "% | GPU: " + format_fixed(p.gpu) + "%");
    r.add(Tone::Plain, "   Network: " + p.network_status + " | Web: " + reach(p.web_interface_accessible) +
                           " | API: " + reach(p.api_endpoint_accessible));
    return r;
}

RenderRequest MessageRouter::on_service_status(const Envelope& env, const ServiceStatusPayload& p) {
    std::string status;
    Tone tone = Tone::Plain;
    if (p.is_installing) {
        status = "Installing";
        if (!p.installation_progress.empty())
            status += " - " + p.installation_progress;
        tone = Tone::Info;
    } else if (p.is_uninstalling) {
        status = "Uninstalling";
        tone = Tone::Info;
    } else if (p.is_installed) {
        status = p.is_running ? "Running" : "Stopped";
        tone = p.is_running ? Tone::Success : Tone::Warning;
    } else {
        status = "Not Installed";
    }

    RenderRequest r;
    r.add(tone, stamp(env) + "Service: " + status);
    if (!p.last_error.empty())
        r.add(Tone::Error, "   Error: " + p.last_error);
    return r;
}

RenderRequest MessageRouter::on_network_discovery(const Envelope& env, const NetworkDiscoveryPayload& p) {
    RenderRequest r;
    r.add(Tone::Info, stamp(env) + "Network Discovery: " + (p.is_discovering ? "Scanning" : "Idle") +
                          " | Nodes: " + std::to_string(p.discovered_nodes_count));
    if (!p.last_error.empty())
        r.add(Tone::Error, "   Error: " + p.last_error);

    // Most recent nodes are at the end
    size_t shown = std::min(p.nodes.size(), config::feed::RECENT_NODES);
    for (size_t i = p.nodes.size() - shown; i < p.nodes.size(); ++i) {
        const auto& node = p.nodes[i];
        r.add(node.is_online ? Tone::Success : Tone::Dim,
              "   " + online_marker(node.is_online) + node.name + " (" + node.address + ")");
    }
    return r;
}

RenderRequest MessageRouter::on_debug_message(const Envelope& env, const DebugMessagePayload& p) {
    const std::string& source = (!env.source_present && !p.source.empty()) ? p.source : env.source;

    Tone tone = Tone::Dim;
    if (p.level == "ERROR")
        tone = Tone::Error;
    else if (p.level == "WARNING")
        tone = Tone::Warning;

    RenderRequest r;
    r.add(tone, stamp(env) + "[" + source + "] " + p.message);
    return r;
}

RenderRequest MessageRouter::on_unknown(const Envelope& env, const UnknownPayload& p) {
    stats_.record_unknown_type();

    RenderRequest r;
    if (show_unknown_)
        r.add(Tone::Dim, stamp(env) + "Unknown message type: " + p.type_tag);
    return r;
}

} // namespace exomon::monitor
