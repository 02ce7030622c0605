#pragma once

#include "../protocol/message.hpp"
#include "aggregate_stats.hpp"
#include "feed.hpp"

namespace exomon {
namespace monitor {

/**
 * Type Router
 *
 * Dispatches a decoded envelope to its handler. Each handler builds the
 * feed lines for its message and, for log_entry and performance_metrics,
 * updates the aggregate state. A handler failure is reported as a
 * HandlerFault line and counted; it never escapes dispatch().
 *
 * Not thread-safe: called from the receive thread only.
 */
class MessageRouter {
public:
    MessageRouter(AggregateStats& stats, IFeedSink& feed, bool show_unknown = true);

    void dispatch(const protocol::Envelope& env);

    void set_show_unknown(bool show) { show_unknown_ = show; }
    bool show_unknown() const { return show_unknown_; }

    // Handlers. Public so the rendering of each message kind can be checked
    // without a feed.
    RenderRequest on_welcome(const protocol::Envelope& env, const protocol::WelcomePayload& p);
    RenderRequest on_log_entry(const protocol::Envelope& env, const protocol::LogEntryPayload& p);
    RenderRequest on_performance(const protocol::Envelope& env, const protocol::PerformanceMetricsPayload& p);
    RenderRequest on_service_status(const protocol::Envelope& env, const protocol::ServiceStatusPayload& p);
    RenderRequest on_network_discovery(const protocol::Envelope& env,
                                       const protocol::NetworkDiscoveryPayload& p);
    RenderRequest on_debug_message(const protocol::Envelope& env, const protocol::DebugMessagePayload& p);
    RenderRequest on_unknown(const protocol::Envelope& env, const protocol::UnknownPayload& p);

private:
    AggregateStats& stats_;
    IFeedSink& feed_;
    bool show_unknown_;
};

} // namespace monitor
} // namespace exomon
