#pragma once
// Tracer and metrics sinks
//
// Optional observers of a planning call. The planner never depends on
// them being present; recoverable failures go to stderr either way and
// additionally to the tracer when one is attached.

#include <nlohmann/json.hpp>
#include <iostream>
#include <mutex>
#include <string>

namespace marga {

using json = nlohmann::json;

class Tracer {
public:
    virtual ~Tracer() = default;
    virtual void log_event(const std::string& kind, const json& payload) = 0;
};

class MetricsSink {
public:
    virtual ~MetricsSink() = default;
    // Returns an identifier used to correlate the plan with execution metrics
    virtual std::string start_tracking(const json& query_params) = 0;
};

// Writes one compact JSON line per event
class StderrTracer : public Tracer {
public:
    void log_event(const std::string& kind, const json& payload) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cerr << "[trace] " << kind << " " << payload.dump() << "\n";
    }

private:
    std::mutex mutex_;
};

// Log a recovered failure to stderr and, if attached, the tracer
inline void report_failure(Tracer* tracer, const std::string& component,
                           const std::string& kind, const std::string& message,
                           json detail = json::object()) {
    std::cerr << "[" << component << "] " << message << "\n";
    if (tracer) {
        detail["component"] = component;
        detail["message"] = message;
        tracer->log_event(kind, detail);
    }
}

} // namespace marga
