#pragma once

#include <atomic>
#include <string>

enum class ServiceState { Loading, Ready };

// Process readiness. Starts in Loading and moves to Ready exactly once,
// after the model has been loaded and the job queue is running.
class HealthReporter {
public:
    explicit HealthReporter(std::string model_name);

    // One-way; later calls are no-ops.
    void mark_ready();

    ServiceState state() const { return state_.load(std::memory_order_acquire); }
    bool ready() const { return state() == ServiceState::Ready; }
    const std::string& model_name() const { return model_name_; }

private:
    const std::string model_name_;
    std::atomic<ServiceState> state_{ServiceState::Loading};
};
