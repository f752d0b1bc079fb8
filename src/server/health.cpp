#include "health.hpp"

HealthReporter::HealthReporter(std::string model_name)
    : model_name_(std::move(model_name)) {}

void HealthReporter::mark_ready() {
    auto expected = ServiceState::Loading;
    state_.compare_exchange_strong(expected, ServiceState::Ready, std::memory_order_acq_rel);
}
