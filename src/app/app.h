#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include "sim/joint_direction.h"
#include "sim/train.h"
#include "track/preview_curve.h"
#include "track/track_graph.h"

// App subsystem
// Responsible for: building a demo layout, driving the train at a fixed tick, and reporting what happened.
// Should NOT do: contain track or train rules, rendering, or input handling.
namespace railyard::app {

struct AppConfig {
    std::uint32_t tickCount = 600;
    double tickMilliseconds = 100.0;
    sim::ThrottleStep throttle = sim::ThrottleStep::P5;
};

// Reads RAILYARD_TICKS, RAILYARD_TICK_MS and RAILYARD_THROTTLE; malformed values keep the defaults.
[[nodiscard]] AppConfig loadAppConfigFromEnvironment();
[[nodiscard]] AppConfig clampAppConfig(const AppConfig& config);

class App {
public:
    explicit App(const AppConfig& config = AppConfig{});

    bool init();
    void run();
    void shutdown();

    [[nodiscard]] const track::TrackGraph& graph() const { return m_graph; }

private:
    bool buildLayout();
    void logDrawOrder();

    AppConfig m_config{};
    track::TrackGraph m_graph;
    sim::DefaultJointDirectionResolver m_resolver;
    std::unique_ptr<sim::Train> m_train;
    track::PreviewCurveCalculator m_previewCalculator;
    core::SubscriptionToken m_trackEventsToken = core::kInvalidSubscriptionToken;
    std::uint64_t m_drawDataAdded = 0;
    std::uint64_t m_drawDataDeleted = 0;
};

} // namespace railyard::app
