#include "app/app.h"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "core/log.h"
#include "geometry/aabb.h"

namespace railyard::app {
namespace {

constexpr std::uint32_t kMaxTickCount = 1000000;
constexpr double kMinTickMilliseconds = 1.0;
constexpr double kMaxTickMilliseconds = 1000.0;
constexpr std::uint32_t kReportEveryTicks = 50;

std::optional<double> parseNumber(const char* text) {
    if (text == nullptr || *text == '\0') {
        return std::nullopt;
    }
    char* end = nullptr;
    const double value = std::strtod(text, &end);
    if (end == text || *end != '\0') {
        return std::nullopt;
    }
    return value;
}

} // namespace

AppConfig clampAppConfig(const AppConfig& config) {
    AppConfig clamped = config;
    clamped.tickCount = std::min(config.tickCount, kMaxTickCount);
    clamped.tickMilliseconds = std::clamp(config.tickMilliseconds, kMinTickMilliseconds, kMaxTickMilliseconds);
    return clamped;
}

AppConfig loadAppConfigFromEnvironment() {
    AppConfig config{};
    if (const std::optional<double> ticks = parseNumber(std::getenv("RAILYARD_TICKS"))) {
        config.tickCount = static_cast<std::uint32_t>(std::clamp(*ticks, 0.0, static_cast<double>(kMaxTickCount)));
    }
    if (const std::optional<double> tickMs = parseNumber(std::getenv("RAILYARD_TICK_MS"))) {
        config.tickMilliseconds = *tickMs;
    }
    if (const char* throttle = std::getenv("RAILYARD_THROTTLE")) {
        if (const std::optional<sim::ThrottleStep> step = sim::parseThrottleStep(throttle)) {
            config.throttle = *step;
        } else {
            RY_LOGW("main") << "ignoring RAILYARD_THROTTLE=" << throttle;
        }
    }
    return clampAppConfig(config);
}

App::App(const AppConfig& config)
    : m_config(clampAppConfig(config)),
      m_resolver(m_graph) {}

bool App::init() {
    using Clock = std::chrono::steady_clock;
    const auto initStart = Clock::now();

    RY_LOGI("app") << "init begin";
    m_trackEventsToken = m_graph.subscribe([this](const track::TrackEvent& event) {
        std::visit(
            [this](const auto& payload) {
                using Event = std::decay_t<decltype(payload)>;
                if constexpr (std::is_same_v<Event, track::DrawDataAdded>) {
                    ++m_drawDataAdded;
                } else if constexpr (std::is_same_v<Event, track::DrawDataDeleted>) {
                    ++m_drawDataDeleted;
                }
            },
            event);
    });

    if (!buildLayout()) {
        RY_LOGE("app") << "demo layout could not be built";
        return false;
    }
    if (!m_graph.validateTopology()) {
        RY_LOGE("app") << "demo layout failed topology validation";
        return false;
    }

    m_train = std::make_unique<sim::Train>(m_graph, m_resolver);
    const std::optional<track::ProjectionCurveResult> start = m_graph.projectPointOnTrack(math::Vec2{260.0, 0.0});
    if (!start.has_value()) {
        RY_LOGE("app") << "could not find the mainline to place the train";
        return false;
    }
    const sim::TrainPosition placement{start->segment, start->atT, track::TravelDirection::Tangent, start->projectionPoint};
    if (!m_train->setPosition(placement)) {
        RY_LOGE("app") << "train does not fit at the start position";
        return false;
    }
    m_train->setThrottle(m_config.throttle);

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - initStart).count();
    RY_LOGI("app") << "init complete: " << m_graph.getJoints().size() << " joints, "
                   << m_graph.trackSegments().size() << " segments, " << m_drawDataAdded << " draw slices in "
                   << elapsed << " ms";
    return true;
}

bool App::buildLayout() {
    // Mainline with a passing loop and a ramped flyover crossing it.
    if (!m_graph.createNewTrackSegment(math::Vec2{0.0, 0.0}, math::Vec2{200.0, 0.0}, {})) {
        return false;
    }
    const std::optional<track::ProjectionJointResult> west = m_graph.pointOnJoint(math::Vec2{200.0, 0.0});
    if (!west.has_value() || !m_graph.extendTrackFromJoint(west->joint, math::Vec2{800.0, 0.0}, {})) {
        return false;
    }
    const std::optional<track::ProjectionJointResult> east = m_graph.pointOnJoint(math::Vec2{800.0, 0.0});
    if (!east.has_value() || !m_graph.extendTrackFromJoint(east->joint, math::Vec2{1000.0, 0.0}, {})) {
        return false;
    }

    // Preview the loop the way an editor would before committing it.
    const track::NewJointType loopStart = track::determineNewJointType(math::Vec2{200.0, 0.0}, m_graph.project(math::Vec2{200.0, 0.0}));
    const track::NewJointType loopEnd = track::determineNewJointType(math::Vec2{500.0, 60.0}, m_graph.project(math::Vec2{500.0, 60.0}));
    const track::PreviewCurveResult preview = m_previewCalculator.getPreviewCurve(loopStart, loopEnd);
    if (preview.controlPoints.size() < 3) {
        return false;
    }
    const std::vector<math::Vec2> loopControls(preview.controlPoints.begin() + 1, preview.controlPoints.end() - 1);
    if (!m_graph.branchToNewJoint(west->joint, preview.controlPoints.back(), loopControls)) {
        return false;
    }
    const std::optional<track::ProjectionJointResult> loopMid = m_graph.pointOnJoint(preview.controlPoints.back());
    if (!loopMid.has_value() || !m_graph.connectJoints(loopMid->joint, east->joint, {math::Vec2{700.0, 60.0}})) {
        return false;
    }

    if (!m_graph.createNewTrackSegment(
            math::Vec2{400.0, -150.0},
            math::Vec2{600.0, 150.0},
            {},
            track::Elevation::Ground,
            track::Elevation::Above2)) {
        return false;
    }
    logDrawOrder();
    return true;
}

void App::logDrawOrder() {
    const std::vector<track::TrackDrawData> drawData =
        m_graph.getDrawData(geometry::Aabb{math::Vec2{-100.0, -300.0}, math::Vec2{1100.0, 300.0}});
    for (std::size_t i = 0; i < drawData.size(); ++i) {
        const track::TrackDrawData& slice = drawData[i];
        RY_LOGD("app") << "draw " << i << ": segment " << slice.key.segment << " slice " << slice.key.sliceIndex
                       << " t [" << slice.tInterval.start << ", " << slice.tInterval.end << "] height "
                       << slice.elevation.from << " -> " << slice.elevation.to;
    }
}

void App::run() {
    RY_LOGI("app") << "run begin: " << m_config.tickCount << " ticks of " << m_config.tickMilliseconds
                   << " ms, throttle " << sim::throttleName(m_config.throttle);
    for (std::uint32_t tick = 0; tick < m_config.tickCount; ++tick) {
        m_train->update(m_config.tickMilliseconds);
        if (tick % kReportEveryTicks != 0) {
            continue;
        }
        const std::optional<sim::TrainPosition>& position = m_train->position();
        if (!position.has_value()) {
            break;
        }
        RY_LOGI("app") << "tick " << tick << ": segment " << position->segment << " t " << position->t << " at ("
                       << position->point.x << ", " << position->point.y << ") speed " << m_train->speed()
                       << " occupied joints " << m_train->occupiedJoints().size();
    }
    if (m_train->throttle() == sim::ThrottleStep::Neutral && m_config.throttle != sim::ThrottleStep::Neutral) {
        RY_LOGI("app") << "train came to a hard stop at the end of the line";
    }
}

void App::shutdown() {
    RY_LOGI("app") << "shutdown begin";
    m_train.reset();
    if (m_trackEventsToken != core::kInvalidSubscriptionToken) {
        m_graph.unsubscribe(m_trackEventsToken);
        m_trackEventsToken = core::kInvalidSubscriptionToken;
    }
    RY_LOGI("app") << "shutdown complete: " << m_drawDataAdded << " slices added, " << m_drawDataDeleted
                   << " removed";
}

} // namespace railyard::app
