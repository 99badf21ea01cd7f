// === Rule Evaluators =========================================================
//
// One evaluator per anomaly category. Each is a stateless scan over the
// time-sorted points of a RuleContext and is safe to call from several
// threads at once. `make_rule_evaluator` resolves configured rule ids once, at
// engine construction; ids without an implementation resolve to a sentinel
// that reports "not implemented".

#pragma once

#include <memory>
#include <optional>
#include <string>

#include <spdlog/logger.h>

#include "flight_anomaly/rule_context.hpp"
#include "flight_anomaly/rule_result.hpp"

namespace flight_anomaly {

enum class RuleId : int {
    EmergencySquawk = 1,
    AltitudeChange = 2,
    AbruptTurn = 3,
    Proximity = 4,
    GoAround = 6,
    ReturnToField = 7,
    Diversion = 8,
    LowAltitude = 9,
    SignalLoss = 10,
    OffCourse = 11,
    UnplannedLanding = 12,
    MilitaryAircraft = 13,
    CircularFlight = 14,
    EnduranceBreach = 19,
};

/**
 * @brief Abstract anomaly detector.
 *
 * Implementations never mutate the context and report data-quality problems
 * through the result instead of throwing.
 */
class RuleEvaluator {
  public:
    virtual ~RuleEvaluator() = default;

    [[nodiscard]] virtual int id() const noexcept = 0;
    [[nodiscard]] virtual RuleResult evaluate(const RuleContext& context) const = 0;
};

/** @brief Sentinel for configured ids with no detector. */
class UnimplementedRule final : public RuleEvaluator {
  public:
    explicit UnimplementedRule(int rule_id) noexcept : rule_id_(rule_id) {}

    [[nodiscard]] int id() const noexcept override { return rule_id_; }
    [[nodiscard]] RuleResult evaluate(const RuleContext& context) const override;

  private:
    int rule_id_;
};

class EmergencySquawkRule final : public RuleEvaluator {
  public:
    [[nodiscard]] int id() const noexcept override { return static_cast<int>(RuleId::EmergencySquawk); }
    [[nodiscard]] RuleResult evaluate(const RuleContext& context) const override;
};

/** @brief Sudden altitude jumps at cruise, with zero-altitude noise bursts filtered out. */
class AltitudeChangeRule final : public RuleEvaluator {
  public:
    [[nodiscard]] int id() const noexcept override { return static_cast<int>(RuleId::AltitudeChange); }
    [[nodiscard]] RuleResult evaluate(const RuleContext& context) const override;
};

/**
 * @brief Abrupt single turns and accumulated holding orbits.
 *
 * Runs a smoothed single-turn pass, then an accumulation pass for 180 and 360
 * degree orbits and, when neither fires, a geometric fallback guarded by a
 * GPS glitch detector.
 */
class AbruptTurnRule final : public RuleEvaluator {
  public:
    [[nodiscard]] int id() const noexcept override { return static_cast<int>(RuleId::AbruptTurn); }
    [[nodiscard]] RuleResult evaluate(const RuleContext& context) const override;
};

class ProximityRule final : public RuleEvaluator {
  public:
    ProximityRule();

    [[nodiscard]] int id() const noexcept override { return static_cast<int>(RuleId::Proximity); }
    [[nodiscard]] RuleResult evaluate(const RuleContext& context) const override;

  private:
    std::shared_ptr<spdlog::logger> logger_;
};

class GoAroundRule final : public RuleEvaluator {
  public:
    [[nodiscard]] int id() const noexcept override { return static_cast<int>(RuleId::GoAround); }
    [[nodiscard]] RuleResult evaluate(const RuleContext& context) const override;
};

class ReturnToFieldRule final : public RuleEvaluator {
  public:
    [[nodiscard]] int id() const noexcept override { return static_cast<int>(RuleId::ReturnToField); }
    [[nodiscard]] RuleResult evaluate(const RuleContext& context) const override;
};

class DiversionRule final : public RuleEvaluator {
  public:
    [[nodiscard]] int id() const noexcept override { return static_cast<int>(RuleId::Diversion); }
    [[nodiscard]] RuleResult evaluate(const RuleContext& context) const override;
};

class LowAltitudeRule final : public RuleEvaluator {
  public:
    [[nodiscard]] int id() const noexcept override { return static_cast<int>(RuleId::LowAltitude); }
    [[nodiscard]] RuleResult evaluate(const RuleContext& context) const override;
};

class SignalLossRule final : public RuleEvaluator {
  public:
    [[nodiscard]] int id() const noexcept override { return static_cast<int>(RuleId::SignalLoss); }
    [[nodiscard]] RuleResult evaluate(const RuleContext& context) const override;
};

/**
 * @brief Membership test against learned tubes or paths plus the heatmap.
 *
 * Far off-path samples are handed to the context's promoter, when present, so
 * that recurring new routes become learned paths.
 */
class OffCourseRule final : public RuleEvaluator {
  public:
    OffCourseRule();

    [[nodiscard]] int id() const noexcept override { return static_cast<int>(RuleId::OffCourse); }
    [[nodiscard]] RuleResult evaluate(const RuleContext& context) const override;

  private:
    std::shared_ptr<spdlog::logger> logger_;
};

class UnplannedLandingRule final : public RuleEvaluator {
  public:
    [[nodiscard]] int id() const noexcept override { return static_cast<int>(RuleId::UnplannedLanding); }
    [[nodiscard]] RuleResult evaluate(const RuleContext& context) const override;
};

class MilitaryAircraftRule final : public RuleEvaluator {
  public:
    [[nodiscard]] int id() const noexcept override { return static_cast<int>(RuleId::MilitaryAircraft); }
    [[nodiscard]] RuleResult evaluate(const RuleContext& context) const override;
};

class CircularFlightRule final : public RuleEvaluator {
  public:
    [[nodiscard]] int id() const noexcept override { return static_cast<int>(RuleId::CircularFlight); }
    [[nodiscard]] RuleResult evaluate(const RuleContext& context) const override;
};

class EnduranceBreachRule final : public RuleEvaluator {
  public:
    [[nodiscard]] int id() const noexcept override { return static_cast<int>(RuleId::EnduranceBreach); }
    [[nodiscard]] RuleResult evaluate(const RuleContext& context) const override;
};

/** @brief Evaluator for @p rule_id, or an UnimplementedRule sentinel. */
[[nodiscard]] std::unique_ptr<RuleEvaluator> make_rule_evaluator(int rule_id);

}  // namespace flight_anomaly
