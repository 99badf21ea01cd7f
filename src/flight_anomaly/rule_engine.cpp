#include "flight_anomaly/rule_engine.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <stdexcept>
#include <thread>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "flight_anomaly/errors.hpp"
#include "flight_anomaly/logging.hpp"
#include "flight_anomaly/rule_context.hpp"
#include "flight_anomaly/version.hpp"

namespace flight_anomaly {

namespace {

std::string normalized_callsign(const std::string& callsign) {
    const auto first = callsign.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = callsign.find_last_not_of(" \t\r\n");
    std::string result = callsign.substr(first, last - first + 1);
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char character) {
        return static_cast<char>(std::toupper(character));
    });
    return result;
}

}  // namespace

void to_json(nlohmann::json& document, const FlightReport& report) {
    document = nlohmann::json{
        {"flight_id", report.flight_id},
        {"filtered", report.filtered},
        {"filter_reason", nullptr},
        {"total_rules", report.evaluations.size()},
        {"evaluations", report.evaluations},
        {"matched_rules", report.matched_rules},
        {"engine_version", std::string{k_version}},
    };
    if (report.filter_reason.has_value()) {
        document["filter_reason"] = *report.filter_reason;
    }
}

std::optional<std::string> gateway_exemption(const std::vector<TrackPoint>& sorted_points, const GatewayParameters& gateway) {
    const auto points_above = std::count_if(sorted_points.begin(), sorted_points.end(), [&gateway](const TrackPoint& point) {
        return point.alt > gateway.min_altitude_ft;
    });
    if (points_above < gateway.min_points_above) {
        return fmt::format(
            "Only {} points above {:.0f} ft (need {})",
            points_above,
            gateway.min_altitude_ft,
            gateway.min_points_above
        );
    }

    for (const TrackPoint& point : sorted_points) {
        if (!point.callsign.has_value()) {
            continue;
        }
        const std::string callsign = normalized_callsign(*point.callsign);
        for (const std::string& prefix : gateway.excluded_callsign_prefixes) {
            if (!prefix.empty() && callsign.compare(0, prefix.size(), prefix) == 0) {
                return fmt::format("Excluded callsign prefix {} ({})", prefix, callsign);
            }
        }
    }
    return std::nullopt;
}

RuleEngine::RuleEngine(
    RuleParameters parameters,
    std::vector<RuleDefinition> definitions,
    PathLibraryStore& library_store,
    const FlightRepository* repository,
    int workers
)
    : struct_parameters_(std::move(parameters)),
      list_definitions_(std::move(definitions)),
      airports_(struct_parameters_.airports, struct_parameters_.runway_headings),
      library_store_(library_store),
      repository_(repository),
      workers_(std::max(1, workers)),
      logger_(get_logger()) {
    list_evaluators_.reserve(list_definitions_.size());
    for (const RuleDefinition& definition : list_definitions_) {
        list_evaluators_.push_back(make_rule_evaluator(definition.id));
    }
    logger_->info("Rule engine ready with {} rules and {} workers", list_definitions_.size(), workers_);
}

const std::vector<RuleDefinition>& RuleEngine::definitions() const noexcept {
    return list_definitions_;
}

FlightReport RuleEngine::evaluate_track(const FlightTrack& track, const FlightMetadata* metadata) const {
    const RuleEnvironment environment{struct_parameters_, airports_, library_store_.snapshot(), &library_store_};
    const RuleContext context{track, metadata, repository_, environment};

    FlightReport report{};
    report.flight_id = track.flight_id();
    report.evaluations.reserve(list_definitions_.size());

    if (auto reason = gateway_exemption(context.points(), struct_parameters_.gateway)) {
        logger_->debug("Flight {} exempt: {}", track.flight_id(), *reason);
        report.filtered = true;
        for (const RuleDefinition& definition : list_definitions_) {
            RuleResult result = RuleResult::filtered(definition.id, *reason);
            result.rule_name = definition.name;
            report.evaluations.push_back(std::move(result));
        }
        report.filter_reason = std::move(reason);
        return report;
    }

    for (std::size_t index = 0; index < list_definitions_.size(); ++index) {
        RuleResult result = run_rule(*list_evaluators_[index], list_definitions_[index], context);
        if (result.matched) {
            report.matched_rules.push_back(result);
        }
        report.evaluations.push_back(std::move(result));
    }

    logger_->info(
        R"({{"component":"rule_engine","flight":{},"rules":{},"matched":{}}})",
        json_quoted(report.flight_id),
        report.evaluations.size(),
        report.matched_rules.size()
    );
    return report;
}

FlightReport RuleEngine::evaluate_flight(const std::string& flight_id, const FlightMetadata* metadata) const {
    if (repository_ == nullptr) {
        throw RepositoryError(fmt::format("No flight repository configured to fetch {}", flight_id));
    }
    const std::optional<FlightTrack> track = repository_->fetch_flight(flight_id);
    if (!track.has_value()) {
        throw RepositoryError(fmt::format("Flight {} not found", flight_id));
    }
    return evaluate_track(*track, metadata);
}

std::vector<FlightReport> RuleEngine::evaluate_batch(const std::vector<std::string>& flight_ids) const {
    std::vector<std::optional<FlightReport>> slots(flight_ids.size());
    std::atomic<std::size_t> next_index{0};

    const auto worker = [&]() {
        for (std::size_t index = next_index++; index < flight_ids.size(); index = next_index++) {
            try {
                slots[index] = evaluate_flight(flight_ids[index]);
            } catch (const std::exception& exc) {
                logger_->error(
                    R"({{"component":"rule_engine","flight":{},"operation":"evaluate_batch","error":{}}})",
                    json_quoted(flight_ids[index]),
                    json_quoted(exc.what())
                );
            }
        }
    };

    const std::size_t thread_count = std::min<std::size_t>(static_cast<std::size_t>(workers_), flight_ids.size());
    std::vector<std::thread> threads;
    threads.reserve(thread_count);
    for (std::size_t index = 0; index < thread_count; ++index) {
        threads.emplace_back(worker);
    }
    for (std::thread& thread : threads) {
        thread.join();
    }

    std::vector<FlightReport> reports;
    reports.reserve(flight_ids.size());
    for (auto& slot : slots) {
        if (slot.has_value()) {
            reports.push_back(std::move(*slot));
        }
    }
    return reports;
}

RuleResult RuleEngine::run_rule(const RuleEvaluator& evaluator, const RuleDefinition& definition, const RuleContext& context) const {
    RuleResult result{};
    try {
        result = evaluator.evaluate(context);
    } catch (const std::exception& exc) {
        logger_->error(
            R"({{"component":"rule_engine","flight":{},"rule":{},"error":{}}})",
            json_quoted(context.track().flight_id()),
            definition.id,
            json_quoted(exc.what())
        );
        result = RuleResult::skipped(definition.id, fmt::format("Skipped: {}", exc.what()), NoteDetails{exc.what()});
    }
    result.rule_name = definition.name;
    return result;
}

}  // namespace flight_anomaly
