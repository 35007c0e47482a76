#include "slidewatch/processing/threshold_sweep.hpp"
#include "slidewatch/core/errors.hpp"
#include "slidewatch/core/logging.hpp"
#include "slidewatch/processing/analysis_pipeline.hpp"
#include <algorithm>
#include <exception>
#include <sstream>

namespace slidewatch {

std::string ThresholdSweep::trial_name(size_t index) {
    std::string name;
    size_t n = index + 1;
    while (n > 0) {
        --n;
        name.insert(name.begin(), static_cast<char>('a' + n % 26));
        n /= 26;
    }
    return name;
}

std::vector<SweepTrial> ThresholdSweep::run(
    const std::vector<ReadingSeries>& series_list,
    const std::vector<KnownEvent>& events,
    const DetectionConfig& base_config,
    const std::vector<double>& rises,
    const std::vector<double>& rates
) {
    if (rises.empty() || rates.empty()) {
        throw ConfigError("Threshold sweep needs at least one rise and one rate");
    }

    // Fail before any work starts
    std::vector<DetectionConfig> configs;
    configs.reserve(rises.size() * rates.size());
    for (double rise_critical : rises) {
        for (double rate_critical : rates) {
            DetectionConfig config = base_config;
            config.rise_critical = rise_critical;
            config.rate_critical = rate_critical;
            config.validate();
            configs.push_back(config);
        }
    }

    std::vector<SweepTrial> trials(configs.size());
    std::vector<std::exception_ptr> failures(configs.size());
    const int64_t count = static_cast<int64_t>(configs.size());

    log::info("sweep", "Running " + std::to_string(count) + " trials");

#ifdef _OPENMP
    #pragma omp parallel for schedule(dynamic, 1)
#endif
    for (int64_t i = 0; i < count; ++i) {
        const auto idx = static_cast<size_t>(i);
        try {
            const DetectionConfig& config = configs[idx];
            RunResult result = AnalysisPipeline::run(series_list, events, config);

            SweepTrial& trial = trials[idx];
            trial.name = trial_name(idx);
            trial.rise_critical = config.rise_critical;
            trial.rate_critical = config.rate_critical;
            trial.true_positives = result.summary.true_positives;
            trial.false_positives = result.summary.false_positives;
            trial.false_negatives = result.summary.false_negatives;
            for (const auto& n : result.summary.notification_times) {
                trial.notification_times.push_back(n.lead_time_minutes);
            }
        } catch (...) {
            failures[idx] = std::current_exception();
        }
    }

    for (const auto& failure : failures) {
        if (failure) {
            std::rethrow_exception(failure);
        }
    }

    return trials;
}

std::string ThresholdSweep::format_table(const std::vector<SweepTrial>& trials) {
    std::ostringstream out;
    out << "Trial\tR_C\tM_C\tTP\tFP\tFN\tNotification Times\n";

    for (const auto& trial : trials) {
        std::vector<int64_t> times = trial.notification_times;
        std::sort(times.begin(), times.end());

        out << trial.name << '\t' << trial.rise_critical << '\t' << trial.rate_critical
            << '\t' << trial.true_positives << '\t' << trial.false_positives
            << '\t' << trial.false_negatives << "\t[";
        for (size_t i = 0; i < times.size(); ++i) {
            if (i > 0) {
                out << ", ";
            }
            out << times[i];
        }
        out << "]\n";
    }

    return out.str();
}

} // namespace slidewatch
