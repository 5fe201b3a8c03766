#pragma once

#include "likelihood.h"

#include "AgeRisk.Core/incidence_series.h"

#include <cstddef>
#include <string>
#include <vector>

namespace agerisk {

/// @brief Defines the shared model comparison metrics
struct EvaluationResult {
    /// @brief Calibration, mean squared probability error at the checkpoints
    double brier{};

    /// @brief Discrimination, time-dependent concordance in [0, 1]
    double time_auc{};

    /// @brief Fit, negative log-likelihood of the observations
    double nll{};

    /// @brief Akaike information criterion, 2k + 2 nll
    double aic{};
};

/// @brief Model evaluation entry for cross-model ranking
struct ModelEvaluation {
    /// @brief The model name
    std::string name;

    /// @brief Number of free model parameters
    std::size_t parameter_count{};

    /// @brief The model metrics
    EvaluationResult result{};
};

/// @brief Individual follow-up record for survival-style comparison
struct SurvivalRecord {
    /// @brief Event or censoring age
    double time{};

    /// @brief Whether the event was observed, false for censored
    bool event{};
};

/// @brief Evaluation options
struct EvaluationOptions {
    /// @brief Checkpoint ages, empty to use every checkpoint step within the observed ages
    std::vector<double> checkpoints{};

    /// @brief Checkpoint spacing in years
    double checkpoint_step{10.0};

    /// @brief Population unit of the series rates
    double rate_unit{100000.0};

    /// @brief Likelihood family of the observations
    LikelihoodFamily family{LikelihoodFamily::poisson};
};

/// @brief Computes calibration, discrimination and fit metrics of predicted series
///
/// @details All metrics are pure functions of the predictions, observations and
/// parameter count. Predicted series are read at the observed ages by linear
/// interpolation, both series must be on the same rate scale.
class EvaluationSuite {
  public:
    /// @brief Initialises a new instance of the EvaluationSuite class.
    /// @param options The evaluation options
    /// @throws core::InvalidParameter for invalid options
    explicit EvaluationSuite(EvaluationOptions options = {});

    /// @brief Gets the evaluation options
    const EvaluationOptions &options() const noexcept;

    /// @brief Gets the checkpoint ages for an observed series
    /// @param observed The observed series
    /// @return The checkpoint ages, ascending
    std::vector<double> checkpoints(const core::IncidenceSeries &observed) const;

    /// @brief Computes the Brier score at the checkpoint ages
    double brier_score(const core::IncidenceSeries &predicted,
                       const core::IncidenceSeries &observed) const;

    /// @brief Computes the time-dependent concordance at the checkpoint ages
    ///
    /// At each checkpoint t, every pair of observed ages up to t with different
    /// observed rates is compared, tied predictions count 0.5. The result is the
    /// mean over checkpoints with at least one comparable pair, 0.5 if none.
    double time_auc(const core::IncidenceSeries &predicted,
                    const core::IncidenceSeries &observed) const;

    /// @brief Computes the negative log-likelihood of the observations
    ///
    /// Observations at age zero are left out, the model curves are zero or
    /// unbounded there.
    /// @throws core::InvalidInput for empty series, or no observations past age zero
    double negative_log_likelihood(const core::IncidenceSeries &predicted,
                                   const core::IncidenceSeries &observed) const;

    /// @brief Computes all metrics for a model prediction
    /// @param predicted The model predicted series
    /// @param observed The observed or held-out series
    /// @param parameter_count Number of free model parameters
    /// @return The evaluation result
    /// @throws core::InvalidInput for empty series
    EvaluationResult evaluate(const core::IncidenceSeries &predicted,
                              const core::IncidenceSeries &observed,
                              std::size_t parameter_count) const;

    /// @brief Computes the Akaike information criterion
    /// @param nll The negative log-likelihood
    /// @param parameter_count Number of free model parameters
    /// @return 2k + 2 nll
    static double aic(double nll, std::size_t parameter_count) noexcept;

    /// @brief Computes the Brier score of individual records at age t
    ///
    /// Records censored before t have unknown status and are excluded.
    /// @param cohort The follow-up records
    /// @param probability Predicted event probability by t, per record
    /// @param t The checkpoint age
    /// @return The Brier score
    /// @throws core::InvalidInput for size mismatch or no records with known status
    static double brier_score(const std::vector<SurvivalRecord> &cohort,
                              const std::vector<double> &probability, double t);

    /// @brief Computes the cumulative/dynamic time-dependent AUC at age t
    ///
    /// Cases had the event by t, controls are event free past t.
    /// @param cohort The follow-up records
    /// @param risk_scores Predicted risk per record
    /// @param t The checkpoint age
    /// @return The AUC, ties count 0.5
    /// @throws core::InvalidInput for size mismatch or no comparable pairs
    static double time_dependent_auc(const std::vector<SurvivalRecord> &cohort,
                                     const std::vector<double> &risk_scores, double t);

    /// @brief Ranks model evaluations, best first
    ///
    /// Ordered by AIC, ties by negative log-likelihood, then by name.
    /// @param evaluations The model evaluations
    /// @return The ranked evaluations
    static std::vector<ModelEvaluation> rank(std::vector<ModelEvaluation> evaluations);

  private:
    EvaluationOptions options_;
};

} // namespace agerisk
