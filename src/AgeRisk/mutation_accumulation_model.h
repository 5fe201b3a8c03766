#pragma once

#include "mutation_model_types.h"

#include <cstddef>
#include <iterator>
#include <memory>
#include <vector>

namespace agerisk {

class PredictionSequence;

/// @brief Implements the mutation accumulation model of malignancy risk (Model A)
///
/// @details Each of M independent stem-cell clones divides N(a) times by age a,
/// every division fixing a driver mutation with probability p_eff = p (1 - r).
/// A clone is malignant once it accumulates C driver hits, the tissue is malignant
/// once any clone is:
///
///   P_clone(a) = 1 - sum_{k < C} Binomial(k; N(a), p_eff)
///   P(a)       = 1 - (1 - P_clone(a))^M
///
/// N(a) counts completed divisions, floor(divisions_per_year * a).
class MutationAccumulationModel {
  public:
    MutationAccumulationModel() = delete;

    /// @brief Initialises a new instance of the MutationAccumulationModel class, analytic mode.
    /// @param parameters The model parameters
    /// @throws core::InvalidParameter for parameters outside of the valid domain
    explicit MutationAccumulationModel(ModelAParameters parameters);

    /// @brief Initialises a new instance of the MutationAccumulationModel class, Monte Carlo
    /// mode.
    /// @param parameters The model parameters
    /// @param options The simulation options
    /// @throws core::InvalidParameter for parameters outside of the valid domain
    MutationAccumulationModel(ModelAParameters parameters, MonteCarloOptions options);

    /// @brief Gets the model evaluation mode
    EvaluationMode mode() const noexcept;

    /// @brief Gets the model parameters
    const ModelAParameters &parameters() const noexcept;

    /// @brief Gets the number of completed divisions at a given age
    /// @param age The age in years
    /// @return The completed divisions count
    /// @throws core::InvalidInput for negative ages
    double divisions_at(double age) const;

    /// @brief Gets the probability of a single clone being malignant by a given age
    /// @param age The age in years
    /// @return The clone probability
    /// @throws core::InvalidInput for negative ages
    double clone_probability(double age) const;

    /// @brief Gets the probability of the tissue being malignant by a given age
    /// @param age The age in years
    /// @return The tissue probability, P(a)
    /// @throws core::InvalidInput for negative ages
    double probability(double age) const;

    /// @brief Predicts the malignancy probability for each age, lazily evaluated
    /// @param ages The ages in years
    /// @return The restartable prediction sequence
    /// @throws core::InvalidInput for negative ages
    PredictionSequence predict(std::vector<double> ages) const;

    /// @brief Predicts the malignancy curve rescaled to a maximum value
    /// @param ages The ages in years
    /// @param scale_to_max The maximum value of the rescaled curve
    /// @return The rescaled predictions
    /// @throws core::InvalidParameter for non-positive scale
    /// @throws core::InvalidInput for negative ages, or curves with zero maximum
    std::vector<double> predict_scaled(const std::vector<double> &ages,
                                       double scale_to_max) const;

    /// @brief Predicts the malignancy curve with the scale fitted on reference ages
    ///
    /// The scale maps the curve maximum over reference_ages onto scale_to_max, so
    /// predictions at other ages may exceed or never reach that value.
    /// @param ages The ages in years
    /// @param scale_to_max The maximum value of the rescaled curve over reference_ages
    /// @param reference_ages The ages the scale is fitted on, e.g. the calibration target
    /// @return The rescaled predictions
    /// @throws core::InvalidParameter for non-positive scale
    /// @throws core::InvalidInput for negative ages, or reference curves with zero maximum
    std::vector<double> predict_scaled(const std::vector<double> &ages, double scale_to_max,
                                       const std::vector<double> &reference_ages) const;

    /// @brief Predicts the tissue probability using the Poisson limit of the clone hits
    /// @param ages The ages in years
    /// @return The approximated probabilities
    /// @throws core::InvalidInput for negative ages
    std::vector<double> predict_poisson(const std::vector<double> &ages) const;

  private:
    ModelAParameters parameters_;
    EvaluationMode mode_{EvaluationMode::analytic};
    MonteCarloOptions options_{};

    // Sorted divisions count to reach the clonal threshold, per simulated clone.
    std::shared_ptr<const std::vector<double>> threshold_divisions_;

    double scale_factor(const std::vector<double> &reference_ages, double scale_to_max) const;
    void simulate_clones();
    double simulated_clone_probability(double divisions) const;
};

/// @brief Lazy, finite and restartable sequence of model predictions
///
/// @details Holds a copy of the model, each element is evaluated on dereference.
class PredictionSequence {
  public:
    /// @brief Read-only sequence iterator
    class const_iterator {
      public:
        using iterator_category = std::input_iterator_tag;
        using value_type = double;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = double;

        const_iterator() = default;
        const_iterator(const PredictionSequence *owner, std::size_t index) noexcept
            : owner_{owner}, index_{index} {}

        double operator*() const { return owner_->model_.probability(owner_->ages_[index_]); }

        const_iterator &operator++() noexcept {
            ++index_;
            return *this;
        }

        const_iterator operator++(int) noexcept {
            auto previous = *this;
            ++index_;
            return previous;
        }

        bool operator==(const const_iterator &other) const noexcept = default;

      private:
        const PredictionSequence *owner_{};
        std::size_t index_{};
    };

    /// @brief Initialises a new instance of the PredictionSequence class.
    /// @param model The model to evaluate
    /// @param ages The ages to evaluate, validated by the model
    PredictionSequence(MutationAccumulationModel model, std::vector<double> ages);

    /// @brief Gets the number of elements
    std::size_t size() const noexcept { return ages_.size(); }

    /// @brief Gets the ages being predicted
    const std::vector<double> &ages() const noexcept { return ages_; }

    /// @brief Gets an iterator to the first prediction
    const_iterator begin() const noexcept { return const_iterator{this, 0}; }

    /// @brief Gets an iterator past the last prediction
    const_iterator end() const noexcept { return const_iterator{this, ages_.size()}; }

    /// @brief Evaluates all predictions
    /// @return The predicted values, same order as ages
    std::vector<double> to_vector() const;

  private:
    MutationAccumulationModel model_;
    std::vector<double> ages_;
};

} // namespace agerisk
