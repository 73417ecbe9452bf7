// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STRATLAB_SURROGATE_MODEL_H
#define __STRATLAB_SURROGATE_MODEL_H 1

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <Eigen/Dense>

namespace stratlab
{
  namespace search
  {
    struct SurrogatePrediction
    {
      double mean;
      double stdDev;
    };

    /**
     * @brief Regression model of the objective over normalized parameters.
     *
     * Inputs are points in [0,1]^d. The objective is always maximized;
     * callers negate it for minimization.
     */
    class SurrogateModel
    {
    public:
      virtual ~SurrogateModel() = default;

      virtual std::string name() const = 0;

      // Returns false when the observations cannot be fitted
      virtual bool fit(const std::vector<std::vector<double>>& points,
		       const std::vector<double>& values) = 0;

      // Only valid after a successful fit()
      virtual SurrogatePrediction predict(const std::vector<double>& point) const = 0;
    };

    using SurrogateModelFactory = std::function<std::unique_ptr<SurrogateModel>()>;

    /**
     * Expected improvement of a prediction over the best observed value,
     * xi being the exploration margin. Zero when nothing can be gained.
     */
    double expectedImprovement(const SurrogatePrediction& prediction,
			       double bestObserved,
			       double xi = 0.01);

    struct GaussianProcessOptions
    {
      double lengthScale = 0.25;
      double signalVariance = 1.0;
      double noiseVariance = 1e-6;
    };

    /**
     * @brief Gaussian-process regression with a squared exponential (RBF) kernel.
     *
     * Observed values are standardized before fitting and predictions are
     * mapped back. fit() fails when there are fewer than two points, the
     * points have inconsistent dimensions, or the kernel matrix is not
     * positive definite.
     */
    class GaussianProcessSurrogate : public SurrogateModel
    {
    public:
      explicit GaussianProcessSurrogate(const GaussianProcessOptions& options = GaussianProcessOptions());

      std::string name() const override
      {
	return "gaussian_process";
      }

      bool fit(const std::vector<std::vector<double>>& points,
	       const std::vector<double>& values) override;

      SurrogatePrediction predict(const std::vector<double>& point) const override;

    private:
      double kernel(const Eigen::VectorXd& a, const Eigen::VectorXd& b) const;

    private:
      GaussianProcessOptions mOptions;
      Eigen::MatrixXd mPoints;                  // one observation per row
      Eigen::LLT<Eigen::MatrixXd> mCholesky;    // K + noise * I
      Eigen::VectorXd mAlpha;                   // K^-1 y
      double mValueMean;
      double mValueScale;
      bool mFitted;
    };

    SurrogateModelFactory gaussianProcessFactory(const GaussianProcessOptions& options = GaussianProcessOptions());
  }
}

#endif
