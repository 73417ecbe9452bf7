// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "SurrogateModel.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace stratlab
{
  namespace search
  {
    namespace
    {
      constexpr double kInvSqrt2 = 0.7071067811865475244;
      constexpr double kInvSqrt2Pi = 0.3989422804014326779;

      double standardNormalCdf(double z)
      {
	return 0.5 * (1.0 + std::erf(z * kInvSqrt2));
      }

      double standardNormalPdf(double z)
      {
	return kInvSqrt2Pi * std::exp(-0.5 * z * z);
      }
    }

    double expectedImprovement(const SurrogatePrediction& prediction,
			       double bestObserved,
			       double xi)
    {
      const double gain = prediction.mean - bestObserved - xi;
      if (!(prediction.stdDev > 1e-12))
	return std::max(gain, 0.0);

      const double z = gain / prediction.stdDev;
      return gain * standardNormalCdf(z) + prediction.stdDev * standardNormalPdf(z);
    }

    GaussianProcessSurrogate::GaussianProcessSurrogate(const GaussianProcessOptions& options)
      : mOptions(options),
	mPoints(),
	mCholesky(),
	mAlpha(),
	mValueMean(0.0),
	mValueScale(1.0),
	mFitted(false)
    {}

    double GaussianProcessSurrogate::kernel(const Eigen::VectorXd& a, const Eigen::VectorXd& b) const
    {
      const double l = mOptions.lengthScale;
      return mOptions.signalVariance * std::exp(-(a - b).squaredNorm() / (2.0 * l * l));
    }

    bool GaussianProcessSurrogate::fit(const std::vector<std::vector<double>>& points,
				       const std::vector<double>& values)
    {
      mFitted = false;
      const std::size_t n = points.size();
      if (n < 2 || values.size() != n || !(mOptions.lengthScale > 0.0))
	return false;

      const std::size_t dims = points.front().size();
      for (std::size_t i = 0; i < n; ++i)
	{
	  if (points[i].size() != dims || !std::isfinite(values[i]))
	    return false;
	}

      const Eigen::Index rows = static_cast<Eigen::Index>(n);
      const Eigen::Index cols = static_cast<Eigen::Index>(dims);
      Eigen::MatrixXd x(rows, cols);
      Eigen::VectorXd y(rows);
      for (Eigen::Index i = 0; i < rows; ++i)
	{
	  x.row(i) = Eigen::Map<const Eigen::RowVectorXd>(points[i].data(), cols);
	  y(i) = values[i];
	}

      mValueMean = y.mean();
      const double stdDev = std::sqrt((y.array() - mValueMean).square().sum() / static_cast<double>(n));
      mValueScale = stdDev > 0.0 ? stdDev : 1.0;

      Eigen::MatrixXd covariance(rows, rows);
      for (Eigen::Index i = 0; i < rows; ++i)
	for (Eigen::Index j = 0; j <= i; ++j)
	  {
	    covariance(i, j) = kernel(x.row(i).transpose(), x.row(j).transpose());
	    covariance(j, i) = covariance(i, j);
	  }
      covariance.diagonal().array() += mOptions.noiseVariance;

      mCholesky.compute(covariance);
      if (mCholesky.info() != Eigen::Success)
	return false;

      mPoints = std::move(x);
      mAlpha = mCholesky.solve(((y.array() - mValueMean) / mValueScale).matrix());
      if (!mAlpha.allFinite())
	return false;

      mFitted = true;
      return true;
    }

    SurrogatePrediction GaussianProcessSurrogate::predict(const std::vector<double>& point) const
    {
      if (!mFitted)
	return SurrogatePrediction{mValueMean, 0.0};

      if (static_cast<Eigen::Index>(point.size()) != mPoints.cols())
	throw std::invalid_argument("GaussianProcessSurrogate: point has "
				    + std::to_string(point.size()) + " dimensions, model has "
				    + std::to_string(mPoints.cols()));

      const Eigen::VectorXd query = Eigen::Map<const Eigen::VectorXd>(point.data(),
								      static_cast<Eigen::Index>(point.size()));
      Eigen::VectorXd cross(mPoints.rows());
      for (Eigen::Index i = 0; i < mPoints.rows(); ++i)
	cross(i) = kernel(query, mPoints.row(i).transpose());

      const double mean = cross.dot(mAlpha);

      // k(x, x) - v^T v with L v = k*
      const Eigen::VectorXd v = mCholesky.matrixL().solve(cross);
      const double variance = kernel(query, query) - v.squaredNorm();

      return SurrogatePrediction{mValueMean + mean * mValueScale,
				 std::sqrt(std::max(variance, 0.0)) * mValueScale};
    }

    SurrogateModelFactory gaussianProcessFactory(const GaussianProcessOptions& options)
    {
      return [options]() -> std::unique_ptr<SurrogateModel> {
	return std::make_unique<GaussianProcessSurrogate>(options);
      };
    }
  }
}
