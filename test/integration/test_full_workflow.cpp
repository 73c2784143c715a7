#include <catch2/catch.hpp>

#include <statkit/clustering/seeded_kmeans.hpp>
#include <statkit/metrics/cluster_metrics.hpp>
#include <statkit/metrics/regression_metrics.hpp>
#include <statkit/preprocessing/standard_scaler.hpp>
#include <statkit/solvers/ols_solver.hpp>
#include <statkit/utils/design_matrix.hpp>
#include "test_data.hpp"

#include <random>

using namespace statkit;
using Catch::Matchers::WithinAbs;

TEST_CASE("Integration: Split, standardize, regress, evaluate", "[integration]") {
	// y = 4 + 0.5 * x1 - 2 * x2 + small noise
	const size_t n = 60;
	std::mt19937_64 rng(3);
	std::uniform_real_distribution<double> feature(-10.0, 10.0);
	std::normal_distribution<double> noise(0.0, 0.05);

	Eigen::MatrixXd features(n, 2);
	Eigen::VectorXd y(n);
	for (Eigen::Index i = 0; i < static_cast<Eigen::Index>(n); i++) {
		features(i, 0) = feature(rng);
		features(i, 1) = 100.0 + feature(rng);
		y(i) = 4.0 + 0.5 * features(i, 0) - 2.0 * features(i, 1) + noise(rng);
	}

	auto split = utils::TrainTestSplit(n, 0.25, 11);
	const Eigen::MatrixXd train_x = utils::SelectRows(features, split.train);
	const Eigen::MatrixXd test_x = utils::SelectRows(features, split.test);
	const Eigen::VectorXd train_y = utils::SelectRows(y, split.train);
	const Eigen::VectorXd test_y = utils::SelectRows(y, split.test);

	auto state = preprocessing::StandardScaler::Fit(train_x);
	const Eigen::MatrixXd train_design =
	    utils::AddInterceptColumn(preprocessing::StandardScaler::Transform(state, train_x));
	const Eigen::MatrixXd test_design = utils::AddInterceptColumn(preprocessing::StandardScaler::Transform(state, test_x));

	auto fit = solvers::OLSSolver::Fit(train_design, train_y);

	// Standardized slopes map back to raw slopes through the training std
	REQUIRE_THAT(fit.coefficients()(1) / state.StdDevs()(0), WithinAbs(0.5, 0.01));
	REQUIRE_THAT(fit.coefficients()(2) / state.StdDevs()(1), WithinAbs(-2.0, 0.01));

	auto train_eval = metrics::RegressionEvaluator::FromModel(fit.model, train_design, train_y);
	auto test_eval = metrics::RegressionEvaluator::FromModel(fit.model, test_design, test_y);

	REQUIRE(train_eval.Size() == split.train.size());
	REQUIRE(test_eval.Size() == split.test.size());
	REQUIRE(train_eval.RMSE() < 0.1);
	REQUIRE(test_eval.RMSE() < 0.2);
	REQUIRE(test_eval.RSquared() > 0.99);
	REQUIRE(test_eval.MAE() <= test_eval.RMSE() + 1e-12);
}

TEST_CASE("Integration: Standardize then cluster", "[integration]") {
	// Second feature on a much larger scale
	Eigen::MatrixXd X = statkit_test::make_blobs({{0.0, 0.0}, {5.0, 5.0}}, 25, 0.4, 99);
	X.col(1) *= 1000.0;

	auto fitted = preprocessing::StandardScaler::FitTransform(X);
	const Eigen::MatrixXd &Z = fitted.second;

	auto result = clustering::SeededKMeans::Fit(Z, 2);

	REQUIRE(result.kmeans.converged);
	const int first = result.kmeans.assignment[0];
	for (size_t i = 0; i < 25; i++) {
		REQUIRE(result.kmeans.assignment[i] == first);
		REQUIRE(result.kmeans.assignment[i + 25] != first);
	}

	const double score = metrics::ClusterMetrics::Silhouette(Z, result.kmeans.assignment);
	REQUIRE(score > 0.7);
	REQUIRE(score <= 1.0);

	const double inertia = metrics::ClusterMetrics::Inertia(Z, result.kmeans.centroids, result.kmeans.assignment);
	REQUIRE_THAT(inertia, WithinAbs(result.kmeans.inertia, 1e-9));
}

TEST_CASE("Integration: Seeded and random initialization on two blobs", "[integration]") {
	const Eigen::MatrixXd X = statkit_test::make_blobs({{0.0, 0.0}, {10.0, 10.0}}, 20, 0.5, 8);

	auto seeded = clustering::SeededKMeans::Fit(X, 2);

	core::KMeansOptions opts;
	opts.n_init = 4;
	auto random = clustering::KMeans::Fit(X, 2, opts);

	// Same partition up to label permutation
	REQUIRE_THAT(seeded.kmeans.inertia, WithinAbs(random.inertia, 1e-9));
	REQUIRE(metrics::ClusterMetrics::Silhouette(X, seeded.kmeans.assignment) > 0.8);
	REQUIRE(metrics::ClusterMetrics::Silhouette(X, random.assignment) > 0.8);
}
