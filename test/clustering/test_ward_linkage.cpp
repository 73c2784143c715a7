#include <catch2/catch.hpp>

#include <statkit/clustering/ward_linkage.hpp>
#include "test_data.hpp"

using namespace statkit;
using namespace statkit::clustering;
using Catch::Matchers::WithinAbs;

const double TOLERANCE = 1e-9;

TEST_CASE("Ward: Merge sequence matches reference", "[ward][validation]") {
	auto expected = statkit_test::load_expected_json("ward_reference.json");
	const Eigen::MatrixXd X = statkit_test::matrix_from_json(expected["X"]);

	auto dendrogram = WardLinkage::Linkage(X);

	REQUIRE(dendrogram.n_obs == 5);
	REQUIRE(dendrogram.merges.size() == expected["merges"].size());
	for (size_t s = 0; s < dendrogram.merges.size(); s++) {
		const auto &row = expected["merges"][s];
		const MergeStep &merge = dendrogram.merges[s];
		REQUIRE(merge.cluster_a == row[0].get<size_t>());
		REQUIRE(merge.cluster_b == row[1].get<size_t>());
		REQUIRE_THAT(merge.distance, WithinAbs(row[2].get<double>(), TOLERANCE));
		REQUIRE(merge.size == row[3].get<size_t>());
	}
}

TEST_CASE("Ward: Merge distances are non-decreasing", "[ward]") {
	auto X = statkit_test::make_blobs({{0.0, 0.0}, {6.0, 1.0}, {2.0, 9.0}}, 8, 1.0, 7);

	auto dendrogram = WardLinkage::Linkage(X);

	REQUIRE(dendrogram.merges.size() == static_cast<size_t>(X.rows()) - 1);
	REQUIRE(dendrogram.merges.back().size == static_cast<size_t>(X.rows()));
	for (size_t s = 1; s < dendrogram.merges.size(); s++) {
		REQUIRE(dendrogram.merges[s].distance >= dendrogram.merges[s - 1].distance - 1e-12);
	}
	REQUIRE_NOTHROW(dendrogram.Validate());
}

TEST_CASE("Ward: Cut produces exactly k clusters", "[ward][cut]") {
	auto expected = statkit_test::load_expected_json("ward_reference.json");
	const Eigen::MatrixXd X = statkit_test::matrix_from_json(expected["X"]);
	auto dendrogram = WardLinkage::Linkage(X);

	SECTION("k = 1 puts everything together") {
		auto labels = WardLinkage::Cut(dendrogram, 1);
		REQUIRE(labels == std::vector<int>({0, 0, 0, 0, 0}));
	}

	SECTION("k = 2 separates the outlier") {
		auto labels = WardLinkage::Cut(dendrogram, 2);
		REQUIRE(labels == std::vector<int>({0, 0, 0, 0, 1}));
	}

	SECTION("k = 3") {
		auto labels = WardLinkage::Cut(dendrogram, 3);
		REQUIRE(labels == std::vector<int>({0, 0, 1, 1, 2}));
	}

	SECTION("k = n gives singletons") {
		auto labels = WardLinkage::Cut(dendrogram, 5);
		REQUIRE(labels == std::vector<int>({0, 1, 2, 3, 4}));
	}

	SECTION("Every k in range") {
		for (int k = 1; k <= 5; k++) {
			auto labels = WardLinkage::Cut(dendrogram, k);
			REQUIRE(labels.size() == 5);
			REQUIRE(WardLinkage::CountLabels(labels) == static_cast<size_t>(k));
			REQUIRE(*std::min_element(labels.begin(), labels.end()) == 0);
			REQUIRE(*std::max_element(labels.begin(), labels.end()) == k - 1);
		}
	}
}

TEST_CASE("Ward: Invalid cluster counts", "[ward][cut][errors]") {
	Eigen::MatrixXd X(3, 1);
	X << 0.0, 1.0, 5.0;
	auto dendrogram = WardLinkage::Linkage(X);

	REQUIRE_THROWS_AS(WardLinkage::Cut(dendrogram, 0), core::InvalidKError);
	REQUIRE_THROWS_AS(WardLinkage::Cut(dendrogram, 4), core::InvalidKError);
	REQUIRE_THROWS_AS(WardLinkage::Cut(dendrogram, -2), core::InvalidKError);
}

TEST_CASE("Ward: Single observation", "[ward]") {
	Eigen::MatrixXd X(1, 3);
	X << 1.0, 2.0, 3.0;

	auto dendrogram = WardLinkage::Linkage(X);
	REQUIRE(dendrogram.merges.empty());
	REQUIRE(WardLinkage::Cut(dendrogram, 1) == std::vector<int>({0}));
}

TEST_CASE("Ward: Empty input", "[ward][errors]") {
	Eigen::MatrixXd X(0, 2);
	REQUIRE_THROWS_AS(WardLinkage::Linkage(X), core::EmptyInputError);
}

TEST_CASE("Ward: Malformed dendrogram", "[ward][errors]") {
	Dendrogram dendrogram;
	dendrogram.n_obs = 3;
	dendrogram.merges.push_back(MergeStep {0, 1, 1.0, 2});

	REQUIRE_THROWS_AS(dendrogram.Validate(), core::InvalidInputError);
	REQUIRE_THROWS_AS(WardLinkage::Cut(dendrogram, 2), core::InvalidInputError);

	dendrogram.merges.push_back(MergeStep {2, 9, 3.0, 3});
	REQUIRE_THROWS_AS(dendrogram.Validate(), core::InvalidInputError);

	SECTION("Cluster merged twice") {
		Dendrogram repeated;
		repeated.n_obs = 4;
		repeated.merges.push_back(MergeStep {0, 1, 1.0, 2});
		repeated.merges.push_back(MergeStep {0, 1, 1.0, 2});
		repeated.merges.push_back(MergeStep {2, 3, 1.0, 2});

		REQUIRE_THROWS_AS(repeated.Validate(), core::InvalidInputError);
		REQUIRE_THROWS_AS(WardLinkage::Cut(repeated, 2), core::InvalidInputError);
	}

	SECTION("Merged cluster absorbed twice") {
		Dendrogram repeated;
		repeated.n_obs = 3;
		repeated.merges.push_back(MergeStep {0, 1, 1.0, 2});
		repeated.merges.push_back(MergeStep {2, 3, 2.0, 3});
		REQUIRE_NOTHROW(repeated.Validate());

		repeated.merges[1] = MergeStep {0, 2, 2.0, 2};
		REQUIRE_THROWS_AS(repeated.Validate(), core::InvalidInputError);
	}
}

TEST_CASE("Ward: Non-finite input", "[ward][errors]") {
	Eigen::MatrixXd X(3, 2);
	X << 0.0, 0.0,
	     1.0, std::numeric_limits<double>::quiet_NaN(),
	     5.0, 5.0;
	REQUIRE_THROWS_AS(WardLinkage::Linkage(X), core::InvalidInputError);

	X(1, 1) = std::numeric_limits<double>::infinity();
	REQUIRE_THROWS_AS(WardLinkage::Linkage(X), core::InvalidInputError);
}

TEST_CASE("Ward: Cluster means in first-appearance order", "[ward][means]") {
	Eigen::MatrixXd X(5, 2);
	X << 10.0, 0.0,
	     0.0, 1.0,
	     12.0, 2.0,
	     2.0, 3.0,
	     4.0, 5.0;
	std::vector<int> labels = {4, 1, 4, 1, 1};

	auto means = WardLinkage::ClusterMeans(X, labels);

	REQUIRE(means.rows() == 2);
	REQUIRE(means.cols() == 2);
	// Label 4 appears first
	REQUIRE_THAT(means(0, 0), WithinAbs(11.0, TOLERANCE));
	REQUIRE_THAT(means(0, 1), WithinAbs(1.0, TOLERANCE));
	REQUIRE_THAT(means(1, 0), WithinAbs(2.0, TOLERANCE));
	REQUIRE_THAT(means(1, 1), WithinAbs(3.0, TOLERANCE));

	SECTION("Errors") {
		REQUIRE_THROWS_AS(WardLinkage::ClusterMeans(X, {0, 1}), core::ShapeMismatchError);
		REQUIRE_THROWS_AS(WardLinkage::ClusterMeans(Eigen::MatrixXd(0, 2), {}), core::EmptyInputError);
	}
}

TEST_CASE("Ward: Ties resolve toward the lowest observation indices", "[ward]") {
	// Equidistant pairs (0,1) and (2,3)
	Eigen::MatrixXd X(4, 1);
	X << 0.0, 1.0, 10.0, 11.0;

	auto dendrogram = WardLinkage::Linkage(X);
	REQUIRE(dendrogram.merges[0].cluster_a == 0);
	REQUIRE(dendrogram.merges[0].cluster_b == 1);
	REQUIRE(dendrogram.merges[1].cluster_a == 2);
	REQUIRE(dendrogram.merges[1].cluster_b == 3);
	REQUIRE(dendrogram.merges[2].cluster_a == 4);
	REQUIRE(dendrogram.merges[2].cluster_b == 5);

	// Same input, same tree
	auto again = WardLinkage::Linkage(X);
	for (size_t s = 0; s < dendrogram.merges.size(); s++) {
		REQUIRE(again.merges[s].cluster_a == dendrogram.merges[s].cluster_a);
		REQUIRE(again.merges[s].distance == dendrogram.merges[s].distance);
	}
}
