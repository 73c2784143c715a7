#include <catch2/catch.hpp>

#include <statkit/utils/design_matrix.hpp>

using namespace statkit;
using namespace statkit::utils;

TEST_CASE("DesignMatrix: AddInterceptColumn", "[utils]") {
	Eigen::MatrixXd X(3, 2);
	X << 1.0, 2.0,
	     3.0, 4.0,
	     5.0, 6.0;

	auto augmented = AddInterceptColumn(X);

	REQUIRE(augmented.rows() == 3);
	REQUIRE(augmented.cols() == 3);
	for (Eigen::Index i = 0; i < 3; i++) {
		REQUIRE(augmented(i, 0) == 1.0);
		REQUIRE(augmented(i, 1) == X(i, 0));
		REQUIRE(augmented(i, 2) == X(i, 1));
	}

	SECTION("Zero feature columns gives an intercept-only design") {
		Eigen::MatrixXd none(4, 0);
		auto only = AddInterceptColumn(none);
		REQUIRE(only.cols() == 1);
		REQUIRE(only.sum() == 4.0);
	}
}

TEST_CASE("DesignMatrix: FromRows and FromValues", "[utils]") {
	auto X = FromRows({{1.0, 2.0}, {3.0, 4.0}, {5.0, 6.0}});
	REQUIRE(X.rows() == 3);
	REQUIRE(X.cols() == 2);
	REQUIRE(X(2, 1) == 6.0);

	auto y = FromValues({0.5, 1.5});
	REQUIRE(y.size() == 2);
	REQUIRE(y(1) == 1.5);

	SECTION("Ragged rows") {
		REQUIRE_THROWS_AS(FromRows({{1.0, 2.0}, {3.0}}), core::ShapeMismatchError);
	}

	SECTION("No rows") {
		REQUIRE_THROWS_AS(FromRows({}), core::EmptyInputError);
	}

	SECTION("No columns") {
		REQUIRE_THROWS_AS(FromRows({{}, {}}), core::EmptyInputError);
	}
}

TEST_CASE("DesignMatrix: SelectRows", "[utils]") {
	auto X = FromRows({{0.0}, {10.0}, {20.0}, {30.0}});
	auto y = FromValues({0.0, 1.0, 2.0, 3.0});

	auto X_sub = SelectRows(X, {3, 1});
	REQUIRE(X_sub.rows() == 2);
	REQUIRE(X_sub(0, 0) == 30.0);
	REQUIRE(X_sub(1, 0) == 10.0);

	auto y_sub = SelectRows(y, {3, 1});
	REQUIRE(y_sub(0) == 3.0);
	REQUIRE(y_sub(1) == 1.0);

	REQUIRE_THROWS_AS(SelectRows(X, {4}), core::InvalidInputError);
	REQUIRE_THROWS_AS(SelectRows(y, {0, 9}), core::InvalidInputError);
}

TEST_CASE("DesignMatrix: TrainTestSplit", "[utils][split]") {
	auto split = TrainTestSplit(10, 0.3, 123);

	REQUIRE(split.test.size() == 3);
	REQUIRE(split.train.size() == 7);

	// Disjoint, covering, sorted
	std::vector<bool> seen(10, false);
	for (size_t idx : split.train) {
		REQUIRE_FALSE(seen[idx]);
		seen[idx] = true;
	}
	for (size_t idx : split.test) {
		REQUIRE_FALSE(seen[idx]);
		seen[idx] = true;
	}
	REQUIRE(std::all_of(seen.begin(), seen.end(), [](bool b) { return b; }));
	REQUIRE(std::is_sorted(split.train.begin(), split.train.end()));
	REQUIRE(std::is_sorted(split.test.begin(), split.test.end()));

	SECTION("Deterministic for a seed") {
		auto again = TrainTestSplit(10, 0.3, 123);
		REQUIRE(again.train == split.train);
		REQUIRE(again.test == split.test);
	}

	SECTION("Both partitions stay non-empty") {
		auto tiny = TrainTestSplit(2, 0.01);
		REQUIRE(tiny.test.size() == 1);
		REQUIRE(tiny.train.size() == 1);

		auto heavy = TrainTestSplit(3, 0.99);
		REQUIRE(heavy.train.size() == 1);
		REQUIRE(heavy.test.size() == 2);
	}

	SECTION("Invalid arguments") {
		REQUIRE_THROWS_AS(TrainTestSplit(10, 0.0), core::InvalidInputError);
		REQUIRE_THROWS_AS(TrainTestSplit(10, 1.0), core::InvalidInputError);
		REQUIRE_THROWS_AS(TrainTestSplit(1, 0.5), core::InvalidInputError);
	}
}
