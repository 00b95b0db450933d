#include <catch2/catch_test_macros.hpp>

#include "gapfill/detect/context_window.hpp"

#include "common/store_fixtures.hpp"

using namespace gapfill;
using tests::helpers::hour;

namespace {

core::ContextConfig contextOf(std::size_t n, bool allow_imputed = true, bool screen = false) {
	core::ContextConfig config;
	config.context_window_size = n;
	config.allow_imputed_context = allow_imputed;
	config.screen_anomalies = screen;
	return config;
}

} // namespace

TEST_CASE("A complete preceding window is returned in order", "[detect][context]") {
	tests::helpers::StoreFixture fx;
	tests::helpers::writeValues(*fx.store, "s1", {10.0, 11.0, 12.0, 13.0, 14.0, 15.0, std::nullopt});
	detect::ContextWindowBuilder builder(fx.store, contextOf(4));

	const auto window = builder.build("s1", core::Parameter::PM25, hour(6));
	REQUIRE(window.has_value());
	REQUIRE(window->size() == 4);
	REQUIRE(window->start() == hour(2));
	REQUIRE(window->end() == hour(5));
	REQUIRE(window->values() == std::vector<double>{12.0, 13.0, 14.0, 15.0});
	REQUIRE_FALSE(window->containsImputed());
	REQUIRE(builder.windowSize() == 4);
}

TEST_CASE("A single missing hour means no context", "[detect][context]") {
	tests::helpers::StoreFixture fx;
	tests::helpers::writeValues(*fx.store, "s1", {10.0, 11.0, std::nullopt, 13.0, 14.0, 15.0});
	detect::ContextWindowBuilder builder(fx.store, contextOf(4));

	REQUIRE_FALSE(builder.build("s1", core::Parameter::PM25, hour(6)).has_value());
	REQUIRE(builder.build("s1", core::Parameter::PM25, hour(6), 3).has_value());
	// Not enough history before the first reading.
	REQUIRE_FALSE(builder.build("s1", core::Parameter::PM25, hour(2)).has_value());
	REQUIRE_FALSE(builder.build("other", core::Parameter::PM25, hour(6)).has_value());
}

TEST_CASE("Imputed values are used only when allowed", "[detect][context]") {
	tests::helpers::StoreFixture fx;
	tests::helpers::writeValues(*fx.store, "s1", {10.0, 11.0, 12.0, 13.0});
	tests::helpers::writeValue(*fx.store, "s1", 2, 12.5, true);

	detect::ContextWindowBuilder lenient(fx.store, contextOf(4, true));
	const auto window = lenient.build("s1", core::Parameter::PM25, hour(4));
	REQUIRE(window.has_value());
	REQUIRE(window->containsImputed());

	detect::ContextWindowBuilder strict(fx.store, contextOf(4, false));
	REQUIRE_FALSE(strict.build("s1", core::Parameter::PM25, hour(4)).has_value());
}

TEST_CASE("Screening rejects windows containing anomalies", "[detect][context]") {
	tests::helpers::StoreFixture fx;
	tests::helpers::writeValues(*fx.store, "s1", {10.0, 11.0, 90.0, 12.0, 11.0});

	detect::ContextWindowBuilder plain(fx.store, contextOf(4));
	REQUIRE(plain.build("s1", core::Parameter::PM25, hour(5)).has_value());

	detect::ContextWindowBuilder screened(fx.store, contextOf(4, true, true));
	REQUIRE_FALSE(screened.build("s1", core::Parameter::PM25, hour(5)).has_value());
}

TEST_CASE("Windows can be cut from an in-memory series", "[detect][context]") {
	core::HourlySeries series;
	for (int h = 0; h < 10; ++h) {
		if (h != 7) {
			series.push_back({hour(h), static_cast<double>(h), false});
		}
	}

	const auto window = detect::ContextWindowBuilder::fromSeries(series, "s1", core::Parameter::PM25, hour(7), 3);
	REQUIRE(window.has_value());
	REQUIRE(window->values() == std::vector<double>{4.0, 5.0, 6.0});
	REQUIRE_FALSE(detect::ContextWindowBuilder::fromSeries(series, "s1", core::Parameter::PM25, hour(9), 3));
	REQUIRE_THROWS_AS(detect::ContextWindowBuilder::fromSeries(series, "s1", core::Parameter::PM25, hour(9), 0),
	                  std::invalid_argument);
}

TEST_CASE("Context requests are validated", "[detect][context]") {
	tests::helpers::StoreFixture fx;
	detect::ContextWindowBuilder builder(fx.store, contextOf(4));
	REQUIRE_THROWS_AS(builder.build("s1", core::Parameter::PM25, hour(4) + std::chrono::seconds(1)),
	                  std::invalid_argument);
	REQUIRE_THROWS_AS(detect::ContextWindowBuilder(fx.store, contextOf(169)), std::invalid_argument);
	REQUIRE_THROWS_AS(detect::ContextWindowBuilder(nullptr, contextOf(4)), std::invalid_argument);

	detect::ContextWindowBuilder offline(std::make_shared<tests::helpers::UnavailableReadingStore>(), contextOf(4));
	REQUIRE_THROWS_AS(offline.build("s1", core::Parameter::PM25, hour(4)), core::StoreUnavailable);
}
