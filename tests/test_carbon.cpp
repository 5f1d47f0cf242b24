#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <carbon/tracker/carbon/calculator.h>
#include <carbon/tracker/carbon/cost_model.h>
#include <carbon/tracker/carbon/format.h>
#include <carbon/tracker/carbon/model_registry.h>
#include <doctest/doctest.h>

#include <cstdint>
#include <stdexcept>
#include <string>

using namespace carbon::tracker;

TEST_CASE("Model registry - lookup") {
    SUBCASE("Exact id") {
        ModelProfile p = get_model_profile("claude-opus-4-20250514");
        CHECK(p.family == ModelFamily::OPUS);
        CHECK(p.wh_per_1000_tokens == doctest::Approx(0.028));
        CHECK(p.display_name == "Claude Opus 4");
    }

    SUBCASE("Family keyword, case-insensitive") {
        CHECK(get_model_profile("Claude-HAIKU-next").family ==
              ModelFamily::HAIKU);
        CHECK(get_model_profile("some-sonnet-build").family ==
              ModelFamily::SONNET);
    }

    SUBCASE("Unknown ids get the mid-tier profile") {
        ModelProfile p = get_model_profile("unknown");
        CHECK(p.family == ModelFamily::UNKNOWN);
        CHECK(p.wh_per_1000_tokens == doctest::Approx(0.015));
        CHECK(std::string(to_string(p.family)) == "unknown");
    }
}

TEST_CASE("Carbon calculator - flat rate") {
    CarbonCalculator calculator;
    CHECK(calculator.cost_model().name() == "flat");

    // 1000 tokens * 0.015 Wh/1k * PUE 1.2
    CarbonResult r = calculator.calculate_carbon_from_tokens(
        600, 400, 0, 0, "claude-sonnet-4-20250514");
    CHECK(r.energy_wh == doctest::Approx(0.018));
    CHECK(r.co2_grams == doctest::Approx(0.0054));
    CHECK(r.energy_kwh() == doctest::Approx(0.000018));
    CHECK(co2_from_energy(1000.0) == doctest::Approx(300.0));

    SUBCASE("Cache tokens count toward the total") {
        CarbonResult cached = calculator.calculate_carbon_from_tokens(
            0, 0, 500, 500, "claude-sonnet-4-20250514");
        CHECK(cached.energy_wh == doctest::Approx(r.energy_wh));
    }

    SUBCASE("Single record") {
        UsageRecord record;
        record.model = "claude-3-haiku-20240307";
        record.input_tokens = 2000;
        CarbonResult single = calculator.calculate_record_carbon(record);
        CHECK(single.energy_wh == doctest::Approx(2.0 * 0.005 * 1.2));
        REQUIRE(single.breakdown.size() == 1);
        CHECK(single.breakdown[0].family == ModelFamily::HAIKU);
    }

    SUBCASE("Zero tokens") {
        CarbonResult zero = calculator.calculate_carbon_from_tokens(0, 0);
        CHECK(zero.energy_wh == 0.0);
        CHECK(zero.co2_grams == 0.0);
    }
}

TEST_CASE("Carbon calculator - session breakdown by family") {
    SessionUsage session;
    UsageRecord a;
    a.request_id = "1";
    a.model = "claude-sonnet-4-20250514";
    a.input_tokens = 1000;
    UsageRecord b = a;
    b.request_id = "2";
    b.model = "claude-3-5-sonnet-20241022";
    UsageRecord c = a;
    c.request_id = "3";
    c.model = "claude-opus-4-20250514";
    session.records = {a, b, c};

    CarbonCalculator calculator;
    CarbonResult r = calculator.calculate_session(session);
    REQUIRE(r.breakdown.size() == 2);
    CHECK(r.breakdown[0].family == ModelFamily::SONNET);
    CHECK(r.breakdown[1].family == ModelFamily::OPUS);

    const FamilyImpact *sonnet = r.find(ModelFamily::SONNET);
    REQUIRE(sonnet != nullptr);
    CHECK(sonnet->energy_wh == doctest::Approx((0.015 + 0.014) * 1.2));
    CHECK(r.find(ModelFamily::HAIKU) == nullptr);

    double sum = 0.0;
    for (const auto &f : r.breakdown) sum += f.co2_grams;
    CHECK(sum == doctest::Approx(r.co2_grams));
}

TEST_CASE("Carbon calculator - inference-time model") {
    CarbonCalculator calculator(make_cost_model("inference-time"));
    CHECK(calculator.cost_model().name() == "inference-time");

    ModelProfile sonnet = get_model_profile("claude-sonnet-4-20250514");
    CHECK(InferenceTimeCostModel::gpu_power_watts(sonnet) ==
          doctest::Approx(540.0));

    // (0.5 s + 70 / 70 tps) at 540 W with PUE 1.2
    CarbonResult r = calculator.calculate_carbon_from_tokens(
        5000, 70, 0, 0, "claude-sonnet-4-20250514");
    CHECK(r.energy_wh == doctest::Approx(1.5 / 3600.0 * 540.0 * 1.2));

    CHECK_THROWS_AS(make_cost_model("made-up"), std::invalid_argument);
    CHECK_THROWS_AS(CarbonCalculator(nullptr), std::invalid_argument);
}

TEST_CASE("Carbon calculator - inference-time cost is paid per request") {
    CarbonCalculator calculator(make_cost_model("inference-time"));

    SessionUsage session;
    std::uint64_t outputs[] = {70, 140, 0};
    int id = 0;
    for (std::uint64_t out : outputs) {
        UsageRecord record;
        record.request_id = "r" + std::to_string(++id);
        record.model = "claude-sonnet-4-20250514";
        record.input_tokens = 1000;
        record.output_tokens = out;
        session.records.push_back(record);
    }

    // 540 W, 70 tps, PUE 1.2; one 0.5 s TTFT per request
    auto wh = [](double seconds) { return seconds / 3600.0 * 540.0 * 1.2; };
    double expected = wh(0.5 + 70.0 / 70.0) + wh(0.5 + 140.0 / 70.0) +
                      wh(0.5 + 0.0 / 70.0);
    double single_ttft = wh(0.5 + 210.0 / 70.0);

    CarbonResult r = calculator.calculate_session(session);
    CHECK(r.energy_wh == doctest::Approx(expected));
    CHECK(r.energy_wh > single_ttft);
    CHECK(r.co2_grams == doctest::Approx(co2_from_energy(expected)));
    REQUIRE(r.breakdown.size() == 1);
    CHECK(r.breakdown[0].energy_wh == doctest::Approx(expected));
}

TEST_CASE("Formatting") {
    SUBCASE("CO2") {
        CHECK(format_co2(0.0) == "< 0.01g");
        CHECK(format_co2(0.005) == "< 0.01g");
        CHECK(format_co2(5.678) == "5.68g");
        CHECK(format_co2(999.994) == "999.99g");
        CHECK(format_co2(1000.0) == "1.000kg");
        CHECK(format_co2(2500.0) == "2.500kg");
    }

    SUBCASE("Energy") {
        CHECK(format_energy(0.0005) == "< 0.001 Wh");
        CHECK(format_energy(0.123) == "0.123 Wh");
        CHECK(format_energy(12.346) == "12.35 Wh");
        CHECK(format_energy(1500.0) == "1.500 kWh");
    }

    SUBCASE("Equivalents") {
        CarbonEquivalents eq = calculate_equivalents(240.0);
        CHECK(eq.km_driven == doctest::Approx(2.0));
        CHECK(eq.phone_charges == doctest::Approx(30.0));
        CHECK(eq.led_light_hours == doctest::Approx(80.0));
        CHECK(eq.cups_of_coffee == doctest::Approx(240.0 / 21.0));
        CHECK(eq.web_searches == doctest::Approx(1200.0));
    }
}
