#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

#include "domain/DesignErrors.hpp"
#include "domain/services/DesignCalculator.hpp"

using namespace beplanner::domain;
using namespace beplanner::domain::services;

template <typename E, typename F>
static bool throwsAs(F&& f) {
    try {
        f();
    } catch (const E&) {
        return true;
    } catch (...) {
        return false;
    }
    return false;
}

static DesignInputs inputsFor(double cv) {
    DesignInputs in;
    in.cvIntraPercent = cv;
    in.alpha = 0.05;
    in.powerPercent = 80.0;
    in.deltaPercent = 20.0;
    return in;
}

static void testClassificationAroundThreshold() {
    DesignCalculator calc;
    assert(calc.classify(30.0) == DesignType::StandardCrossover);
    assert(calc.classify(30.01) == DesignType::Replicate);
    assert(calc.classify(5.0) == DesignType::StandardCrossover);

    assert(calc.compute(inputsFor(30.0)).designType == DesignType::StandardCrossover);
    assert(calc.compute(inputsFor(30.01)).designType == DesignType::Replicate);
    std::cout << "[PASS] Design type switches to replicate strictly above 30%." << std::endl;
}

static void testStandardScenario() {
    DesignCalculator calc;
    DesignInputs in = inputsFor(25.0);
    in.dropoutRatePercent = 20.0;
    in.screenFailRatePercent = 12.0;

    DesignResult r = calc.compute(in);
    const int n = r.sampleSize;
    assert(n > 0);
    assert(r.designType == DesignType::StandardCrossover);
    assert(r.enrollmentWithDropout == static_cast<int>(std::ceil(n / (1.0 - 20.0 / 100.0))));
    assert(r.enrollmentWithScreenFail ==
           static_cast<int>(std::ceil(r.enrollmentWithDropout / (1.0 - 12.0 / 100.0))));
    assert(r.sampleSize <= r.enrollmentWithDropout);
    assert(r.enrollmentWithDropout <= r.enrollmentWithScreenFail);
    assert(r.policyVersion == DesignPolicy::Default().version);
    assert(r.cvIntraUsed == 25.0);
    assert(r.sequences() == 2 && r.periods() == 2);

    // The formula result is minimal: one subject fewer per sequence is under-powered.
    const int formula = calc.requiredSampleSize(25.0, 80.0, 0.05, 20.0);
    assert(formula == n || n == calc.policy().standardMinimumPerSequence);
    assert(calc.powerAt(formula, 25.0, 0.05, 20.0) >= 0.80);
    assert(calc.powerAt(formula - 1, 25.0, 0.05, 20.0) < 0.80);
    assert(r.achievedPower >= 0.80 && r.achievedPower <= 1.0);
    std::cout << "[PASS] cv=25 scenario: N=" << n << ", enrollment " << r.enrollmentWithDropout
              << " / " << r.enrollmentWithScreenFail << "." << std::endl;
}

static void testHighVariabilityScenario() {
    DesignCalculator calc;
    DesignInputs in = inputsFor(45.0);
    in.dropoutRatePercent = 20.0;
    in.screenFailRatePercent = 12.0;

    DesignResult r = calc.compute(in);
    assert(r.designType == DesignType::Replicate);
    assert(r.sampleSize >= calc.policy().replicateMinimumPerSequence);
    assert(r.periods() == 4);
    std::cout << "[PASS] cv=45 scenario gives a replicate design with N=" << r.sampleSize << "." << std::endl;
}

static void testReplicateFloor() {
    DesignPolicy policy;
    policy.version = "test-floor";
    policy.replicateMinimumPerSequence = 400;
    DesignCalculator calc(policy);
    DesignResult r = calc.compute(inputsFor(31.0));
    assert(r.designType == DesignType::Replicate);
    assert(r.sampleSize == 400);
    assert(r.policyVersion == "test-floor");
    std::cout << "[PASS] Replicate floor raises the formula result." << std::endl;
}

static void testStandardFloor() {
    DesignCalculator calc;
    DesignResult r = calc.compute(inputsFor(5.0));
    assert(r.sampleSize == calc.policy().standardMinimumPerSequence);
    assert(r.totalSubjects() == 12);
    std::cout << "[PASS] Low variability is floored at 6 per sequence." << std::endl;
}

static void testMonotonicity() {
    DesignCalculator calc;
    int previous = 0;
    for (double cv = 5.0; cv <= 100.0; cv += 2.5) {
        int n = calc.compute(inputsFor(cv)).sampleSize;
        assert(n >= previous);
        previous = n;
    }

    previous = 0;
    for (double power : {60.0, 70.0, 80.0, 90.0, 95.0}) {
        DesignInputs in = inputsFor(25.0);
        in.powerPercent = power;
        int n = calc.compute(in).sampleSize;
        assert(n >= previous);
        previous = n;
    }
    std::cout << "[PASS] Sample size is non-decreasing in cv and in power." << std::endl;
}

static void testEnrollmentMonotonicity() {
    for (int n : {6, 12, 19, 40}) {
        for (double dropout : {0.0, 5.0, 20.0, 50.0, 99.0}) {
            int withDropout = DesignCalculator::Inflate(n, dropout, "dropout_rate");
            assert(withDropout >= n);
            for (double screen : {0.0, 12.0, 75.0}) {
                assert(DesignCalculator::Inflate(withDropout, screen, "screen_fail_rate") >= withDropout);
            }
        }
    }
    assert(DesignCalculator::Inflate(10, 0.0, "dropout_rate") == 10);
    assert(DesignCalculator::Inflate(10, 20.0, "dropout_rate") == 13);
    std::cout << "[PASS] Enrollment figures never decrease." << std::endl;
}

static void testInflationIsExactForWholeQuotients() {
    assert(DesignCalculator::Inflate(21, 30.0, "dropout_rate") == 30);
    assert(DesignCalculator::Inflate(17, 32.0, "dropout_rate") == 25);
    assert(DesignCalculator::Inflate(14, 30.0, "screen_fail_rate") == 20);

    for (int rate = 0; rate < 100; ++rate) {
        const int keep = 100 - rate;
        for (int count = 1; count < 300; ++count) {
            const int expected = (count * 100 + keep - 1) / keep;
            assert(DesignCalculator::Inflate(count, rate, "dropout_rate") == expected);
        }
    }
    std::cout << "[PASS] Inflation matches integer ceiling for whole-percent rates." << std::endl;
}

static void testTinyCvUsesStandardFloor() {
    DesignCalculator calc;
    for (double cv : {0.001, 1e-6, 0.01}) {
        DesignResult r = calc.compute(inputsFor(cv));
        assert(r.designType == DesignType::StandardCrossover);
        assert(r.sampleSize == calc.policy().standardMinimumPerSequence);
        assert(r.achievedPower > 0.99 && r.achievedPower <= 1.0);
    }
    assert(calc.powerAt(2, 0.001, 0.05, 20.0) == 1.0);
    std::cout << "[PASS] Near-zero CV_intra gets the standard floor instead of a numerical failure." << std::endl;
}

static void testInvalidRates() {
    DesignCalculator calc;
    for (double bad : {100.0, 150.0, -1.0, std::numeric_limits<double>::quiet_NaN()}) {
        DesignInputs dropout = inputsFor(25.0);
        dropout.dropoutRatePercent = bad;
        assert(throwsAs<InvalidDesignInput>([&] { calc.compute(dropout); }));

        DesignInputs screen = inputsFor(25.0);
        screen.screenFailRatePercent = bad;
        assert(throwsAs<InvalidDesignInput>([&] { calc.compute(screen); }));
    }
    std::cout << "[PASS] Attrition rates outside [0, 100) are rejected." << std::endl;
}

static void testInvalidInputs() {
    DesignCalculator calc;
    for (double cv : {0.0, -3.0, 200.5, std::numeric_limits<double>::infinity()}) {
        assert(throwsAs<InvalidDesignInput>([&] { calc.compute(inputsFor(cv)); }));
    }
    assert(!throwsAs<InvalidDesignInput>([&] { calc.compute(inputsFor(200.0)); }));

    DesignInputs alpha = inputsFor(25.0);
    alpha.alpha = 0.5;
    assert(throwsAs<InvalidDesignInput>([&] { calc.compute(alpha); }));

    DesignInputs power = inputsFor(25.0);
    power.powerPercent = 100.0;
    assert(throwsAs<InvalidDesignInput>([&] { calc.compute(power); }));

    DesignInputs delta = inputsFor(25.0);
    delta.deltaPercent = 0.0;
    assert(throwsAs<InvalidDesignInput>([&] { calc.compute(delta); }));

    // Limits [0.96, 1.0417] do not contain the expected ratio 0.95.
    DesignInputs narrow = inputsFor(25.0);
    narrow.deltaPercent = 4.0;
    assert(throwsAs<InvalidDesignInput>([&] { calc.compute(narrow); }));

    for (double bad : {-1.0, 1e300, DrugParameter::MaxHalfLifeHours * 2.0,
                       std::numeric_limits<double>::infinity()}) {
        DesignInputs halfLife = inputsFor(25.0);
        halfLife.halfLifeHours = bad;
        assert(throwsAs<InvalidDesignInput>([&] { calc.compute(halfLife); }));
        assert(throwsAs<InvalidDesignInput>([&] { calc.washout(bad); }));
    }
    DesignInputs longHalfLife = inputsFor(25.0);
    longHalfLife.halfLifeHours = DrugParameter::MaxHalfLifeHours;
    assert(calc.compute(longHalfLife).washoutDays() > 200000);

    DesignInputs missing;
    assert(throwsAs<DesignComputationFailed>([&] { calc.compute(missing); }));
    std::cout << "[PASS] Out-of-range inputs are rejected, missing cv fails the computation." << std::endl;
}

static void testDefaultsFromPolicy() {
    DesignCalculator calc;
    DesignInputs in;
    in.cvIntraPercent = 25.0;
    DesignResult r = calc.compute(in);
    assert(r.alpha == 0.05);
    assert(r.powerPercent == 80.0);
    assert(r.deltaPercent == 20.0);
    assert(r.sampleSize == calc.compute(inputsFor(25.0)).sampleSize);
    std::cout << "[PASS] Missing alpha/power/delta fall back to the policy." << std::endl;
}

static void testWashout() {
    DesignCalculator calc;
    assert(calc.washout(24.0) == std::chrono::hours(120));
    assert(calc.washout(10.0) == std::chrono::hours(72));
    assert(calc.washout(0.0) == std::chrono::hours(24));
    assert(calc.washout(4.0) == std::chrono::hours(24));
    assert(calc.washout(std::nullopt) == std::chrono::hours(120));

    DesignResult withDefault = calc.compute(inputsFor(25.0));
    assert(withDefault.washoutFromDefaultHalfLife);
    assert(withDefault.washoutDays() == 5);

    DesignInputs in = inputsFor(25.0);
    in.halfLifeHours = 10.0;
    DesignResult withHalfLife = calc.compute(in);
    assert(!withHalfLife.washoutFromDefaultHalfLife);
    assert(withHalfLife.washoutDays() == 3);
    std::cout << "[PASS] Washout is 5 half-lives rounded up to whole days, at least one day." << std::endl;
}

static void testInputsFromParameters() {
    std::vector<DrugParameter> params = {
        {ParameterKind::CvIntra, 22.0, "%", "1", "", true},
        {ParameterKind::CvIntra, 35.0, "%", "2", "", true},
        {ParameterKind::CvIntra, 60.0, "%", "3", "", false},  // unreliable
        {ParameterKind::CvIntra, 250.0, "%", "4", "", true},  // implausible
        {ParameterKind::HalfLife, 6.0, "h", "1", "", true},
        {ParameterKind::HalfLife, 9.5, "h", "2", "", true},
        {ParameterKind::Cmax, 1200.0, "ng/mL", "1", "", true},
    };
    DesignInputs in = DesignCalculator::InputsFromParameters(params, 10.0, 5.0);
    assert(in.cvIntraPercent && *in.cvIntraPercent == 35.0);
    assert(in.halfLifeHours && *in.halfLifeHours == 9.5);
    assert(in.dropoutRatePercent == 10.0 && in.screenFailRatePercent == 5.0);
    assert(!in.alpha && !in.powerPercent && !in.deltaPercent);

    DesignInputs none = DesignCalculator::InputsFromParameters({});
    assert(!none.cvIntraPercent && !none.halfLifeHours);
    std::cout << "[PASS] The most conservative reliable value of each kind is selected." << std::endl;
}

int main() {
    std::cout << "[Test] Starting DesignCalculator Test..." << std::endl;
    testClassificationAroundThreshold();
    testStandardScenario();
    testHighVariabilityScenario();
    testReplicateFloor();
    testStandardFloor();
    testMonotonicity();
    testEnrollmentMonotonicity();
    testInflationIsExactForWholeQuotients();
    testTinyCvUsesStandardFloor();
    testInvalidRates();
    testInvalidInputs();
    testDefaultsFromPolicy();
    testWashout();
    testInputsFromParameters();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
