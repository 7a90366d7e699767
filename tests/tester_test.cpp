/**
 * @file tester_test.cpp
 * @brief 完整测试流程：发现、筛选、运行、比对和输出
 */

#include <gtest/gtest.h>
#include <sstream>
#include "oj_tester.h"
#include "test_helpers.h"

using namespace ojt;

namespace {

class RecordingReporter : public Reporter {
public:
    size_t started = 0;
    std::vector<std::string> order;
    bool filter_empty = false;
    bool finished = false;

    void on_start(const std::string&, size_t selected) override { started = selected; }
    void on_result(const CaseResult &r) override { order.push_back(r.case_name); }
    void on_filter_empty(const std::vector<FilterToken>&) override { filter_empty = true; }
    void on_finish(const std::vector<CaseResult>&) override { finished = true; }
};

} // namespace

class TesterTest : public ojt_test::TempDirTest {
protected:
    std::filesystem::path target;

    void SetUp() override {
        TempDirTest::SetUp();
        target = write_script("solution.sh", "exec cat");
    }

    Result<std::vector<CaseResult>> run(TesterOptions options,
                                        std::shared_ptr<Reporter> reporter = std::make_shared<NullReporter>()) {
        auto tester = OnlineJudgeTester::create(target.string(), std::move(options), reporter);
        if (tester.is_error()) {
            return Err<std::vector<CaseResult>>(tester.error().code(), tester.error().message());
        }
        return tester.value().run_tests();
    }
};

TEST_F(TesterTest, DefaultCaseDirIsNextToTarget) {
    auto tester = OnlineJudgeTester::create(target.string());
    ASSERT_TRUE(tester.ok());
    EXPECT_EQ(tester.value().test_case_dir(),
              std::filesystem::canonical(work_dir) / "test_case");
}

TEST_F(TesterTest, MissingTargetIsError) {
    auto tester = OnlineJudgeTester::create((work_dir / "absent").string());
    ASSERT_TRUE(tester.is_error());
    EXPECT_EQ(tester.error().code(), ErrorCode::TARGET_NOT_FOUND);
}

TEST_F(TesterTest, InvalidOptionsAreRejected) {
    TesterOptions opt;
    opt.repeat = 0;
    auto tester = OnlineJudgeTester::create(target.string(), opt);
    ASSERT_TRUE(tester.is_error());
    EXPECT_EQ(tester.error().code(), ErrorCode::CONFIG_INVALID_VALUE);
}

TEST_F(TesterTest, NoInputFilesIsError) {
    auto r = run(TesterOptions());
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().code(), ErrorCode::NO_TEST_CASES);
    EXPECT_NE(r.error().message().find("No .in files found"), std::string::npos);
}

TEST_F(TesterTest, VerdictsPerCase) {
    write_file("test_case/1.in", "1 2\n");
    write_file("test_case/1.out", "1 2\n");
    write_file("test_case/2.in", "hello\n");
    write_file("test_case/2.out", "world\n");
    write_file("test_case/3.in", "no expected\n");

    auto reporter = std::make_shared<RecordingReporter>();
    auto r = run(TesterOptions(), reporter);
    ASSERT_TRUE(r.ok());
    const auto &results = r.value();
    ASSERT_EQ(results.size(), 3u);

    EXPECT_EQ(results[0].status, Status::AC);
    EXPECT_EQ(results[0].execution_times.size(), 1u);
    EXPECT_EQ(results[1].status, Status::WA);
    EXPECT_EQ(results[1].error_message,
              "line 1: got:    'hello'\n        expect: 'world'");
    EXPECT_EQ(results[2].status, Status::MISSING);
    EXPECT_EQ(results[2].output, "no expected\n");

    EXPECT_EQ(reporter->started, 3u);
    EXPECT_EQ(reporter->order, (std::vector<std::string>{"1", "2", "3"}));
    EXPECT_TRUE(reporter->finished);
}

TEST_F(TesterTest, Latin1InputIsDecodedBeforeRunning) {
    // .in 是 Latin-1，.out 是 UTF-8
    write_file("test_case/1.in", "caf\xe9\n");
    write_file("test_case/1.out", "caf\xc3\xa9\n");

    auto r = run(TesterOptions());
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.value().size(), 1u);
    EXPECT_EQ(r.value()[0].status, Status::AC);
    EXPECT_EQ(r.value()[0].output, "caf\xc3\xa9\n");
}

TEST_F(TesterTest, Latin1OutputIsDecodedBeforeComparing) {
    target = write_script("latin1.sh", "cat >/dev/null\nprintf 'na\\357ve\\n'");
    write_file("test_case/1.in", "x\n");
    write_file("test_case/1.out", "na\xc3\xafve\n");

    auto r = run(TesterOptions());
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.value().size(), 1u);
    EXPECT_EQ(r.value()[0].status, Status::AC);
    EXPECT_EQ(r.value()[0].output, "na\xc3\xafve\n");
}

TEST_F(TesterTest, ComparisonDisabledAcceptsAnyCleanExit) {
    write_file("test_case/1.in", "abc\n");
    write_file("test_case/1.out", "xyz\n");
    write_file("test_case/2.in", "def\n");

    TesterOptions opt;
    opt.compare_output = false;
    auto r = run(opt);
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.value().size(), 2u);
    EXPECT_EQ(r.value()[0].status, Status::AC);
    EXPECT_EQ(r.value()[1].status, Status::AC);
}

TEST_F(TesterTest, StrictComparisonSeesTrailingWhitespace) {
    write_file("test_case/1.in", "abc  \n");
    write_file("test_case/1.out", "abc\n");

    auto lenient = run(TesterOptions());
    ASSERT_TRUE(lenient.ok());
    EXPECT_EQ(lenient.value()[0].status, Status::AC);

    TesterOptions opt;
    opt.strict_comparison = true;
    auto strict = run(opt);
    ASSERT_TRUE(strict.ok());
    EXPECT_EQ(strict.value()[0].status, Status::WA);
}

TEST_F(TesterTest, RuntimeErrorSkipsComparison) {
    target = write_script("solution.sh", "echo oops >&2\nexit 2");
    write_file("test_case/1.in", "x\n");

    TesterOptions opt;
    opt.repeat = 4;
    auto r = run(opt);
    ASSERT_TRUE(r.ok());
    const CaseResult &c = r.value()[0];
    EXPECT_EQ(c.status, Status::RE);
    EXPECT_EQ(c.error_message, "oops\n");
    EXPECT_EQ(c.execution_times.size(), 1u);
}

TEST_F(TesterTest, TimeLimitExceeded) {
    target = write_script("solution.sh", "sleep 5");
    write_file("test_case/1.in", "");
    write_file("test_case/1.out", "");

    TesterOptions opt;
    opt.time_limit_ms = 200;
    auto r = run(opt);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value()[0].status, Status::TLE);
}

TEST_F(TesterTest, RepeatRecordsAllTimes) {
    write_file("test_case/1.in", "a\n");
    write_file("test_case/1.out", "a\n");

    TesterOptions opt;
    opt.repeat = 3;
    auto r = run(opt);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value()[0].status, Status::AC);
    EXPECT_EQ(r.value()[0].execution_times.size(), 3u);
}

TEST_F(TesterTest, FilterSelectsInDiscoveryOrder) {
    for (const char *name : {"1", "2", "10", "sample"}) {
        write_file(std::string("test_case/") + name + ".in", "x\n");
        write_file(std::string("test_case/") + name + ".out", "x\n");
    }

    TesterOptions opt;
    opt.cases = {parse_token("sample"), parse_token("10"), parse_token("01")};
    auto reporter = std::make_shared<RecordingReporter>();
    auto r = run(opt, reporter);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(reporter->order, (std::vector<std::string>{"1", "10", "sample"}));
}

TEST_F(TesterTest, FilterWithoutMatchesIsNotAnError) {
    write_file("test_case/1.in", "x\n");

    TesterOptions opt;
    opt.cases = {parse_token("99")};
    auto reporter = std::make_shared<RecordingReporter>();
    auto r = run(opt, reporter);
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(r.value().empty());
    EXPECT_TRUE(reporter->filter_empty);
    EXPECT_EQ(reporter->started, 0u);
    EXPECT_FALSE(reporter->finished);
}

TEST_F(TesterTest, CustomCaseDir) {
    write_file("elsewhere/a.in", "q\n");
    write_file("elsewhere/a.out", "q\n");

    TesterOptions opt;
    opt.test_case_dir = (work_dir / "elsewhere").string();
    auto r = run(opt);
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.value().size(), 1u);
    EXPECT_EQ(r.value()[0].case_name, "a");
    EXPECT_EQ(r.value()[0].status, Status::AC);
}

TEST_F(TesterTest, EmbeddedSolutionRunsInsteadOfRecursing) {
    write_file("cases/1.in", "42\n");
    write_file("cases/1.out", "42\n");
    write_file("cases/2.in", "fail\n");

    TesterOptions opt;
    opt.test_case_dir = (work_dir / "cases").string();
    auto tester = OnlineJudgeTester::create("/proc/self/exe", opt, std::make_shared<NullReporter>());
    ASSERT_TRUE(tester.ok());
    auto r = tester.value().run_tests(ojt_test::embedded_solution);
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.value().size(), 2u);

    EXPECT_EQ(r.value()[0].status, Status::AC);
    EXPECT_EQ(r.value()[0].output, "42\n");

    const CaseResult &failed = r.value()[1];
    EXPECT_EQ(failed.status, Status::RE);
    EXPECT_NE(failed.error_message.find("Traceback (most recent call last):"), std::string::npos);
    EXPECT_NE(failed.error_message.find("std::runtime_error: requested failure"), std::string::npos);
}

class ConsoleReporterTest : public ::testing::Test {
protected:
    std::ostringstream out;
};

TEST_F(ConsoleReporterTest, HeaderAndAcceptedLine) {
    ConsoleReporter reporter(out, false, false);
    reporter.on_start("/home/u/sol", 2);

    CaseResult r;
    r.case_name = "1";
    r.status = Status::AC;
    r.execution_times = {12.346};
    reporter.on_result(r);

    std::string sep(40, '-');
    EXPECT_EQ(out.str(),
              "=== Running Tests on sol ===\n"
              "Target: /home/u/sol\n"
              "Cases: 2 selected\n" + sep + "\n"
              "[1] Status: AC | Time: 12.35ms\n" + sep + "\n");
}

TEST_F(ConsoleReporterTest, RepeatedTimesShowAverageAndRange) {
    EXPECT_EQ(format_times({}), "N/A");
    EXPECT_EQ(format_times({1.0, 2.0, 6.0}), "3.00ms (min:1.00, max:6.00)");
}

TEST_F(ConsoleReporterTest, WrongAnswerIsIndented) {
    ConsoleReporter reporter(out, false, false);
    CaseResult r;
    r.case_name = "2";
    r.status = Status::WA;
    r.execution_times = {1.0};
    r.error_message = "line 1: got:    'a'\n        expect: 'b'";
    reporter.on_result(r);

    EXPECT_NE(out.str().find("  [Wrong Answer Info]\n"
                             "    line 1: got:    'a'\n"
                             "            expect: 'b'\n"), std::string::npos);
}

TEST_F(ConsoleReporterTest, MissingShowsRawOutputWhenAsked) {
    CaseResult r;
    r.case_name = "3";
    r.status = Status::MISSING;
    r.output = "out";
    r.error_message = "Missing expected output file 3.out";

    ConsoleReporter quiet(out, false, false);
    quiet.on_result(r);
    EXPECT_NE(out.str().find("  [Info] Missing expected output file 3.out\n"), std::string::npos);
    EXPECT_EQ(out.str().find("Raw Output"), std::string::npos);

    out.str("");
    ConsoleReporter verbose(out, true, false);
    verbose.on_result(r);
    EXPECT_NE(out.str().find("  [Raw Output (Missing .out)]\nout\n  [End Raw Output]\n"),
              std::string::npos);
}

TEST_F(ConsoleReporterTest, FilterWarningAndSummary) {
    ConsoleReporter reporter(out, false, false);
    reporter.on_filter_empty({parse_token("7"), parse_token("big")});
    EXPECT_EQ(out.str(), "[WARNING] No cases matched filter: [7, 'big']\n");

    out.str("");
    std::vector<CaseResult> results(3);
    results[0].status = Status::AC;
    results[1].status = Status::AC;
    results[2].status = Status::TLE;
    reporter.on_finish(results);
    EXPECT_EQ(out.str(), "Summary: 3 case(s), AC 2, TLE 1\n");
}

TEST_F(ConsoleReporterTest, RuntimeErrorAndTimeLimitDetails) {
    ConsoleReporter reporter(out, false, false);
    CaseResult re;
    re.case_name = "4";
    re.status = Status::RE;
    re.execution_times = {3.0};
    re.error_message = "boom";
    reporter.on_result(re);
    EXPECT_NE(out.str().find("[4] Status: RE | Time: 3.00ms\n  [Runtime Error Info]\nboom\n"),
              std::string::npos);

    out.str("");
    CaseResult tle;
    tle.case_name = "5";
    tle.status = Status::TLE;
    tle.execution_times = {1000.0};
    reporter.on_result(tle);
    EXPECT_NE(out.str().find("  [Time Limit Exceeded]\n"), std::string::npos);
}
