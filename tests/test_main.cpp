#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include "log/TaggedLogger.hpp"
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>

struct ShowTestStart : public doctest::IReporter {
    ShowTestStart(const doctest::ContextOptions& /* in */) {
    }
    void test_case_start(const doctest::TestCaseData& in) override {
        std::lock_guard<std::mutex> lock(CT::TaggedLogger::coutMutex);
        std::cout << "Test: " << in.m_name << std::endl;
    }
    void report_query(const doctest::QueryData&) override {
    }
    void test_run_start() override {
    }
    void test_run_end(const doctest::TestRunStats&) override {
    }
    void test_case_reenter(const doctest::TestCaseData&) override {
    }
    void test_case_end(const doctest::CurrentTestCaseStats&) override {
    }
    void test_case_exception(const doctest::TestCaseException&) override {
    }
    void subcase_start(const doctest::SubcaseSignature& in) override {
        std::lock_guard<std::mutex> lock(CT::TaggedLogger::coutMutex);
        std::cout << "\tSubcase: " << in.m_name << std::endl;
    }
    void subcase_end() override {
    }
    void log_assert(const doctest::AssertData&) override {
    }
    void log_message(const doctest::MessageData&) override {
    }
    void test_case_skipped(const doctest::TestCaseData&) override {
    }
};

REGISTER_LISTENER("test_start", 1, ShowTestStart);

int main(int argc, char** argv) {
    // Rows rejected on purpose would otherwise flood the output.
    CT::set_logging_enabled(false);

    doctest::Context context;
    context.applyCommandLine(argc, argv);

    if (context.shouldExit()) {
        return context.run();
    }

    // CASETREE_LOG=debug|info|warning|error turns the run log back on.
    if (const char* env_log = std::getenv("CASETREE_LOG")) {
        if (std::strcmp(env_log, "0") != 0) {
            CT::set_logging_enabled(true);
            if (auto level = CT::logLevelFromString(env_log)) {
                CT::set_log_level(*level);
            }
            ct_log("Starting test execution", "TEST", "INFO");
        }
    }

    int res = context.run();

    if (res == 0) {
        ct_log("All tests passed successfully", "TEST", "INFO");
    } else {
        ct_log("Some tests failed", "TEST", "ERROR");
    }

    return res;
}
