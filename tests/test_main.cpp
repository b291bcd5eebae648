#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include "log/TaggedLogger.hpp"
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

namespace {

// Prints "[suite] case" and indented subcases as they start.
struct ProgressReporter : doctest::IReporter {
    explicit ProgressReporter(doctest::ContextOptions const&) {}

    void test_case_start(doctest::TestCaseData const& data) override {
        print(std::string{"["} + data.m_test_suite + "] " + data.m_name);
    }
    void subcase_start(doctest::SubcaseSignature const& signature) override {
        print(std::string{"    "} + signature.m_name.c_str());
    }

    void report_query(doctest::QueryData const&) override {}
    void test_run_start() override {}
    void test_run_end(doctest::TestRunStats const&) override {}
    void test_case_reenter(doctest::TestCaseData const&) override {}
    void test_case_end(doctest::CurrentTestCaseStats const&) override {}
    void test_case_exception(doctest::TestCaseException const&) override {}
    void subcase_end() override {}
    void log_assert(doctest::AssertData const&) override {}
    void log_message(doctest::MessageData const&) override {}
    void test_case_skipped(doctest::TestCaseData const&) override {}

private:
    static void print(std::string const& line) {
#ifdef RS_LOG_DEBUG
        std::lock_guard<std::mutex> lock(RS::TaggedLogger::coutMutex);
#endif
        std::cout << line << std::endl;
    }
};

[[maybe_unused]] auto envFlag(char const* name) -> bool {
    char const* value = std::getenv(name);
    return value && std::string_view{value} != "0";
}

} // namespace

REGISTER_LISTENER("progress", 1, ProgressReporter);

int main(int argc, char** argv) {
#ifdef RS_LOG_DEBUG
    RS::set_logging_enabled(false);
#endif

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    if (context.shouldExit())
        return context.run();

#ifdef RS_LOG_DEBUG
    RS::set_thread_name("TestMain");
    // REFSPACE_LOG=1 turns evaluator tracing on for the whole run.
    bool const tracing = envFlag("REFSPACE_LOG");
    if (tracing) {
        RS::set_logging_enabled(true);
        rs_log("Starting test run", "TEST");
    }
#endif

    int const result = context.run();

#ifdef RS_LOG_DEBUG
    if (tracing)
        rs_log(result == 0 ? "All tests passed" : "Some tests failed", "TEST");
#endif
    return result;
}
