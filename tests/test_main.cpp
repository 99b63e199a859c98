#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include "log/TaggedLogger.hpp"

#include <iostream>
#include <mutex>

namespace {

// Prints every test case and subcase as it starts, so a hang names its test
struct TestProgress final : doctest::IReporter {
    explicit TestProgress(doctest::ContextOptions const&) {}

    void test_case_start(doctest::TestCaseData const& in) override {
        std::lock_guard<std::mutex> lock(M2M::TaggedLogger::coutMutex);
        std::cout << "Test: " << in.m_name << std::endl;
    }
    void subcase_start(doctest::SubcaseSignature const& in) override {
        std::lock_guard<std::mutex> lock(M2M::TaggedLogger::coutMutex);
        std::cout << "\tSubcase: " << in.m_name << std::endl;
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
};

} // namespace

REGISTER_LISTENER("test_progress", 1, TestProgress);

int main(int argc, char** argv) {
#ifdef M2M_LOG_DEBUG
    M2M::set_thread_name("TestMain");
#endif
    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
