#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include <JuceHeader.h>
#include <cstdlib>
#include <cstring>
#include <iostream>

struct ShowTestStart : public doctest::IReporter {
    ShowTestStart(const doctest::ContextOptions& /* in */) {
    }
    void test_case_start(const doctest::TestCaseData& in) override {
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

/** Swallows juce::Logger output unless MUSICREEL_TEST_LOG is set. */
class QuietLogger : public juce::Logger {
protected:
    void logMessage(const juce::String& message) override {
        if (verbose)
            std::cerr << message << std::endl;
    }

public:
    bool verbose = false;
};

int main(int argc, char** argv) {
    QuietLogger logger;
    if (const char* env = std::getenv("MUSICREEL_TEST_LOG")) {
        if (std::strcmp(env, "0") != 0) logger.verbose = true;
    }
    juce::Logger::setCurrentLogger(&logger);

    doctest::Context context;

    // Apply command line arguments
    context.applyCommandLine(argc, argv);

    int res = context.run();

    juce::Logger::setCurrentLogger(nullptr);
    return res;
}
