#include "test_harness.hpp"
#include "pipeline_tests.hpp"
#include "text_tests.hpp"
#include "alignment_builder_tests.hpp"
#include "alignment_tests.hpp"
#include "keyword_tests.hpp"
#include "dataset_tests.hpp"
#include "batch_tests.hpp"

namespace tests
{
    std::vector<TestResult> results;
    std::string last_error;
} // namespace tests

bool first = true;

void run_tests(const std::string &suite_name, void (*pf_tests)())
{
    if (!first)
        std::cout << '\n';
    else
        first = false;

    std::cout << suite_name << '\n';
    std::cout << std::string(suite_name.length(), '=') << '\n';
    pf_tests();
}

int main()
{
    using namespace tests;

    spdlog::set_level(spdlog::level::err);

    run_tests("Pipelines", run_pipeline_tests);
    run_tests("Texts", run_text_tests);
    run_tests("Alignment builder", run_alignment_builder_tests);
    run_tests("Alignment", run_alignment_tests);
    run_tests("Keywords", run_keyword_tests);
    run_tests("Dataset", run_dataset_tests);
    run_tests("Batch", run_batch_tests);

    int failed = 0;
    for (const auto &result : results)
        if (!result.passed)
            ++failed;
    std::cout << '\n'
              << results.size() - failed << "/" << results.size() << " passed.\n";
    return failed;
}
