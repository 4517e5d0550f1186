// quarry_tasks Parallel<T> tests

#include <catch2/catch_test_macros.hpp>
#include <quarry/tasks/parallel.hpp>
#include <quarry/tasks/task_pool.hpp>
#include <numeric>
#include <vector>

using namespace quarry_tasks;

TEST_CASE("Parallel keeps one value per thread", "[tasks][parallel]") {
    Parallel<int> counts;

    SECTION("single thread") {
        counts.borrow_local_mut() += 2;
        counts.borrow_local_mut() += 3;
        REQUIRE(counts.size() == 1);

        int total = 0;
        counts.for_each([&](int& v) { total += v; });
        REQUIRE(total == 5);
    }

    SECTION("reduction across a pool") {
        TaskPool pool(TaskPoolConfig{4, "parallel-test"});
        pool.scope([&](Scope& scope) {
            for (int i = 0; i < 64; ++i) {
                scope.spawn([&counts] { counts.borrow_local_mut() += 1; });
            }
        });

        REQUIRE(counts.size() >= 1);
        REQUIRE(counts.size() <= 5);  // workers plus the joining thread

        std::vector<int> values = counts.drain();
        REQUIRE(std::accumulate(values.begin(), values.end(), 0) == 64);
        REQUIRE(counts.size() == 0);
    }
}
