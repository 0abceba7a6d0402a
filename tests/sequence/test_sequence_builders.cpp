#include <array>
#include <cstdint>
#include <iostream>
#include <list>
#include <numeric>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "sequential/sequence.hpp"
#include "common/test_check.hpp"

using namespace sequential;

template <typename T, typename R>
concept can_start_after_highest = requires(R& r) { Sequence<T>::start_after_highest(r); };

// Wider or signed elements would be truncated before the maximum is taken
static_assert(can_start_after_highest<std::uint8_t, std::vector<std::uint8_t>>);
static_assert(can_start_after_highest<std::uint8_t, const std::array<std::uint8_t, 2>>);
static_assert(!can_start_after_highest<std::uint8_t, std::vector<std::uint32_t>>);
static_assert(!can_start_after_highest<std::uint8_t, std::vector<int>>);
static_assert(!can_start_after_highest<std::uint32_t, std::vector<std::uint64_t>>);


//
// Test 1: continue_after never lets the given value through.
//
void test_continue_after() {
    Sequence<std::size_t> seq;
    TEST_CHECK(seq.next() == std::size_t{0});
    TEST_CHECK(seq.next() == std::size_t{1});

    seq.continue_after(5);
    TEST_CHECK(seq.next() == std::size_t{6});

    // Only the highest bound matters, lower ones never move backward
    seq.continue_after(15);
    seq.continue_after(7);
    seq.continue_after(0);
    TEST_CHECK(seq.next() == std::size_t{16});

    std::cout << "[OK] test_continue_after" << std::endl;
}

//
// Test 2: with_increment changes the step; continue_after honours it.
//
void test_with_increment() {
    auto seq = Sequence<std::uint8_t>().with_increment(5);
    TEST_CHECK(seq.next() == std::uint8_t{0});
    TEST_CHECK(seq.next() == std::uint8_t{5});
    TEST_CHECK(seq.next() == std::uint8_t{10});

    seq.continue_after(152);
    TEST_CHECK(seq.next() == std::uint8_t{157});
    TEST_CHECK(seq.next() == std::uint8_t{162});

    // 251 + 5 does not fit
    seq.continue_after(251);
    TEST_CHECK(seq.is_exhausted());
    TEST_CHECK(!seq.next().has());

    // The new step applies after the value already pending
    Sequence<std::uint8_t> pending(10, 1);
    TEST_CHECK(pending.next() == std::uint8_t{10});
    auto changed = pending.with_increment(20);
    TEST_CHECK(changed.next() == std::uint8_t{11});
    TEST_CHECK(changed.next() == std::uint8_t{31});
    // original untouched
    TEST_CHECK(pending.next() == std::uint8_t{11});
    TEST_CHECK(pending.step() == 1);

    // Exhausted sequences keep their step
    Sequence<std::uint8_t> done(255, 3);
    (void)done.next();
    TEST_CHECK(done.is_exhausted());
    TEST_CHECK(done.with_increment(9).step() == 3);
    TEST_CHECK(std::move(done).with_increment(9).step() == 3);

    // Rvalue overload: chained temporaries and moved-from sequences keep their position
    auto chained = Sequence<std::uint16_t>(100, 1).with_increment(50).with_increment(25);
    TEST_CHECK(chained.next() == std::uint16_t{100});
    TEST_CHECK(chained.next() == std::uint16_t{125});

    Sequence<std::uint16_t> source(7, 1);
    (void)source.next();
    auto moved = std::move(source).with_increment(10);
    TEST_CHECK(moved.start() == 7);
    TEST_CHECK(moved.next() == std::uint16_t{8});
    TEST_CHECK(moved.next() == std::uint16_t{18});

    std::cout << "[OK] test_with_increment" << std::endl;
}

//
// Test 3: continue_after on a zero-step sequence moves past the value.
//
void test_continue_after_zero_step() {
    auto seq = Sequence<std::uint16_t>::with_step(0);
    TEST_CHECK(seq.next() == std::uint16_t{0});
    seq.continue_after(0);
    TEST_CHECK(seq.next() == std::uint16_t{1});
    TEST_CHECK(seq.next() == std::uint16_t{1});
    TEST_CHECK(!seq.is_exhausted());

    std::cout << "[OK] test_continue_after_zero_step" << std::endl;
}

//
// Test 4: start_after and start_after_highest.
//
void test_start_after() {
    auto seq = Sequence<std::uint32_t>::start_after(41);
    TEST_CHECK(seq.start() == 42);
    TEST_CHECK(seq.next() == std::uint32_t{42});
    TEST_CHECK(seq.next() == std::uint32_t{43});

    // After the maximum nothing can be produced, not even after reset
    auto dead = Sequence<std::uint8_t>::start_after(255);
    TEST_CHECK(!dead.next().has());
    TEST_CHECK(dead.is_exhausted());
    dead.reset();
    TEST_CHECK(!dead.next().has());

    std::vector<std::uint64_t> used{17, 3, 99, 42};
    auto from_vec = Sequence<std::uint64_t>::start_after_highest(used);
    TEST_CHECK(from_vec.next() == std::uint64_t{100});

    std::list<std::uint16_t> from_list{7, 1000, 12};
    TEST_CHECK(Sequence<std::uint16_t>::start_after_highest(from_list).next() == std::uint16_t{1001});

    std::array<std::uint8_t, 3> values{1, 255, 2};
    TEST_CHECK(!Sequence<std::uint8_t>::start_after_highest(values).next().has());

    // The highest value is taken at full width: 300 is not folded to 44
    std::vector<std::uint32_t> wide{300, 5};
    auto after_wide = Sequence<std::uint32_t>::start_after_highest(wide);
    TEST_CHECK(after_wide.next() == std::uint32_t{301});

    std::vector<std::uint32_t> none;
    TEST_CHECK(Sequence<std::uint32_t>::start_after_highest(none).next() == std::uint32_t{1});

    std::cout << "[OK] test_start_after" << std::endl;
}

//
// Test 5: bounded sequences stop at the configured limit.
//
void test_bounded() {
    auto seq = Sequence<std::uint8_t>::bounded(23, 38, 3);
    const std::uint8_t expected[] = {23, 26, 29, 32, 35, 38};
    for (auto e : expected) {
        TEST_CHECK(seq.next() == e);
    }
    TEST_CHECK(!seq.is_exhausted()); // detected on the following call
    TEST_CHECK(!seq.next().has());
    TEST_CHECK(seq.is_exhausted());

    seq.reset();
    TEST_CHECK(seq.next() == std::uint8_t{23});

    // Start above limit: exhausted on first use
    auto empty = Sequence<std::uint32_t>::bounded(10, 5, 1);
    TEST_CHECK(!empty.next().has());
    TEST_CHECK(empty.is_exhausted());

    // fast_forward past the limit is allowed, production then stops
    auto skipped = Sequence<std::uint32_t>::bounded(0, 100, 1);
    TEST_CHECK(skipped.fast_forward(500) == sequence::Error::None);
    TEST_CHECK(!skipped.next().has());

    std::cout << "[OK] test_bounded" << std::endl;
}

//
// Test 6: iteration drives next() until exhaustion.
//
void test_iteration() {
    std::uint8_t sum = 0;
    for (auto v : Sequence<std::uint8_t>::bounded(23, 38, 3)) {
        sum = static_cast<std::uint8_t>(sum + v);
    }
    TEST_CHECK(sum == 183);

    std::vector<std::uint16_t> collected;
    auto seq = Sequence<std::uint16_t>(65530, 2);
    for (auto v : seq) {
        collected.push_back(v);
    }
    TEST_CHECK((collected == std::vector<std::uint16_t>{65530, 65532, 65534}));
    TEST_CHECK(seq.is_exhausted());

    // Iteration consumes: a second loop sees nothing
    std::size_t again = 0;
    for ([[maybe_unused]] auto v : seq) {
        ++again;
    }
    TEST_CHECK(again == 0);

    // begin()/end() share one type, so <numeric> algorithms accept them
    auto summed = Sequence<std::uint8_t>::bounded(23, 38, 3);
    TEST_CHECK(std::accumulate(summed.begin(), summed.end(), 0u) == 183u);
    TEST_CHECK(summed.is_exhausted());
    TEST_CHECK(summed.begin() == summed.end());
    TEST_CHECK(summed.begin() == std::default_sentinel);

    // Partial iteration leaves the rest for next()
    Sequence<std::uint32_t> partial;
    for (auto v : partial) {
        if (v == 4) break;
    }
    TEST_CHECK(partial.next() == std::uint32_t{5});

    std::cout << "[OK] test_iteration" << std::endl;
}

//
// Test 7: diagnostic dump.
//
void test_dump() {
    Sequence<std::uint8_t> seq(10, 2);
    (void)seq.next();
    TEST_CHECK(seq.str() == "Sequence{start=10, current=12, step=2, exhausted=false}");

    auto bounded = Sequence<std::uint32_t>::bounded(1, 9, 4);
    std::ostringstream oss;
    oss << bounded;
    TEST_CHECK(oss.str() == "Sequence{start=1, current=1, step=4, limit=9, exhausted=false}");
    TEST_CHECK(to_string(bounded) == oss.str());
    TEST_CHECK(to_string(seq) == seq.str());

    std::cout << "[OK] test_dump" << std::endl;
}


int main() {
    test_continue_after();
    test_with_increment();
    test_continue_after_zero_step();
    test_start_after();
    test_bounded();
    test_iteration();
    test_dump();
    std::cout << "[TEST] ALL SEQUENCE BUILDER TESTS PASSED!\n";
    return 0;
}
