#include <Forerunner/parallel/shared_cursor.hxx>
#include <StormByte/test_handlers.h>

#include <algorithm>
#include <iostream>
#include <list>
#include <memory>
#include <mutex>
#include <ranges>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

using Forerunner::Parallel::SharedCursor;

int test_shared_cursor_claims_in_order() {
    std::vector<int> source { 1, 2, 3 };
    SharedCursor<std::vector<int>&> cursor(source);

    auto a = cursor.Claim();
    auto b = cursor.Claim();
    auto c = cursor.Claim();
    ASSERT_EQUAL("first", *a, 1);
    ASSERT_EQUAL("second", *b, 2);
    ASSERT_EQUAL("third", *c, 3);
    ASSERT_EQUAL("claimed", cursor.Claimed(), static_cast<std::size_t>(3));
    ASSERT_FALSE("not yet known exhausted", cursor.Exhausted());
    RETURN_TEST("test_shared_cursor_claims_in_order", 0);
}

int test_shared_cursor_exhaustion_is_sticky() {
    std::vector<int> source { 7 };
    SharedCursor<std::vector<int>&> cursor(source);

    cursor.Claim();
    ASSERT_FALSE("end reached", cursor.Claim().has_value());
    ASSERT_TRUE("exhausted", cursor.Exhausted());

    // Items appended later are never handed out
    source.push_back(8);
    ASSERT_FALSE("still exhausted", cursor.Claim().has_value());
    ASSERT_EQUAL("claimed unchanged", cursor.Claimed(), static_cast<std::size_t>(1));
    RETURN_TEST("test_shared_cursor_exhaustion_is_sticky", 0);
}

int test_shared_cursor_empty_source() {
    std::list<std::string> source;
    SharedCursor<std::list<std::string>&> cursor(source);
    ASSERT_FALSE("nothing to claim", cursor.Claim().has_value());
    ASSERT_TRUE("exhausted", cursor.Exhausted());
    ASSERT_EQUAL("claimed", cursor.Claimed(), static_cast<std::size_t>(0));
    RETURN_TEST("test_shared_cursor_empty_source", 0);
}

int test_shared_cursor_owns_rvalue_range() {
    SharedCursor<std::vector<std::string>> cursor(std::vector<std::string>{ "alpha", "beta" });
    auto a = cursor.Claim();
    auto b = cursor.Claim();
    ASSERT_EQUAL("first owned", *a, std::string("alpha"));
    ASSERT_EQUAL("second owned", *b, std::string("beta"));
    ASSERT_FALSE("end", cursor.Claim().has_value());
    RETURN_TEST("test_shared_cursor_owns_rvalue_range", 0);
}

int test_shared_cursor_unbounded_source() {
    auto naturals = std::views::iota(0);
    SharedCursor<decltype(naturals)&> cursor(naturals);
    for (int i = 0; i < 1000; ++i) cursor.Claim();
    auto next = cursor.Claim();
    ASSERT_EQUAL("keeps counting", *next, 1000);
    ASSERT_FALSE("never exhausted", cursor.Exhausted());
    RETURN_TEST("test_shared_cursor_unbounded_source", 0);
}

int test_shared_cursor_stop_token_refuses_claims() {
    std::vector<int> source { 1, 2, 3 };
    SharedCursor<std::vector<int>&> cursor(source);
    std::stop_source stop;

    ASSERT_TRUE("claim before stop", cursor.Claim(stop.get_token()).has_value());
    stop.request_stop();
    ASSERT_FALSE("claim after stop", cursor.Claim(stop.get_token()).has_value());
    ASSERT_FALSE("stop is not exhaustion", cursor.Exhausted());
    ASSERT_EQUAL("claimed", cursor.Claimed(), static_cast<std::size_t>(1));
    RETURN_TEST("test_shared_cursor_stop_token_refuses_claims", 0);
}

int test_shared_cursor_concurrent_claims_are_unique() {
    const int total = 5000;
    auto source = std::views::iota(0, total);
    SharedCursor<decltype(source)&> cursor(source);

    std::mutex mutex;
    std::vector<int> claimed;
    std::vector<std::thread> threads;
    for (int t = 0; t < 6; ++t) {
        threads.emplace_back([&]() -> void {
            std::vector<int> local;
            while (auto item = cursor.Claim()) local.push_back(*item);
            std::scoped_lock<std::mutex> lock(mutex);
            claimed.insert(claimed.end(), local.begin(), local.end());
        });
    }
    for (auto& t : threads) t.join();

    std::sort(claimed.begin(), claimed.end());
    bool all_once = static_cast<int>(claimed.size()) == total;
    for (int i = 0; all_once && i < total; ++i)
        all_once = claimed[i] == i;

    ASSERT_TRUE("every item claimed exactly once", all_once);
    ASSERT_EQUAL("claimed counter", cursor.Claimed(), static_cast<std::size_t>(total));
    ASSERT_TRUE("exhausted", cursor.Exhausted());
    RETURN_TEST("test_shared_cursor_concurrent_claims_are_unique", 0);
}

int test_shared_cursor_moves_owned_items() {
    std::vector<std::unique_ptr<int>> items;
    items.push_back(std::make_unique<int>(1));
    items.push_back(std::make_unique<int>(2));
    SharedCursor<std::vector<std::unique_ptr<int>>> cursor(std::move(items));

    auto first = cursor.Claim();
    auto second = cursor.Claim();
    ASSERT_TRUE("first moved out", first.has_value() && *first != nullptr);
    ASSERT_TRUE("second moved out", second.has_value() && *second != nullptr);
    ASSERT_EQUAL("first value", **first, 1);
    ASSERT_EQUAL("second value", **second, 2);
    RETURN_TEST("test_shared_cursor_moves_owned_items", 0);
}

int test_shared_cursor_copies_borrowed_items() {
    std::vector<std::string> names { "left", "right" };
    SharedCursor<std::vector<std::string>&> cursor(names);
    auto first = cursor.Claim();

    ASSERT_EQUAL("claimed copy", *first, std::string("left"));
    ASSERT_EQUAL("borrowed source untouched", names[0], std::string("left"));
    RETURN_TEST("test_shared_cursor_copies_borrowed_items", 0);
}

int test_shared_cursor_steps_past_unreadable_item() {
    auto source = std::views::iota(1, 5) | std::views::transform([](int x) {
        if (x == 2) throw std::runtime_error("unreadable");
        return x;
    });
    SharedCursor<decltype(source)&> cursor(source);

    auto first = cursor.Claim();
    bool thrown = false;
    try {
        cursor.Claim();
    }
    catch (const std::runtime_error&) {
        thrown = true;
    }
    auto third = cursor.Claim();

    ASSERT_EQUAL("first readable", *first, 1);
    ASSERT_TRUE("read error reaches the caller", thrown);
    ASSERT_EQUAL("next claim skips the bad item", *third, 3);
    ASSERT_EQUAL("bad item counted", cursor.Claimed(), static_cast<std::size_t>(3));
    ASSERT_FALSE("not exhausted", cursor.Exhausted());
    RETURN_TEST("test_shared_cursor_steps_past_unreadable_item", 0);
}

int main() {
    int result = 0;
    result += test_shared_cursor_claims_in_order();
    result += test_shared_cursor_exhaustion_is_sticky();
    result += test_shared_cursor_empty_source();
    result += test_shared_cursor_owns_rvalue_range();
    result += test_shared_cursor_unbounded_source();
    result += test_shared_cursor_stop_token_refuses_claims();
    result += test_shared_cursor_concurrent_claims_are_unique();
    result += test_shared_cursor_moves_owned_items();
    result += test_shared_cursor_copies_borrowed_items();
    result += test_shared_cursor_steps_past_unreadable_item();

    if (result == 0) {
        std::cout << "SharedCursor tests passed!" << std::endl;
    } else {
        std::cout << result << " SharedCursor tests failed." << std::endl;
    }
    return result;
}
