#include <catch2/catch_test_macros.hpp>

#include "path/priority_queue.hpp"

#include <map>
#include <vector>

using namespace eldor;
using namespace eldor::path;

TEST_CASE("PriorityQueue dequeues in ascending order", "[priority_queue]") {
    PriorityQueue<int> pq;
    for (int v : {5, 3, 9, 1, 7, 2, 8})
        pq.enqueue(v);

    REQUIRE(pq.size() == 7);
    std::vector<int> out;
    while (!pq.empty())
        out.push_back(pq.dequeue());
    CHECK(out == std::vector<int>{1, 2, 3, 5, 7, 8, 9});
}

TEST_CASE("PriorityQueue ignores duplicate enqueues", "[priority_queue]") {
    PriorityQueue<int> pq;
    pq.enqueue(4);
    pq.enqueue(4);
    pq.enqueue(2);

    CHECK(pq.size() == 2);
    CHECK(pq.contains(4));
    CHECK_FALSE(pq.contains(3));

    pq.clear();
    CHECK(pq.empty());
    CHECK_FALSE(pq.contains(4));
}

namespace {

/// Handles ordered by an external priority table, as the search does.
struct ByPriority {
    const std::map<u32, i32>* priority = nullptr;
    bool operator()(u32 a, u32 b) const {
        return priority->at(a) < priority->at(b);
    }
};

} // namespace

TEST_CASE("PriorityQueue update_priority repositions a handle", "[priority_queue]") {
    std::map<u32, i32> priority = {{10, 50}, {11, 40}, {12, 30}, {13, 20}, {14, 60}};
    PriorityQueue<u32, ByPriority> pq(ByPriority{&priority});
    for (const auto& [id, p] : priority)
        pq.enqueue(id);

    CHECK(pq.peek() == 13);

    priority[14] = 5;
    pq.update_priority(14);
    CHECK(pq.peek() == 14);

    priority[13] = 100;
    pq.update_priority(13);

    std::vector<u32> out;
    while (!pq.empty())
        out.push_back(pq.dequeue());
    CHECK(out == std::vector<u32>{14, 12, 11, 10, 13});
}

TEST_CASE("PriorityQueue update_priority enqueues unknown handles", "[priority_queue]") {
    PriorityQueue<int> pq;
    pq.enqueue(3);
    pq.update_priority(1);
    CHECK(pq.size() == 2);
    CHECK(pq.dequeue() == 1);
}

TEST_CASE("PriorityQueue keeps heap order after interior removals", "[priority_queue]") {
    std::map<u32, i32> priority;
    for (u32 i = 0; i < 32; ++i)
        priority[i] = static_cast<i32>((i * 37) % 101);

    PriorityQueue<u32, ByPriority> pq(ByPriority{&priority});
    for (u32 i = 0; i < 32; ++i)
        pq.enqueue(i);

    // Lower every third handle, the way relaxation does.
    for (u32 i = 0; i < 32; i += 3) {
        priority[i] -= 50;
        pq.update_priority(i);
    }

    i32 last = -1000;
    while (!pq.empty()) {
        u32 id = pq.dequeue();
        CHECK(priority[id] >= last);
        last = priority[id];
    }
}
