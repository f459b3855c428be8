// Unit tests for the bounded queue between pipeline stages
// Compile: g++ -std=c++20 -I../include -pthread -o test_bounded_queue test_bounded_queue.cpp

#include "nanocollapse/bounded_queue.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <optional>
#include <thread>
#include <vector>

using nanocollapse::BoundedQueue;

void test_fifo_order() {
    std::cout << "Testing FIFO order... ";
    BoundedQueue<int> q(8);
    for (int i = 0; i < 5; ++i) {
        int v = i;
        assert(q.push(std::move(v)));
    }
    assert(q.size() == 5);
    for (int i = 0; i < 5; ++i) {
        int v = -1;
        assert(q.pop(v));
        assert(v == i);
    }
    assert(q.size() == 0);
    std::cout << "PASSED\n";
}

void test_zero_capacity_clamped() {
    std::cout << "Testing zero capacity clamps to one... ";
    BoundedQueue<int> q(0);
    assert(q.capacity() == 1);
    std::cout << "PASSED\n";
}

void test_push_blocks_when_full() {
    std::cout << "Testing push blocks while full... ";
    BoundedQueue<int> q(1);
    int first = 1;
    assert(q.push(std::move(first)));

    std::atomic<bool> pushed{false};
    std::thread producer([&] {
        int second = 2;
        assert(q.push(std::move(second)));
        pushed = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    assert(!pushed);
    assert(q.size() == 1);

    int v = 0;
    assert(q.pop(v) && v == 1);
    producer.join();
    assert(pushed);
    assert(q.pop(v) && v == 2);
    std::cout << "PASSED\n";
}

void test_close_wakes_blocked_callers() {
    std::cout << "Testing close wakes blocked push and pop... ";
    BoundedQueue<int> empty(4);
    std::atomic<int> pop_result{-1};
    std::thread consumer([&] {
        int v = 0;
        pop_result = empty.pop(v) ? 1 : 0;
    });

    BoundedQueue<int> full(1);
    int x = 7;
    assert(full.push(std::move(x)));
    std::atomic<int> push_result{-1};
    std::thread producer([&] {
        int y = 8;
        push_result = full.push(std::move(y)) ? 1 : 0;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    empty.close();
    full.close();
    consumer.join();
    producer.join();

    assert(pop_result == 0);
    assert(push_result == 0);
    assert(full.closed());
    assert(full.size() == 0);  // queued items are dropped

    int z = 9;
    assert(!full.push(std::move(z)));
    std::cout << "PASSED\n";
}

void test_end_markers_through_optional() {
    std::cout << "Testing end markers with several consumers... ";
    const int n_consumers = 3;
    const int n_items = 3000;
    BoundedQueue<std::optional<int>> q(4);

    std::atomic<long> sum{0};
    std::atomic<int> consumed{0};
    std::vector<std::thread> consumers;
    for (int c = 0; c < n_consumers; ++c) {
        consumers.emplace_back([&] {
            std::optional<int> item;
            while (q.pop(item)) {
                if (!item) break;
                sum += *item;
                ++consumed;
            }
        });
    }

    for (int i = 1; i <= n_items; ++i) {
        assert(q.push(std::optional<int>(i)));
    }
    for (int c = 0; c < n_consumers; ++c) {
        assert(q.push(std::optional<int>()));
    }
    for (auto& t : consumers) t.join();

    assert(consumed == n_items);
    assert(sum == static_cast<long>(n_items) * (n_items + 1) / 2);
    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n=== Bounded Queue Tests ===\n\n";
    test_fifo_order();
    test_zero_capacity_clamped();
    test_push_blocks_when_full();
    test_close_wakes_blocked_callers();
    test_end_markers_through_optional();
    std::cout << "\nAll tests passed!\n";
    return 0;
}
