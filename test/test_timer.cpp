/* Copyright (C) 2016 J.F.Dockes
 *   This program is free software; you can redistribute it and/or modify
 *   it under the terms of the GNU Lesser General Public License as published by
 *   the Free Software Foundation; either version 2.1 of the License, or
 *   (at your option) any later version.
 *
 *   This program is distributed in the hope that it will be useful,
 *   but WITHOUT ANY WARRANTY; without even the implied warranty of
 *   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *   GNU Lesser General Public License for more details.
 *
 *   You should have received a copy of the GNU Lesser General Public License
 *   along with this program; if not, write to the
 *   Free Software Foundation, Inc.,
 *   51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA.
 */
#include "ThreadPool.h"
#include "TimerThread.h"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

using namespace std;
using namespace std::chrono;

static int failures;

#define CHECK(X) do {                                                   \
        if (!(X)) {                                                     \
            cerr << __FILE__ << ":" << __LINE__ << ": check failed: " #X "\n"; \
            failures++;                                                 \
        }                                                               \
    } while (0)

class CountJobWorker : public JobWorker {
public:
    explicit CountJobWorker(atomic<int> *cnt) : m_cnt(cnt) {}
    void work() override {
        (*m_cnt)++;
    }
    atomic<int> *m_cnt;
};

// Remove the event the dispatcher is waiting for, then check that the
// following ones still fire
static void testRemoveHead()
{
    ThreadPool pool;
    CHECK(pool.start() == 0);
    TimerThread timer(&pool);
    CHECK(timer.status() == 0);

    atomic<int> first{0}, second{0}, third{0};
    int id1, id2, id3;
    CHECK(timer.schedule(milliseconds(400), &id1, make_unique<CountJobWorker>(&first)) == 0);
    CHECK(timer.schedule(milliseconds(600), &id2, make_unique<CountJobWorker>(&second)) == 0);
    this_thread::sleep_for(milliseconds(100));
    CHECK(timer.remove(id1) == 0);
    CHECK(timer.remove(id1) == -1);

    // Now at the head, removed too
    CHECK(timer.schedule(milliseconds(100), &id3, make_unique<CountJobWorker>(&third)) == 0);
    CHECK(timer.remove(id3) == 0);

    this_thread::sleep_for(milliseconds(900));
    CHECK(first == 0);
    CHECK(second == 1);
    CHECK(third == 0);
    // Already dispatched
    CHECK(timer.remove(id2) == -1);

    timer.shutdown();
    pool.shutdown();
}

static void testShutdown()
{
    ThreadPool pool;
    CHECK(pool.start() == 0);
    TimerThread timer(&pool);
    atomic<int> cnt{0};
    CHECK(timer.schedule(milliseconds(200), nullptr, make_unique<CountJobWorker>(&cnt)) == 0);
    timer.shutdown();
    CHECK(timer.status() == NPSSDP_TP_SHUTDOWN);
    CHECK(timer.schedule(milliseconds(10), nullptr, make_unique<CountJobWorker>(&cnt)) ==
          NPSSDP_TP_SHUTDOWN);
    // Distinct from the system errno values
    CHECK(NPSSDP_TP_SHUTDOWN != ESHUTDOWN);
    CHECK(NPSSDP_TP_SHUTDOWN < 0);
    this_thread::sleep_for(milliseconds(300));
    CHECK(cnt == 0);
    pool.shutdown();

    TimerThread notimer(nullptr);
    CHECK(notimer.status() == NPSSDP_TP_SHUTDOWN);
}

int main(int, char **)
{
    testRemoveHead();
    testShutdown();
    if (failures) {
        cerr << failures << " failure(s)\n";
        return 1;
    }
    cout << "test_timer: ok\n";
    return 0;
}
