#include "queue/priority_queue.hpp"
#include "types.hpp"
#include <atomic>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace jobqueue::queue {

using PriorityMap = std::unordered_map<TaskPriority, QueueOptions>;

// Вспомогательная функция для ожидания условия
template <typename Predicate>
void WaitFor(Predicate pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto start = std::chrono::steady_clock::now();
    while (!pred()) {
        if (std::chrono::steady_clock::now() - start > timeout) {
            FAIL() << "Timeout waiting for condition.";
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

namespace {

Task MakeTestTask(const std::string &id, TaskPriority priority) {
    Task task;
    task.id = id;
    task.task_type = "test";
    task.priority = priority;
    return task;
}

PriorityMap AllLanesUnbounded() {
    return {{TaskPriority::High, {false}}, {TaskPriority::Medium, {false}}, {TaskPriority::Low, {false}}};
}

}  // namespace

// Конструктор с разными опциями полос
TEST(PriorityQueueTest, ConstructorWithConfig) {
    EXPECT_NO_THROW(([] {
        PriorityMap config = {{TaskPriority::High, {false}}, {TaskPriority::Medium, {true, 10}}};
        PriorityQueue pq(config);
    })());

    EXPECT_THROW(PriorityQueue(PriorityMap{}), std::invalid_argument);
    EXPECT_THROW(PriorityQueue(PriorityMap{{TaskPriority::Low, {true, std::nullopt}}}), std::invalid_argument);
    EXPECT_THROW(PriorityQueue(PriorityMap{{TaskPriority::Low, {true, 0}}}), std::invalid_argument);
}

// Исключение при отсутствии полосы для приоритета
TEST(PriorityQueueTest, PushNonExistentPriorityThrows) {
    PriorityQueue pq(PriorityMap{{TaskPriority::Medium, {false}}});

    EXPECT_FALSE(pq.has_lane(TaskPriority::High));
    EXPECT_THROW(pq.push(MakeTestTask("a", TaskPriority::High)), std::invalid_argument);
    EXPECT_EQ(pq.size(), 0u);
}

// LOW, HIGH, MEDIUM на входе -> HIGH, MEDIUM, LOW на выходе
TEST(PriorityQueueTest, StrictPriorityOrder) {
    PriorityQueue pq(AllLanesUnbounded());

    ASSERT_EQ(pq.push(MakeTestTask("low", TaskPriority::Low)), EnqueueStatus::Ok);
    ASSERT_EQ(pq.push(MakeTestTask("high", TaskPriority::High)), EnqueueStatus::Ok);
    ASSERT_EQ(pq.push(MakeTestTask("medium", TaskPriority::Medium)), EnqueueStatus::Ok);

    EXPECT_EQ(pq.try_pop()->id, "high");
    EXPECT_EQ(pq.try_pop()->id, "medium");
    EXPECT_EQ(pq.try_pop()->id, "low");
    EXPECT_FALSE(pq.try_pop().has_value());
}

// Внутри одной полосы - FIFO
TEST(PriorityQueueTest, FifoWithinLane) {
    PriorityQueue pq(AllLanesUnbounded());
    for (int i = 0; i < 5; ++i) {
        pq.push(MakeTestTask("m" + std::to_string(i), TaskPriority::Medium));
    }
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(pq.try_pop()->id, "m" + std::to_string(i));
    }
}

// pop_for возвращает пустой результат по истечении ожидания
TEST(PriorityQueueTest, PopForTimesOutWhenEmpty) {
    PriorityQueue pq(AllLanesUnbounded());

    auto start = std::chrono::steady_clock::now();
    auto task = pq.pop_for(std::chrono::milliseconds(50));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(task.has_value());
    EXPECT_GE(elapsed, std::chrono::milliseconds(40));
}

// pop_for просыпается при появлении задачи
TEST(PriorityQueueTest, PopForWakesOnPush) {
    PriorityQueue pq(AllLanesUnbounded());

    std::thread producer([&pq] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        pq.push(MakeTestTask("late", TaskPriority::Low));
    });

    auto task = pq.pop_for(std::chrono::seconds(5));
    producer.join();

    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->id, "late");
}

// Заполненная полоса блокирует продюсера до извлечения
TEST(PriorityQueueTest, FullLaneBlocksProducerUntilPop) {
    PriorityQueue pq(PriorityMap{{TaskPriority::High, {false}}, {TaskPriority::Low, {true, 1}}});
    ASSERT_EQ(pq.push(MakeTestTask("first", TaskPriority::Low)), EnqueueStatus::Ok);

    std::atomic<bool> second_pushed{false};
    std::thread producer([&pq, &second_pushed] {
        EXPECT_EQ(pq.push(MakeTestTask("second", TaskPriority::Low)), EnqueueStatus::Ok);
        second_pushed = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_FALSE(second_pushed.load());

    // Другие полосы продолжают принимать задачи
    EXPECT_EQ(pq.push(MakeTestTask("urgent", TaskPriority::High)), EnqueueStatus::Ok);

    EXPECT_EQ(pq.try_pop()->id, "urgent");
    EXPECT_FALSE(second_pushed.load());
    EXPECT_EQ(pq.try_pop()->id, "first");

    WaitFor([&] { return second_pushed.load(); });
    producer.join();
    EXPECT_EQ(pq.try_pop()->id, "second");
}

// shutdown() будит заблокированного продюсера, задача остаётся у него
TEST(PriorityQueueTest, ShutdownUnblocksWaitingProducer) {
    PriorityQueue pq(PriorityMap{{TaskPriority::Low, {true, 1}}});
    pq.push(MakeTestTask("first", TaskPriority::Low));

    std::atomic<bool> done{false};
    EnqueueStatus status = EnqueueStatus::Ok;
    std::string kept_id;
    std::thread producer([&] {
        Task task = MakeTestTask("second", TaskPriority::Low);
        status = pq.push(std::move(task));
        kept_id = task.id;  // При Shutdown задача не перемещена
        done = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(done.load());

    pq.shutdown();
    WaitFor([&] { return done.load(); });
    producer.join();

    EXPECT_EQ(status, EnqueueStatus::Shutdown);
    EXPECT_EQ(kept_id, "second");
    EXPECT_TRUE(pq.is_shutdown());
    EXPECT_EQ(pq.size(), 1u);
}

// После shutdown новые задачи не принимаются, а оставшиеся не выдаются рабочим потокам
TEST(PriorityQueueTest, ShutdownStopsPushAndPop) {
    PriorityQueue pq(AllLanesUnbounded());
    pq.push(MakeTestTask("queued", TaskPriority::Medium));
    pq.shutdown();

    EXPECT_EQ(pq.push(MakeTestTask("late", TaskPriority::High)), EnqueueStatus::Shutdown);

    // Пустой результат сразу, без ожидания idle_wait
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(pq.pop_for(std::chrono::seconds(5)).has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));

    // Задача осталась на месте и доступна через drain()
    EXPECT_EQ(pq.size(), 1u);
    auto remaining = pq.drain();
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0].id, "queued");
}

// Ожидающий pop_for просыпается при shutdown и ничего не получает
TEST(PriorityQueueTest, ShutdownWakesWaitingConsumer) {
    PriorityQueue pq(AllLanesUnbounded());

    std::atomic<bool> done{false};
    std::thread consumer([&] {
        EXPECT_FALSE(pq.pop_for(std::chrono::seconds(10)).has_value());
        done = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    pq.shutdown();
    WaitFor([&] { return done.load(); });
    consumer.join();
}

// Извлечение по id освобождает место в заполненной полосе
TEST(PriorityQueueTest, ExtractFreesSpace) {
    PriorityQueue pq(PriorityMap{{TaskPriority::Medium, {true, 1}}});
    pq.push(MakeTestTask("a", TaskPriority::Medium));

    std::atomic<bool> pushed{false};
    std::thread producer([&] {
        pq.push(MakeTestTask("b", TaskPriority::Medium));
        pushed = true;
    });

    auto extracted = pq.extract("a");
    ASSERT_TRUE(extracted.has_value());
    EXPECT_EQ(extracted->id, "a");
    EXPECT_FALSE(pq.extract("a").has_value());

    WaitFor([&] { return pushed.load(); });
    producer.join();
    EXPECT_EQ(pq.size(), 1u);
}

TEST(PriorityQueueTest, DrainReturnsTasksInPopOrder) {
    PriorityQueue pq(AllLanesUnbounded());
    pq.push(MakeTestTask("l1", TaskPriority::Low));
    pq.push(MakeTestTask("h1", TaskPriority::High));
    pq.push(MakeTestTask("m1", TaskPriority::Medium));
    pq.push(MakeTestTask("h2", TaskPriority::High));

    auto sizes = pq.lane_sizes();
    EXPECT_EQ(sizes[TaskPriority::High], 2u);
    EXPECT_EQ(sizes[TaskPriority::Medium], 1u);
    EXPECT_EQ(sizes[TaskPriority::Low], 1u);

    auto tasks = pq.drain();
    ASSERT_EQ(tasks.size(), 4u);
    EXPECT_EQ(tasks[0].id, "h1");
    EXPECT_EQ(tasks[1].id, "h2");
    EXPECT_EQ(tasks[2].id, "m1");
    EXPECT_EQ(tasks[3].id, "l1");
    EXPECT_EQ(pq.size(), 0u);
}

// Стресс: несколько продюсеров и потребителей при ограниченных полосах
TEST(PriorityQueueTest, ConcurrentProducersConsumersWithBackpressure) {
    PriorityQueue pq(PriorityMap{
        {TaskPriority::High, {true, 4}}, {TaskPriority::Medium, {true, 4}}, {TaskPriority::Low, {true, 4}}});
    const int kPerProducer = 300;
    const TaskPriority priorities[] = {TaskPriority::High, TaskPriority::Medium, TaskPriority::Low};
    std::atomic<int> consumed{0};

    std::vector<std::thread> producers;
    for (int p = 0; p < 3; ++p) {
        producers.emplace_back([&pq, &priorities, p] {
            for (int i = 0; i < kPerProducer; ++i) {
                pq.push(MakeTestTask(std::to_string(p) + "-" + std::to_string(i), priorities[p]));
            }
        });
    }
    std::vector<std::thread> consumers;
    for (int c = 0; c < 2; ++c) {
        consumers.emplace_back([&pq, &consumed] {
            while (consumed.load() < 3 * kPerProducer) {
                if (pq.pop_for(std::chrono::milliseconds(10)).has_value()) {
                    consumed.fetch_add(1);
                }
            }
        });
    }

    for (auto &t : producers) {
        t.join();
    }
    for (auto &t : consumers) {
        t.join();
    }
    EXPECT_EQ(consumed.load(), 3 * kPerProducer);
    EXPECT_EQ(pq.size(), 0u);
}

// Несколько продюсеров в одну полосу: порядок задач каждого продюсера сохраняется
TEST(PriorityQueueTest, FifoPerProducerWithinSharedLane) {
    PriorityQueue pq(PriorityMap{{TaskPriority::High, {false}}, {TaskPriority::Medium, {true, 8}}});
    const int kProducers = 4;
    const int kPerProducer = 500;

    std::vector<std::string> popped;
    std::thread consumer([&pq, &popped] {
        while (popped.size() < static_cast<size_t>(kProducers * kPerProducer)) {
            if (auto task = pq.pop_for(std::chrono::milliseconds(10))) {
                popped.push_back(task->id);
            }
        }
    });

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&pq, p] {
            for (int seq = 0; seq < kPerProducer; ++seq) {
                pq.push(MakeTestTask(std::to_string(p) + "-" + std::to_string(seq), TaskPriority::Medium));
            }
        });
    }
    for (auto &t : producers) {
        t.join();
    }
    consumer.join();

    // Последний увиденный номер каждого продюсера должен только расти
    std::vector<int> last_seq(kProducers, -1);
    for (const auto &id : popped) {
        const auto dash = id.find('-');
        ASSERT_NE(dash, std::string::npos);
        const int producer = std::stoi(id.substr(0, dash));
        const int seq = std::stoi(id.substr(dash + 1));
        EXPECT_EQ(seq, last_seq[producer] + 1) << "producer " << producer << " out of order";
        last_seq[producer] = seq;
    }
    for (int p = 0; p < kProducers; ++p) {
        EXPECT_EQ(last_seq[p], kPerProducer - 1);
    }
}

}  // namespace jobqueue::queue
