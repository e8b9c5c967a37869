#include "dead_letter/dead_letter_sink.hpp"
#include <gtest/gtest.h>
#include <string>

namespace jobqueue::dead_letter {

namespace {

Task FailedTask(const std::string &type, int retry_count) {
    Task task = MakeTask(type, std::string("payload"), TaskPriority::Low, 3);
    task.retry_count = retry_count;
    task.last_error = "boom";
    return task;
}

}  // namespace

// Записи хранятся в порядке поступления вместе с причиной и временем
TEST(DeadLetterSinkTest, AddKeepsArrivalOrderAndReason) {
    DeadLetterSink sink;
    const auto before = std::chrono::system_clock::now();
    Task first = FailedTask("charge", 4);
    Task second = FailedTask("notify", 1);
    const std::string first_id = first.id;
    const std::string second_id = second.id;

    sink.add(std::move(first), "max retries exceeded");
    sink.add(std::move(second), "invalid payload");

    auto records = sink.list();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].task.id, first_id);
    EXPECT_EQ(records[0].reason, "max retries exceeded");
    EXPECT_EQ(records[0].task.retry_count, 4);
    EXPECT_GE(records[0].dead_lettered_at, before);
    EXPECT_EQ(records[1].task.id, second_id);
    EXPECT_EQ(std::any_cast<std::string>(records[1].task.payload), "payload");
}

// list() - снимок: повторный вызов видит те же записи, хранилище не меняется
TEST(DeadLetterSinkTest, ListIsRestartable) {
    DeadLetterSink sink;
    sink.add(FailedTask("charge", 4), "max retries exceeded");

    EXPECT_EQ(sink.list().size(), 1u);
    EXPECT_EQ(sink.list().size(), 1u);
    EXPECT_EQ(sink.size(), 1u);
}

TEST(DeadLetterSinkTest, TakeAndRestore) {
    DeadLetterSink sink;
    Task task = FailedTask("charge", 4);
    const std::string id = task.id;
    sink.add(std::move(task), "max retries exceeded");

    EXPECT_FALSE(sink.take("unknown").has_value());
    auto record = sink.take(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(sink.size(), 0u);

    sink.restore(std::move(*record));
    ASSERT_EQ(sink.size(), 1u);
    EXPECT_EQ(sink.list()[0].task.id, id);
}

TEST(DeadLetterSinkTest, DrainEmptiesSink) {
    DeadLetterSink sink;
    sink.add(FailedTask("a", 1), "x");
    sink.add(FailedTask("b", 1), "y");

    auto records = sink.drain();
    EXPECT_EQ(records.size(), 2u);
    EXPECT_EQ(sink.size(), 0u);
    EXPECT_TRUE(sink.list().empty());
}

}  // namespace jobqueue::dead_letter
